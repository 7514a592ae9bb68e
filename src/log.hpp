// SPDX-License-Identifier: MIT

// src/log.hpp
#pragma once

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace wme_pipe {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Process-wide threshold; messages below it are dropped. Defaults to Warn.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

/// Writes "[wme_pipe] LEVEL message\n" to stderr.
void WriteLogLine(LogLevel level, std::string_view message);

template <typename... Args>
void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level < GetLogLevel()) return;
    WriteLogLine(level, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace wme_pipe

#define WME_LOG_ERROR(...) ::wme_pipe::Log(::wme_pipe::LogLevel::Error, __VA_ARGS__)
#define WME_LOG_WARN(...) ::wme_pipe::Log(::wme_pipe::LogLevel::Warn, __VA_ARGS__)
#define WME_LOG_INFO(...) ::wme_pipe::Log(::wme_pipe::LogLevel::Info, __VA_ARGS__)

// State-transition tracing, compiled out unless asked for
#ifdef WME_ENABLE_DEBUG_LOG
#define WME_LOG_DEBUG(...) ::wme_pipe::Log(::wme_pipe::LogLevel::Debug, __VA_ARGS__)
#else
#define WME_LOG_DEBUG(...) do {} while (0)
#endif
