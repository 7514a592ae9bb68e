// SPDX-License-Identifier: MIT

// src/log.cpp
#include "src/log.hpp"

#include <atomic>

namespace wme_pipe {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};

constexpr std::string_view LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: break;
    }
    return "";
}

}  // namespace

void SetLogLevel(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel GetLogLevel() { return g_level.load(std::memory_order_relaxed); }

void WriteLogLine(LogLevel level, std::string_view message) {
    fmt::print(stderr, "[wme_pipe] {} {}\n", LevelName(level), message);
}

}  // namespace wme_pipe
