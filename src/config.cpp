// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace wme_pipe {

namespace {

std::optional<std::string_view> Env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string_view(v);
}

template <typename T>
std::expected<T, Error> ParseNumber(const char* name, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(Error{ErrorCode::ValidationError,
            fmt::format("{}: not a number: '{}'", name, text)});
    }
    return value;
}

bool IsHttpsBase(std::string_view url) {
    return url.starts_with("https://") && url.ends_with("/");
}

}  // namespace

std::expected<ClientConfig, Error> ClientConfig::FromEnvironment() {
    ClientConfig config;
    if (auto v = Env("WME_BASE_URL")) config.base_url = std::string(*v);
    if (auto v = Env("WME_REALTIME_URL")) config.realtime_url = std::string(*v);
    if (auto v = Env("WME_USER_AGENT")) config.user_agent = std::string(*v);

    if (auto v = Env("WME_RATE_LIMIT")) {
        auto rate = ParseNumber<double>("WME_RATE_LIMIT", *v);
        if (!rate) return std::unexpected(rate.error());
        config.rate_limit_per_second = *rate;
    }
    if (auto v = Env("WME_CHUNK_SIZE")) {
        auto size = ParseNumber<uint64_t>("WME_CHUNK_SIZE", *v);
        if (!size) return std::unexpected(size.error());
        config.download_chunk_size = *size;
    }
    if (auto v = Env("WME_CONCURRENCY")) {
        auto n = ParseNumber<uint32_t>("WME_CONCURRENCY", *v);
        if (!n) return std::unexpected(n.error());
        config.download_concurrency = *n;
    }

    if (auto valid = config.Validate(); !valid) return std::unexpected(valid.error());
    return config;
}

std::expected<void, Error> ClientConfig::Validate() const {
    auto fail = [](std::string msg) -> std::expected<void, Error> {
        return std::unexpected(Error{ErrorCode::ValidationError, std::move(msg)});
    };

    if (!IsHttpsBase(base_url)) {
        return fail(fmt::format("base_url must be https and end with '/': {}", base_url));
    }
    if (!IsHttpsBase(realtime_url)) {
        return fail(fmt::format("realtime_url must be https and end with '/': {}", realtime_url));
    }
    if (user_agent.empty()) return fail("user_agent is empty");
    if (timeout.count() <= 0) return fail("timeout must be positive");
    if (rate_limit_per_second < 0.0) return fail("rate_limit_per_second is negative");
    if (rate_limit_burst == 0) return fail("rate_limit_burst must be at least 1");
    if (download_concurrency == 0) return fail("download_concurrency must be at least 1");
    if (max_line_size == 0) return fail("max_line_size must be positive");

    for (const RetryConfig* r : {&retry, &download_retry, &stream_retry}) {
        if (r->backoff_multiplier < 1.0) return fail("backoff_multiplier must be >= 1");
        if (r->jitter_factor < 0.0 || r->jitter_factor >= 1.0) {
            return fail("jitter_factor must be in [0, 1)");
        }
        if (r->initial_delay > r->max_delay) return fail("initial_delay exceeds max_delay");
    }
    return {};
}

}  // namespace wme_pipe
