// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

#include "lib/stream/error.hpp"
#include "src/retry_policy.hpp"

namespace wme_pipe {

struct ClientConfig {
    std::string user_agent = "wme-pipe";
    std::string base_url = "https://api.enterprise.wikimedia.com/";
    std::string realtime_url = "https://realtime.enterprise.wikimedia.com/";
    std::chrono::milliseconds timeout{30000};   ///< Idle read timeout per exchange

    double rate_limit_per_second = 0.0;         ///< 0 = unlimited
    uint32_t rate_limit_burst = 1;

    uint64_t download_chunk_size = 0;           ///< 0 = one range per resource
    uint32_t download_concurrency = 10;
    size_t max_line_size = 20 * 1024 * 1024;

    RetryConfig retry = RetryConfig::ApiDefaults();
    RetryConfig download_retry = RetryConfig::DownloadDefaults();
    RetryConfig stream_retry = RetryConfig::StreamDefaults();

    /// Defaults overlaid with WME_BASE_URL, WME_REALTIME_URL, WME_USER_AGENT,
    /// WME_RATE_LIMIT, WME_CHUNK_SIZE and WME_CONCURRENCY where set.
    static std::expected<ClientConfig, Error> FromEnvironment();

    std::expected<void, Error> Validate() const;
};

}  // namespace wme_pipe
