// SPDX-License-Identifier: MIT

// src/token_provider.hpp
#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"

namespace wme_pipe {

/// Supplies the bearer token attached to every request. A failure is
/// ErrorCode::AuthFailed and is never retried.
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;
    virtual std::expected<std::string, Error> GetValidToken() = 0;
};

class StaticTokenProvider : public ITokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}

    std::expected<std::string, Error> GetValidToken() override;

private:
    std::string token_;
};

/// Thread-safe single slot holding the current token or the last refresh error.
class TokenCell {
public:
    void Publish(std::string token);
    void PublishError(Error e);
    void Clear();

    std::expected<std::string, Error> Get() const;

private:
    mutable std::mutex mutex_;
    std::optional<std::expected<std::string, Error>> value_;
};

/// Reads the current token from a TokenCell.
class CellTokenProvider : public ITokenProvider {
public:
    explicit CellTokenProvider(std::shared_ptr<const TokenCell> cell) : cell_(std::move(cell)) {}

    std::expected<std::string, Error> GetValidToken() override { return cell_->Get(); }

private:
    std::shared_ptr<const TokenCell> cell_;
};

/// Periodic task that refreshes the token and publishes it into a TokenCell.
///
/// The refresh function is the caller's login/refresh call. A failed refresh
/// keeps a previously published token until it is replaced; with none
/// published the error is stored instead.
class TokenRefresher {
public:
    using RefreshFn = std::function<std::expected<std::string, Error>()>;

    TokenRefresher(IEventLoop& loop, std::shared_ptr<TokenCell> cell, RefreshFn refresh,
                   std::chrono::milliseconds interval);

    TokenRefresher(const TokenRefresher&) = delete;
    TokenRefresher& operator=(const TokenRefresher&) = delete;

    /// Refresh now, then every interval.
    void Start();
    void Stop();
    void RefreshNow();

    uint64_t Refreshes() const { return refreshes_; }

private:
    std::shared_ptr<TokenCell> cell_;
    RefreshFn refresh_;
    std::chrono::milliseconds interval_;
    Timer timer_;
    bool have_token_ = false;
    uint64_t refreshes_ = 0;
};

}  // namespace wme_pipe
