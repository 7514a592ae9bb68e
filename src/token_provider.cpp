// SPDX-License-Identifier: MIT

// src/token_provider.cpp
#include "src/token_provider.hpp"

#include <utility>

#include "src/log.hpp"

namespace wme_pipe {

std::expected<std::string, Error> StaticTokenProvider::GetValidToken() {
    if (token_.empty()) {
        return std::unexpected(Error{ErrorCode::AuthFailed, "no access token configured"});
    }
    return token_;
}

void TokenCell::Publish(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(token);
}

void TokenCell::PublishError(Error e) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::unexpected(std::move(e));
}

void TokenCell::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    value_.reset();
}

std::expected<std::string, Error> TokenCell::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!value_) {
        return std::unexpected(Error{ErrorCode::AuthFailed, "no token published yet"});
    }
    return *value_;
}

TokenRefresher::TokenRefresher(IEventLoop& loop, std::shared_ptr<TokenCell> cell,
                               RefreshFn refresh, std::chrono::milliseconds interval)
    : cell_(std::move(cell)),
      refresh_(std::move(refresh)),
      interval_(interval),
      timer_(loop) {
    timer_.OnTimer([this]() { RefreshNow(); });
}

void TokenRefresher::Start() {
    timer_.Start(std::chrono::milliseconds{0}, interval_);
}

void TokenRefresher::Stop() { timer_.Stop(); }

void TokenRefresher::RefreshNow() {
    ++refreshes_;
    auto token = refresh_();
    if (token) {
        cell_->Publish(std::move(*token));
        have_token_ = true;
        return;
    }
    Error e = token.error();
    if (e.code != ErrorCode::AuthFailed) {
        e = Error{ErrorCode::AuthFailed, "token refresh failed: " + e.message};
    }
    WME_LOG_WARN("{}", e.message);
    if (!have_token_) cell_->PublishError(std::move(e));
}

}  // namespace wme_pipe
