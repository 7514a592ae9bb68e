// SPDX-License-Identifier: MIT

// src/response_handlers.hpp
#pragma once

#include <charconv>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/http_client.hpp"
#include "src/http_fetcher.hpp"
#include "src/resource.hpp"

namespace wme_pipe {

/// Extract size, validators and range support from a response head.
inline ResourceInfo ResourceInfoFromHead(const HttpResponseHead& head) {
    ResourceInfo info;
    info.content_length = head.ContentLength();
    if (auto etag = head.Header("etag")) {
        std::string_view v = *etag;
        if (v.starts_with("W/")) v.remove_prefix(2);
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
            v = v.substr(1, v.size() - 2);
        }
        info.etag = std::string(v);
    }
    if (auto ct = head.Header("content-type")) info.content_type = std::string(*ct);
    if (auto ar = head.Header("accept-ranges")) info.accept_ranges = (*ar == "bytes");
    if (auto lm = head.Header("last-modified")) info.last_modified = std::string(*lm);
    return info;
}

/// Parse the first offset of "bytes START-END/TOTAL".
inline std::optional<uint64_t> ContentRangeStart(std::string_view value) {
    constexpr std::string_view kPrefix = "bytes ";
    if (!value.starts_with(kPrefix)) return std::nullopt;
    value.remove_prefix(kPrefix.size());
    uint64_t start = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), start);
    if (ec != std::errc{} || ptr == value.data() + value.size() || *ptr != '-') {
        return std::nullopt;
    }
    return start;
}

struct BufferedResponse {
    HttpResponseHead head;
    std::string body;
};

/// Collects a whole response in memory; for small JSON replies and HEAD.
class BufferedResponseHandler : public IResponseHandler {
public:
    using Callback = std::function<void(std::expected<BufferedResponse, Error>)>;

    BufferedResponseHandler(Callback on_complete, size_t max_body)
        : on_complete_(std::move(on_complete)), max_body_(max_body) {}

    void OnHead(const HttpResponseHead& head) override { response_.head = head; }

    void OnBody(BufferChain& body) override {
        if (failed_) {
            body.Consume(body.Size());
            return;
        }
        if (response_.body.size() + body.Size() > max_body_) {
            failed_ = true;
            body.Consume(body.Size());
            Complete(std::unexpected(Error{ErrorCode::BufferOverflow,
                fmt::format("response body exceeds {} bytes", max_body_)}));
            return;
        }
        body.CopyTo(0, body.Size(), response_.body);
        body.Consume(body.Size());
    }

    void OnError(const Error& e) override { Complete(std::unexpected(e)); }

    void OnDone() override { Complete(std::move(response_)); }

private:
    void Complete(std::expected<BufferedResponse, Error> result) {
        if (auto cb = std::exchange(on_complete_, nullptr)) cb(std::move(result));
    }

    Callback on_complete_;
    size_t max_body_;
    BufferedResponse response_;
    bool failed_ = false;
};

}  // namespace wme_pipe
