// SPDX-License-Identifier: MIT

// lib/stream/http_response.hpp
#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace wme_pipe {

namespace http_detail {

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace http_detail

/// Status line and headers of a successful response, in arrival order.
struct HttpResponseHead {
    int status = 0;
    std::vector<std::pair<std::string, std::string>> headers;

    /// First header called @p name, compared without regard to case.
    std::optional<std::string_view> Header(std::string_view name) const {
        auto it = std::find_if(headers.begin(), headers.end(), [name](const auto& h) {
            return http_detail::EqualsIgnoreCase(h.first, name);
        });
        if (it == headers.end()) return std::nullopt;
        return std::string_view{it->second};
    }

    std::optional<uint64_t> ContentLength() const {
        auto text = Header("content-length");
        if (!text || text->empty()) return std::nullopt;
        uint64_t length = 0;
        const char* end = text->data() + text->size();
        auto [ptr, ec] = std::from_chars(text->data(), end, length);
        if (ec != std::errc{} || ptr != end) return std::nullopt;
        return length;
    }
};

// A downstream that is shown the head of a 2xx response before its body
template <typename D>
concept HeadAwareDownstream = requires(D& d, const HttpResponseHead& head) {
    { d.OnHead(head) } -> std::same_as<void>;
};

constexpr ErrorCode StatusToErrorCode(int status) {
    switch (status) {
        case 401:
        case 403:
            return ErrorCode::Unauthorized;
        case 404:
            return ErrorCode::NotFound;
        case 416:
            return ErrorCode::RangeNotSatisfiable;
        case 422:
            return ErrorCode::ValidationError;
        case 429:
            return ErrorCode::RateLimited;
        default:
            return status >= 500 ? ErrorCode::ServerError : ErrorCode::HttpError;
    }
}

}  // namespace wme_pipe
