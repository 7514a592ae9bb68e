// SPDX-License-Identifier: MIT

// lib/stream/url.hpp
#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace wme_pipe {

// Percent-encode everything except unreserved characters (alnum and -_.~)
template<typename OutputIt>
OutputIt UrlEncode(OutputIt out, std::string_view value) {
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            *out++ = c;
        } else {
            out = fmt::format_to(out, "%{:02X}", static_cast<unsigned char>(c));
        }
    }
    return out;
}

inline std::string UrlEncode(std::string_view value) {
    std::string out;
    UrlEncode(std::back_inserter(out), value);
    return out;
}

/// Absolute http(s) URL split into what a connection and request line need.
struct Url {
    std::string scheme;   // "https" or "http"
    std::string host;
    uint16_t port = 443;
    std::string target;   // path plus query, always starts with '/'

    // Host header value, with the port only when it is not the default
    std::string HostHeader() const {
        bool default_port = (scheme == "https" && port == 443) ||
                            (scheme == "http" && port == 80);
        return default_port ? host : fmt::format("{}:{}", host, port);
    }

    std::string ToString() const {
        return fmt::format("{}://{}{}", scheme, HostHeader(), target);
    }
};

inline std::expected<Url, Error> ParseUrl(std::string_view text) {
    auto bad = [&](std::string_view why) {
        return std::unexpected(Error{ErrorCode::ValidationError,
                                     fmt::format("invalid URL '{}': {}", text, why)});
    };

    Url url;
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) return bad("missing scheme");
    url.scheme = std::string(text.substr(0, scheme_end));
    if (url.scheme == "https") {
        url.port = 443;
    } else if (url.scheme == "http") {
        url.port = 80;
    } else {
        return bad("unsupported scheme");
    }

    auto rest = text.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    url.target = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));
    if (url.target.front() == '?') url.target.insert(url.target.begin(), '/');

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        auto port_text = authority.substr(colon + 1);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return bad("bad port");
        }
        url.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) return bad("missing host");
    url.host = std::string(authority);
    return url;
}

/// Join a base like "https://host/" with a relative path like "v2/snapshots".
inline std::string JoinUrl(std::string_view base, std::string_view path) {
    std::string out(base);
    if (!out.empty() && out.back() == '/' && !path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    } else if (!out.empty() && out.back() != '/' && !path.empty() && path.front() != '/') {
        out += '/';
    }
    out += path;
    return out;
}

}  // namespace wme_pipe
