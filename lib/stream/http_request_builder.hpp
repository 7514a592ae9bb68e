// SPDX-License-Identifier: MIT

// lib/stream/http_request_builder.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace wme_pipe {

// Serializes one HTTP/1.1 request head (and optional body) into an output
// iterator. The request line and Host header are written on construction,
// so a builder is always in the header section; Finish() terminates it.
//
//   std::string wire;
//   HttpRequestBuilder req(std::back_inserter(wire), "GET", "/v2/projects", host);
//   req.Header("Accept", "application/json").Range(0, 1023);
//   req.Finish();
template<typename OutputIt>
class HttpRequestBuilder {
public:
    // `target` is origin-form and already percent-encoded. An empty host
    // omits the Host header.
    HttpRequestBuilder(OutputIt out, std::string_view method, std::string_view target,
                       std::string_view host)
        : out_(out) {
        out_ = fmt::format_to(out_, "{} {} HTTP/1.1\r\n", method, target);
        if (!host.empty()) Header("Host", host);
    }

    HttpRequestBuilder& Header(std::string_view name, std::string_view value) {
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    // Inclusive byte range; no end asks for the rest of the resource
    HttpRequestBuilder& Range(uint64_t first, std::optional<uint64_t> last) {
        if (last) return Header("Range", fmt::format("bytes={}-{}", first, *last));
        return Header("Range", fmt::format("bytes={}-", first));
    }

    // Ends the header section of a bodiless request
    OutputIt Finish() {
        out_ = fmt::format_to(out_, "\r\n");
        return out_;
    }

    // Adds Content-Type and Content-Length, ends the headers and appends body
    OutputIt Finish(std::string_view content_type, std::string_view body) {
        out_ = fmt::format_to(out_, "Content-Type: {}\r\nContent-Length: {}\r\n\r\n{}",
                              content_type, body.size(), body);
        return out_;
    }

private:
    OutputIt out_;
};

}  // namespace wme_pipe
