// SPDX-License-Identifier: MIT

// src/resource.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"

namespace wme_pipe {

/// Logical identity of a fetchable object.
struct ResourceDescriptor {
    std::string url;
    std::optional<uint64_t> size = {};   ///< Total bytes, if known up front
    std::string content_type = {};       ///< Hint, e.g. "application/gzip"
};

/// Inclusive byte range. An unbounded range (`end` empty) means "from start to EOF".
struct ByteRange {
    uint64_t start = 0;
    std::optional<uint64_t> end = {};

    bool Bounded() const { return end.has_value(); }
    uint64_t Length() const { return end ? *end - start + 1 : 0; }

    bool operator==(const ByteRange&) const = default;
};

/// Body of one ranged fetch, held by the download job until reassembly.
struct ChunkResult {
    ByteRange range;
    BufferChain bytes;
    uint32_t attempt_count = 0;
};

/// Metadata reported by a HEAD request.
struct ResourceInfo {
    std::optional<uint64_t> content_length;
    std::string etag;
    std::string content_type;
    bool accept_ranges = false;
    std::string last_modified;
};

}  // namespace wme_pipe

template <>
struct fmt::formatter<wme_pipe::ByteRange> : fmt::formatter<std::string_view> {
    auto format(const wme_pipe::ByteRange& r, fmt::format_context& ctx) const {
        if (r.end) return fmt::format_to(ctx.out(), "[{}-{}]", r.start, *r.end);
        return fmt::format_to(ctx.out(), "[{}-]", r.start);
    }
};
