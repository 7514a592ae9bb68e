// SPDX-License-Identifier: MIT

// lib/stream/codec.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string_view>

#include "lib/stream/error.hpp"

namespace wme_pipe {

enum class Codec { Auto, Identity, Gzip, Zstd };

constexpr std::string_view codec_name(Codec c) {
    switch (c) {
        case Codec::Auto: return "auto";
        case Codec::Identity: return "identity";
        case Codec::Gzip: return "gzip";
        case Codec::Zstd: return "zstd";
    }
    return "unknown";
}

/// Bytes needed to tell the codecs apart.
inline constexpr size_t kCodecMagicSize = 4;

/// Pick a codec from the first bytes of a stream. Shorter input than
/// kCodecMagicSize can only be recognised as gzip.
Codec SniffCodec(std::span<const std::byte> head);

/// Codec from a Content-Encoding / Content-Type hint, Auto if unknown.
Codec CodecFromHint(std::string_view hint);

struct InflateStep {
    size_t consumed = 0;
    size_t produced = 0;
};

/// Incremental decoder for one compressed stream. Concatenated members or
/// frames are decoded back to back.
class Inflater {
public:
    virtual ~Inflater() = default;

    virtual std::expected<InflateStep, Error> Inflate(std::span<const std::byte> in,
                                                      std::span<std::byte> out) = 0;

    /// True when everything fed so far ended on a member/frame boundary.
    virtual bool AtBoundary() const = 0;

    virtual Codec Kind() const = 0;
};

/// nullptr for Identity. Throws std::runtime_error if the library cannot
/// allocate its context.
std::unique_ptr<Inflater> MakeInflater(Codec codec);

}  // namespace wme_pipe
