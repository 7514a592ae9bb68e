// SPDX-License-Identifier: MIT

// src/tar_header.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "lib/stream/error.hpp"

namespace wme_pipe::tar {

inline constexpr size_t kBlockSize = 512;

using BlockView = std::span<const std::byte, kBlockSize>;

/// What the member header at the end of a header run describes.
struct Member {
    std::string name;
    uint64_t size = 0;      ///< Bytes of member data that follow the run
    bool regular = false;   ///< Only regular files carry records
};

bool IsZeroBlock(BlockView block);

/// "ustar" at offset 257; matches both POSIX and old GNU headers.
bool HasUstarMagic(BlockView block);

/// pax ('x', 'g') and GNU long name/link ('L', 'K') headers describe the
/// member that follows them rather than a member of their own.
bool IsExtensionHeader(BlockView block);

/// Length of the payload after an extension header, before block padding.
std::expected<uint64_t, Error> ExtensionPayloadSize(BlockView block);

/// Bytes needed to bring `size` to a block boundary.
constexpr uint64_t Padding(uint64_t size) {
    return (kBlockSize - size % kBlockSize) % kBlockSize;
}

/// Decode a header run (extension headers with their payloads, then the
/// member header) with libarchive. Checksums, pax records, GNU long names
/// and base-256 sizes are handled there.
std::expected<Member, Error> DecodeHeaderRun(std::span<const std::byte> run);

}  // namespace wme_pipe::tar
