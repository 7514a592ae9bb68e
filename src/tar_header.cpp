// SPDX-License-Identifier: MIT

// src/tar_header.cpp
#include "src/tar_header.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <memory>
#include <string_view>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

namespace wme_pipe::tar {

namespace {

constexpr size_t kSizeOffset = 124;
constexpr size_t kSizeLength = 12;
constexpr size_t kTypeOffset = 156;
constexpr size_t kMagicOffset = 257;

struct ArchiveReadFree {
    void operator()(archive* a) const { archive_read_free(a); }
};
using ArchiveHandle = std::unique_ptr<archive, ArchiveReadFree>;

Error ArchiveFailure(archive* a, std::string_view what) {
    const char* detail = a ? archive_error_string(a) : nullptr;
    return Error{ErrorCode::ArchiveError,
                 fmt::format("{}: {}", what, detail ? detail : "unknown libarchive error")};
}

}  // namespace

bool IsZeroBlock(BlockView block) {
    return std::ranges::all_of(block, [](std::byte b) { return b == std::byte{0}; });
}

bool HasUstarMagic(BlockView block) {
    return std::memcmp(block.data() + kMagicOffset, "ustar", 5) == 0;
}

bool IsExtensionHeader(BlockView block) {
    switch (static_cast<char>(block[kTypeOffset])) {
        case 'x':
        case 'g':
        case 'L':
        case 'K':
            return true;
        default:
            return false;
    }
}

std::expected<uint64_t, Error> ExtensionPayloadSize(BlockView block) {
    auto field = std::string_view(reinterpret_cast<const char*>(block.data()) + kSizeOffset,
                                  kSizeLength);
    auto begin = field.find_first_not_of(' ');
    if (begin == std::string_view::npos) begin = field.size();
    field.remove_prefix(begin);
    auto end = field.find_first_of(std::string_view(" \0", 2));
    if (end != std::string_view::npos) field = field.substr(0, end);

    uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), size, 8);
    if (field.empty() || ec != std::errc{} || ptr != field.data() + field.size()) {
        return std::unexpected(Error{ErrorCode::ArchiveError,
                                     "tar extension header has an invalid size field"});
    }
    return size;
}

std::expected<Member, Error> DecodeHeaderRun(std::span<const std::byte> run) {
    ArchiveHandle a(archive_read_new());
    if (!a) return std::unexpected(ArchiveFailure(nullptr, "archive_read_new"));

    if (archive_read_support_format_tar(a.get()) != ARCHIVE_OK) {
        return std::unexpected(ArchiveFailure(a.get(), "tar support"));
    }
    // The run holds headers only; member data is never read from here
    if (archive_read_open_memory(a.get(), run.data(), run.size()) != ARCHIVE_OK) {
        return std::unexpected(ArchiveFailure(a.get(), "tar header"));
    }

    archive_entry* entry = nullptr;
    int rc = archive_read_next_header(a.get(), &entry);
    if (rc == ARCHIVE_EOF) {
        return std::unexpected(Error{ErrorCode::ArchiveError, "tar header run has no member"});
    }
    if (rc < ARCHIVE_WARN) return std::unexpected(ArchiveFailure(a.get(), "tar header"));

    Member member;
    const char* path = archive_entry_pathname_utf8(entry);
    if (!path) path = archive_entry_pathname(entry);
    member.name = path ? path : "";
    if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
        member.size = static_cast<uint64_t>(archive_entry_size(entry));
    }
    member.regular = archive_entry_filetype(entry) == AE_IFREG;
    return member;
}

}  // namespace wme_pipe::tar
