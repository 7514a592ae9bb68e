// SPDX-License-Identifier: MIT

// lib/stream/buffer_chain.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace wme_pipe {

// 64 KiB block filled from the front. Sockets read into segments,
// decompressors inflate into them, and chains of them carry bytes from one
// stage to the next.
struct Segment {
    static constexpr size_t kSize = 64 * 1024;

    std::array<std::byte, kSize> data;
    size_t size = 0;

    size_t Free() const noexcept { return kSize - size; }
    std::span<std::byte> Unfilled() noexcept { return {data.data() + size, Free()}; }
};

// Queue of bytes spread over shared segments.
//
// Every segment in the chain has its own read position, so chains can be
// joined without copying even after they were partly consumed. Segments
// still referenced elsewhere are never written to.
//
// A stage passes a chain to the next by reference; what the next stage does
// not Consume() remains the caller's. Event loop thread only.
class BufferChain {
public:
    using RecycleCallback = std::function<void(std::shared_ptr<Segment>)>;

    BufferChain() = default;
    BufferChain(const BufferChain&) = default;
    BufferChain& operator=(const BufferChain&) = default;

    BufferChain(BufferChain&& other) noexcept
        : parts_(std::move(other.parts_)),
          size_(std::exchange(other.size_, 0)),
          recycle_(std::move(other.recycle_)) {
        other.parts_.clear();
    }

    BufferChain& operator=(BufferChain&& other) noexcept {
        if (this != &other) {
            parts_ = std::move(other.parts_);
            size_ = std::exchange(other.size_, 0);
            recycle_ = std::move(other.recycle_);
            other.parts_.clear();
        }
        return *this;
    }

    // Receives each segment this chain is done with
    void SetRecycleCallback(RecycleCallback cb) { recycle_ = std::move(cb); }

    void Append(std::shared_ptr<Segment> seg) {
        if (!seg || seg->size == 0) return;
        assert(seg->size <= Segment::kSize);
        size_ += seg->size;
        parts_.push_back(Part{std::move(seg), 0});
    }

    void AppendBytes(const void* src, size_t len) {
        const auto* from = static_cast<const std::byte*>(src);
        while (len > 0) {
            Segment& tail = WritableTail();
            size_t n = std::min(len, tail.Free());
            std::memcpy(tail.data.data() + tail.size, from, n);
            tail.size += n;
            size_ += n;
            from += n;
            len -= n;
        }
    }

    void AppendBytes(std::string_view text) { AppendBytes(text.data(), text.size()); }

    // Moves everything left in `other` to the end of this chain, leaving it
    // empty. Its recycle callback stays behind.
    void Splice(BufferChain&& other) {
        for (auto& part : other.parts_) parts_.push_back(std::move(part));
        size_ += std::exchange(other.size_, 0);
        other.parts_.clear();
    }

    // Whether `incoming` more bytes would take the chain over `limit`
    bool WouldOverflow(size_t incoming, size_t limit) const noexcept {
        return size_ > limit || incoming > limit - size_;
    }

    void Consume(size_t bytes) noexcept {
        bytes = std::min(bytes, size_);
        size_ -= bytes;
        while (bytes > 0) {
            Part& front = parts_.front();
            size_t left = front.Length();
            if (bytes < left) {
                front.begin += bytes;
                return;
            }
            bytes -= left;
            Release(std::move(front.seg));
            parts_.pop_front();
        }
    }

    void Clear() {
        for (auto& part : parts_) Release(std::move(part.seg));
        parts_.clear();
        size_ = 0;
    }

    size_t Size() const noexcept { return size_; }
    bool Empty() const noexcept { return size_ == 0; }
    size_t SegmentCount() const noexcept { return parts_.size(); }

    // Readable at DataAt(0) before the first segment boundary
    size_t ContiguousSize() const noexcept {
        return parts_.empty() ? 0 : parts_.front().Length();
    }

    const std::byte* DataAt(size_t offset) const noexcept {
        auto [index, within] = Locate(offset);
        assert(index < parts_.size());
        return parts_[index].Bytes() + within;
    }

    void CopyTo(size_t offset, size_t len, std::byte* dest) const {
        auto [index, within] = Locate(offset);
        while (len > 0) {
            assert(index < parts_.size());
            const Part& part = parts_[index++];
            size_t n = std::min(len, part.Length() - within);
            std::memcpy(dest, part.Bytes() + within, n);
            dest += n;
            len -= n;
            within = 0;
        }
    }

    // Appends the bytes to `out`
    void CopyTo(size_t offset, size_t len, std::string& out) const {
        size_t base = out.size();
        out.resize(base + len);
        CopyTo(offset, len, reinterpret_cast<std::byte*>(out.data() + base));
    }

    std::optional<size_t> Find(std::byte value, size_t from = 0) const noexcept {
        if (from >= size_) return std::nullopt;
        auto [index, within] = Locate(from);
        size_t base = from - within;
        for (; index < parts_.size(); ++index) {
            const Part& part = parts_[index];
            const std::byte* start = part.Bytes();
            size_t len = part.Length();
            const void* hit = std::memchr(start + within, std::to_integer<int>(value),
                                          len - within);
            if (hit != nullptr) {
                return base + static_cast<size_t>(static_cast<const std::byte*>(hit) - start);
            }
            base += len;
            within = 0;
        }
        return std::nullopt;
    }

    std::string ToString() const {
        std::string out;
        CopyTo(0, size_, out);
        return out;
    }

private:
    struct Part {
        std::shared_ptr<Segment> seg;
        size_t begin;

        const std::byte* Bytes() const noexcept { return seg->data.data() + begin; }
        size_t Length() const noexcept { return seg->size - begin; }
    };

    // Index of the part holding `offset`, and the position inside it
    std::pair<size_t, size_t> Locate(size_t offset) const noexcept {
        size_t index = 0;
        while (index < parts_.size() && offset >= parts_[index].Length()) {
            offset -= parts_[index].Length();
            ++index;
        }
        return {index, offset};
    }

    Segment& WritableTail() {
        bool usable = !parts_.empty() && parts_.back().seg.use_count() == 1 &&
                      parts_.back().seg->Free() > 0;
        if (!usable) parts_.push_back(Part{std::make_shared<Segment>(), 0});
        return *parts_.back().seg;
    }

    void Release(std::shared_ptr<Segment> seg) {
        if (recycle_ && seg) recycle_(std::move(seg));
    }

    std::deque<Part> parts_;
    size_t size_ = 0;
    RecycleCallback recycle_;
};

}  // namespace wme_pipe
