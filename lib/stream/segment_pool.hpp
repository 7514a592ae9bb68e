// SPDX-License-Identifier: MIT

// lib/stream/segment_pool.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "lib/stream/buffer_chain.hpp"

namespace wme_pipe {

/// Bounded cache of spare Segments for one pipeline stage.
///
/// Stages that fill segments (socket reads, TLS records, inflated output,
/// tar bodies) take them from here and hand the pool's Recycler() to the
/// BufferChain that carries them, so a consumed segment comes straight back
/// instead of being freed. The spare list lives behind a shared_ptr; a
/// recycler that outlives its pool simply lets segments go.
///
/// Event loop thread only.
class SegmentPool {
public:
    static constexpr size_t kDefaultCapacity = 32;

    explicit SegmentPool(size_t capacity = kDefaultCapacity)
        : spares_(std::make_shared<Spares>()) {
        spares_->capacity = capacity;
    }

    /// An empty segment, reused when one is spare.
    std::shared_ptr<Segment> Acquire() {
        auto& list = spares_->list;
        if (list.empty()) return std::make_shared<Segment>();
        std::shared_ptr<Segment> seg = std::move(list.back());
        list.pop_back();
        seg->size = 0;
        return seg;
    }

    /// Segments still referenced elsewhere, or past capacity, are dropped.
    void Recycle(std::shared_ptr<Segment> seg) { Keep(*spares_, std::move(seg)); }

    BufferChain::RecycleCallback Recycler() const {
        std::weak_ptr<Spares> weak = spares_;
        return [weak](std::shared_ptr<Segment> seg) {
            if (auto spares = weak.lock()) Keep(*spares, std::move(seg));
        };
    }

    size_t Spare() const { return spares_->list.size(); }
    void SetCapacity(size_t n) {
        spares_->capacity = n;
        if (spares_->list.size() > n) spares_->list.resize(n);
    }

private:
    struct Spares {
        std::vector<std::shared_ptr<Segment>> list;
        size_t capacity = 0;
    };

    static void Keep(Spares& spares, std::shared_ptr<Segment> seg) {
        if (!seg || seg.use_count() != 1) return;
        if (spares.list.size() >= spares.capacity) return;
        spares.list.push_back(std::move(seg));
    }

    std::shared_ptr<Spares> spares_;
};

}  // namespace wme_pipe
