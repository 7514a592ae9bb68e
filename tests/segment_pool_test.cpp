// SPDX-License-Identifier: MIT

// tests/segment_pool_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <optional>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/segment_pool.hpp"

using namespace wme_pipe;

TEST(SegmentPoolTest, EmptyPoolHandsOutFreshSegments) {
    SegmentPool pool;
    auto a = pool.Acquire();
    auto b = pool.Acquire();
    ASSERT_NE(a, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(a->size, 0u);
    EXPECT_EQ(pool.Spare(), 0u);
}

TEST(SegmentPoolTest, RecycledSegmentComesBackCleared) {
    SegmentPool pool;
    auto seg = pool.Acquire();
    Segment* raw = seg.get();
    seg->size = 1200;
    pool.Recycle(std::move(seg));
    ASSERT_EQ(pool.Spare(), 1u);

    auto again = pool.Acquire();
    EXPECT_EQ(again.get(), raw);
    EXPECT_EQ(again->size, 0u);
    EXPECT_EQ(pool.Spare(), 0u);
}

TEST(SegmentPoolTest, SegmentStillReferencedIsNotKept) {
    SegmentPool pool;
    auto seg = pool.Acquire();
    auto reader = seg;
    pool.Recycle(std::move(seg));
    EXPECT_EQ(pool.Spare(), 0u);
}

TEST(SegmentPoolTest, CapacityBoundsSpares) {
    SegmentPool pool(2);
    for (int i = 0; i < 5; ++i) pool.Recycle(std::make_shared<Segment>());
    EXPECT_EQ(pool.Spare(), 2u);

    pool.SetCapacity(1);
    EXPECT_EQ(pool.Spare(), 1u);
}

TEST(SegmentPoolTest, ChainReturnsConsumedSegments) {
    SegmentPool pool;
    BufferChain chain;
    chain.SetRecycleCallback(pool.Recycler());

    auto seg = pool.Acquire();
    seg->size = 8;
    chain.Append(std::move(seg));
    chain.Consume(3);
    EXPECT_EQ(pool.Spare(), 0u);
    chain.Consume(5);
    EXPECT_EQ(pool.Spare(), 1u);
}

TEST(SegmentPoolTest, RecyclerOutlivingPoolDropsSegments) {
    BufferChain::RecycleCallback recycle;
    {
        SegmentPool pool;
        recycle = pool.Recycler();
    }
    auto seg = std::make_shared<Segment>();
    std::weak_ptr<Segment> watch = seg;
    recycle(std::move(seg));
    EXPECT_TRUE(watch.expired());
}
