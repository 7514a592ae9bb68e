// SPDX-License-Identifier: MIT

// tests/pipeline_component_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/epoll_event_loop.hpp"

using namespace wme_pipe;

namespace {

// Collects bytes; can be told to suspend its upstream on the next chunk.
struct RecordingDownstream {
    std::string received;
    bool error_called = false;
    bool done_called = false;
    Suspendable* upstream = nullptr;
    bool suspend_next = false;

    void OnData(BufferChain& chain) {
        if (suspend_next && upstream) {
            suspend_next = false;
            upstream->Suspend();
            return;  // leave the bytes with the caller
        }
        received += chain.ToString();
        chain.Consume(chain.Size());
    }
    void OnError(const Error&) { error_called = true; }
    void OnDone() { done_called = true; }
};

static_assert(TerminalDownstream<RecordingDownstream>);
static_assert(Downstream<RecordingDownstream>);
static_assert(!Downstream<int>);

// Pass-through stage that holds whatever its downstream left unconsumed
class PassThrough : public PipelineComponent<PassThrough, RecordingDownstream>,
                    public std::enable_shared_from_this<PassThrough> {
public:
    PassThrough(IEventLoop& loop, std::shared_ptr<RecordingDownstream> ds)
        : PipelineComponent(loop) {
        SetDownstream(std::move(ds));
    }

    int process_count = 0;
    bool do_close_called = false;

    void OnData(BufferChain& data) {
        auto guard = Enter();
        if (!guard) return;
        ++process_count;
        pending_.Splice(std::move(data));
        PassDown(pending_);
    }

    void OnDone() {
        auto guard = Enter();
        if (!guard) return;
        if (IsSuspended()) {
            HoldDone();
            return;
        }
        ReleaseHeldDone();
    }

    void DoClose() { do_close_called = true; }
    void ResumeWork() { PassDown(pending_); }
    void ReleaseHeldDone() { DeliverThenDone(pending_); }

private:
    BufferChain pending_;
};

// Counts Suspend/Resume reaching the head of the pipeline
struct CountingUpstream : Suspendable {
    int suspends = 0;
    int resumes = 0;
    void Suspend() override { ++suspends; }
    void Resume() override { ++resumes; }
    void Close() override {}
    bool IsSuspended() const override { return suspends > resumes; }
};

}  // namespace

TEST(PipelineComponentTest, EnterRefusedOnceClosing) {
    EpollEventLoop loop;
    auto ds = std::make_shared<RecordingDownstream>();
    auto comp = std::make_shared<PassThrough>(loop, ds);

    BufferChain chain;
    chain.AppendBytes("a");
    comp->OnData(chain);
    EXPECT_EQ(comp->process_count, 1);

    comp->RequestClose();
    chain.AppendBytes("b");
    comp->OnData(chain);
    EXPECT_EQ(comp->process_count, 1);
}

TEST(PipelineComponentTest, BusyStageClosesAfterLastToken) {
    EpollEventLoop loop;
    auto comp = std::make_shared<PassThrough>(loop, std::make_shared<RecordingDownstream>());

    {
        auto outer = comp->Enter();
        ASSERT_TRUE(outer.has_value());
        {
            auto inner = std::move(outer);
            comp->RequestClose();
            EXPECT_TRUE(comp->IsClosed());
        }
        loop.Poll(0);
        EXPECT_TRUE(comp->do_close_called);
    }

    // A second request does not queue another DoClose
    comp->do_close_called = false;
    comp->RequestClose();
    loop.Poll(0);
    EXPECT_FALSE(comp->do_close_called);
}

TEST(PipelineComponentTest, SuspendHoldsDataAndDefersDone) {
    EpollEventLoop loop;
    auto ds = std::make_shared<RecordingDownstream>();
    auto comp = std::make_shared<PassThrough>(loop, ds);
    CountingUpstream head;
    comp->SetUpstream(&head);
    ds->upstream = comp.get();

    ds->suspend_next = true;
    BufferChain chain;
    chain.AppendBytes("held");
    comp->OnData(chain);
    comp->OnDone();

    EXPECT_TRUE(comp->IsSuspended());
    EXPECT_EQ(head.suspends, 1);
    EXPECT_TRUE(ds->received.empty());
    EXPECT_FALSE(ds->done_called);

    comp->Resume();
    EXPECT_EQ(ds->received, "held");
    EXPECT_TRUE(ds->done_called);
    EXPECT_EQ(head.resumes, 1);
}

TEST(PipelineComponentTest, NestedSuspendNeedsMatchingResumes) {
    EpollEventLoop loop;
    auto comp = std::make_shared<PassThrough>(loop, std::make_shared<RecordingDownstream>());
    CountingUpstream head;
    comp->SetUpstream(&head);

    comp->Suspend();
    comp->Suspend();
    EXPECT_EQ(head.suspends, 1);

    comp->Resume();
    EXPECT_TRUE(comp->IsSuspended());
    EXPECT_EQ(head.resumes, 0);

    comp->Resume();
    EXPECT_FALSE(comp->IsSuspended());
    EXPECT_EQ(head.resumes, 1);
}

TEST(PipelineComponentTest, OnlyOneTerminalSignal) {
    EpollEventLoop loop;
    auto ds = std::make_shared<RecordingDownstream>();
    auto comp = std::make_shared<PassThrough>(loop, ds);

    comp->EmitError(Error{ErrorCode::ParseError, "bad"});
    comp->EmitDone();
    EXPECT_TRUE(ds->error_called);
    EXPECT_FALSE(ds->done_called);
}

TEST(PipelineComponentTest, RearmAllowsNextMessage) {
    EpollEventLoop loop;
    auto ds = std::make_shared<RecordingDownstream>();
    auto comp = std::make_shared<PassThrough>(loop, ds);

    comp->EmitDone();
    EXPECT_TRUE(comp->IsTerminated());
    ds->done_called = false;
    comp->EmitDone();
    EXPECT_FALSE(ds->done_called);

    comp->Rearm();
    comp->EmitDone();
    EXPECT_TRUE(ds->done_called);
}

TEST(PipelineComponentTest, BytesLeftAtEndBecomeError) {
    EpollEventLoop loop;

    // Takes nothing, ever
    struct Stubborn {
        bool error = false;
        bool done = false;
        void OnData(BufferChain&) {}
        void OnError(const Error& e) { error = e.code == ErrorCode::ParseError; }
        void OnDone() { done = true; }
    };
    class Holder : public PipelineComponent<Holder, Stubborn>,
                   public std::enable_shared_from_this<Holder> {
    public:
        using PipelineComponent::PipelineComponent;
        void DoClose() { ResetDownstream(); }
        void ResumeWork() {}
        void ReleaseHeldDone() {}
    };

    auto sink = std::make_shared<Stubborn>();
    auto stage = std::make_shared<Holder>(loop);
    stage->SetDownstream(sink);

    BufferChain rest;
    rest.AppendBytes("tail");
    EXPECT_FALSE(stage->DeliverThenDone(rest));
    EXPECT_TRUE(sink->error);
    EXPECT_FALSE(sink->done);
    EXPECT_TRUE(stage->IsClosed());

    loop.Poll(0);
    EXPECT_FALSE(stage->HasDownstream());
}
