// SPDX-License-Identifier: MIT

// lib/stream/component.hpp
#pragma once

#include <atomic>
#include <cassert>
#include <memory>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/segment_pool.hpp"
#include "lib/stream/suspendable.hpp"

namespace wme_pipe {

// A stage that only needs to hear how the stream ended
template<typename D>
concept TerminalDownstream = requires(D& d, const Error& e) {
    d.OnError(e);
    d.OnDone();
};

// A stage fed with bytes. OnData() consumes what it takes from the chain;
// anything left belongs to the caller again.
template<typename D>
concept Downstream = TerminalDownstream<D> && requires(D& d, BufferChain& chain) {
    d.OnData(chain);
};

// Shared plumbing for a stage of the byte pipeline, mixed in with CRTP.
//
// A stage owns the next one (D) and sends it data and exactly one terminal
// signal. While any Busy token is held the stage is never torn down; a close
// requested meanwhile is queued until the last token goes, then DoClose()
// runs from the event loop. Suspend() calls nest and the first one is passed
// to the upstream; a completion that arrives while suspended is held and
// released after the final Resume().
//
// Derived supplies:
//   DoClose()          release resources, drop the downstream
//   ResumeWork()       push buffered bytes on after the last Resume()
//   ReleaseHeldDone()  finish a completion held by HoldDone()
template<typename Derived, typename D>
class PipelineComponent : public Suspendable {
public:
    explicit PipelineComponent(IEventLoop& loop) : loop_(loop) {}

    class Busy {
    public:
        explicit Busy(PipelineComponent& owner) : owner_(&owner) { ++owner_->busy_; }
        Busy(Busy&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Busy(const Busy&) = delete;
        Busy& operator=(const Busy&) = delete;
        Busy& operator=(Busy&&) = delete;

        ~Busy() {
            if (owner_ == nullptr) return;
            if (--owner_->busy_ == 0 && owner_->close_waiting_) owner_->QueueClose();
        }

    private:
        PipelineComponent* owner_;
    };

    // Nothing once the stage is closing
    [[nodiscard]] std::optional<Busy> Enter() {
        if (closing_) return std::nullopt;
        return std::optional<Busy>(std::in_place, *this);
    }

    void RequestClose() {
        if (closing_) return;
        closing_ = true;
        if (busy_ > 0) {
            close_waiting_ = true;
        } else {
            QueueClose();
        }
    }

    bool IsClosed() const { return closing_; }

    // Set once OnDone or OnError went out; Rearm() for the next message
    bool IsTerminated() const { return terminated_; }
    void MarkTerminated() { terminated_ = true; }
    void Rearm() { terminated_ = false; }

    void SetDownstream(std::shared_ptr<D> next) { next_ = std::move(next); }
    bool HasDownstream() const { return next_ != nullptr; }
    void ResetDownstream() { next_.reset(); }
    D& GetDownstream() { return *next_; }

    SegmentPool& Segments() { return segments_; }

    void EmitError(const Error& e) {
        Terminate([&e](D& next) { next.OnError(e); });
    }

    void EmitDone() {
        Terminate([](D& next) { next.OnDone(); });
    }

    void Suspend() override {
        assert(loop_.IsInEventLoopThread());
        if (holds_.fetch_add(1, std::memory_order_acq_rel) == 0 && upstream_) {
            upstream_->Suspend();
        }
    }

    void Resume() override {
        assert(loop_.IsInEventLoopThread());
        int before = holds_.fetch_sub(1, std::memory_order_acq_rel);
        assert(before > 0);
        if (before != 1) return;

        if (auto busy = Enter()) {
            self().ResumeWork();
            // Re-suspending in ResumeWork() sent its own Suspend upstream
            if (upstream_) upstream_->Resume();
        }
        if (done_held_ && !IsSuspended()) {
            done_held_ = false;
            self().ReleaseHeldDone();
        }
    }

    bool IsSuspended() const override { return holds_.load(std::memory_order_acquire) > 0; }

    void Close() override { self().RequestClose(); }

    void SetUpstream(Suspendable* upstream) { upstream_ = upstream; }

    void HoldDone() { done_held_ = true; }
    bool IsDoneHeld() const { return done_held_; }

    // Hands `chain` to the downstream. True when that left us suspended.
    bool PassDown(BufferChain& chain) {
        if (!next_ || chain.Empty()) return false;
        std::shared_ptr<D> keep = next_;
        keep->OnData(chain);
        return IsSuspended();
    }

    // OnError downstream, then close
    void AbortWith(const Error& e) {
        auto busy = Enter();
        if (!busy) return;
        EmitError(e);
        self().RequestClose();
    }

    // Delivers what is left of `chain` before a completion. True when the
    // completion cannot happen now: the downstream suspended (the done is
    // held) or left bytes behind (an error went out instead).
    bool DeliverRemaining(BufferChain& chain) {
        if (chain.Empty()) return false;
        PassDown(chain);
        if (IsSuspended()) {
            HoldDone();
            return true;
        }
        if (chain.Empty()) return false;
        EmitError(Error{ErrorCode::ParseError,
                        fmt::format("stream ended with {} bytes not taken", chain.Size())});
        self().RequestClose();
        return true;
    }

    // DeliverRemaining() followed by OnDone. False when the done is held or
    // replaced by an error; the caller must then leave the stage open.
    bool DeliverThenDone(BufferChain& chain) {
        if (DeliverRemaining(chain)) return false;
        EmitDone();
        return true;
    }

protected:
    IEventLoop& loop_;
    Suspendable* upstream_ = nullptr;

private:
    Derived& self() { return static_cast<Derived&>(*this); }

    template <typename Signal>
    void Terminate(Signal&& signal) {
        if (terminated_ || !next_) return;
        terminated_ = true;
        Busy busy(*this);
        std::shared_ptr<D> keep = next_;
        signal(*keep);
    }

    void QueueClose() {
        close_waiting_ = false;
        if (close_queued_) return;
        close_queued_ = true;
        // Destruction already under way when nobody owns us any more
        if (auto owner = self().weak_from_this().lock()) {
            loop_.Defer([owner]() { owner->DoClose(); });
        }
    }

    std::shared_ptr<D> next_;
    SegmentPool segments_;

    int busy_ = 0;
    bool closing_ = false;
    bool close_waiting_ = false;
    bool close_queued_ = false;
    bool terminated_ = false;
    bool done_held_ = false;
    std::atomic<int> holds_{0};
};

}  // namespace wme_pipe
