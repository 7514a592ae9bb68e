// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace wme_pipe {

// Restartable timer over IEventLoop::Schedule().
//
// Each Start() begins a new epoch and ticks left over from earlier epochs
// are dropped when they come due; an idle timeout re-armed on every read
// relies on that. Ticks hold only a weak reference to the timer's state, so
// destroying an armed Timer (even from its own callback) is fine.
//
//   Timer refresh(loop);
//   refresh.OnTimer([&] { tokens.RefreshNow(); });
//   refresh.Start(0ms, 1h);
class Timer {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    explicit Timer(IEventLoop& loop) : loop_(loop), state_(std::make_shared<State>()) {}

    ~Timer() { state_->armed = false; }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void OnTimer(Callback cb) { state_->callback = std::move(cb); }

    // First tick after `delay`, then every `period` unless period is zero
    void Start(Duration delay, Duration period = Duration::zero()) {
        state_->period = period;
        state_->armed = true;
        Arm(loop_, state_, delay, ++state_->epoch);
    }

    void Stop() {
        state_->armed = false;
        ++state_->epoch;
    }

    bool IsArmed() const { return state_->armed; }

private:
    struct State {
        Callback callback;
        Duration period{0};
        uint64_t epoch = 0;
        bool armed = false;
    };

    static void Arm(IEventLoop& loop, const std::shared_ptr<State>& state, Duration delay,
                    uint64_t epoch) {
        std::weak_ptr<State> weak = state;
        loop.Schedule(delay, [&loop, weak, epoch]() {
            auto s = weak.lock();
            if (!s || !s->armed || s->epoch != epoch) return;
            bool periodic = s->period > Duration::zero();
            if (!periodic) s->armed = false;
            if (s->callback) s->callback();
            // The callback may have stopped, restarted or destroyed the timer
            if (periodic && s->armed && s->epoch == epoch) {
                Arm(loop, s, s->period, epoch);
            }
        });
    }

    IEventLoop& loop_;
    std::shared_ptr<State> state_;
};

}  // namespace wme_pipe
