// SPDX-License-Identifier: MIT

// src/rate_limiter.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "lib/stream/event_loop.hpp"

namespace wme_pipe {

/// Monotonic time source. Tests substitute ManualClock.
class IClock {
public:
    using Duration = std::chrono::nanoseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual TimePoint Now() const = 0;
    /// Block the calling thread for `d`. ManualClock advances instead.
    virtual void SleepFor(Duration d) = 0;
};

class SteadyClock : public IClock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
    void SleepFor(Duration d) override;

    static SteadyClock& Instance();
};

/// Simulated clock. SleepFor() advances time without blocking.
class ManualClock : public IClock {
public:
    TimePoint Now() const override { return now_; }
    void SleepFor(Duration d) override { now_ += d; }
    void Advance(Duration d) { now_ += d; }

private:
    TimePoint now_{};
};

/// Token bucket limiter shared by every outbound request of a client.
///
/// Refills at `rate` tokens per second up to `burst`. A request that finds the
/// bucket empty reserves a future token (the balance goes negative), so waiters
/// are served in reservation order and the long-run rate never exceeds `rate`.
/// A rate of zero disables limiting.
///
/// Thread-safe: the bucket is guarded by a mutex.
class RateLimiter {
public:
    using Duration = IClock::Duration;

    explicit RateLimiter(double rate_per_second, uint32_t burst = 1,
                         IClock& clock = SteadyClock::Instance());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Take one token and return how long the caller must wait before using it.
    Duration Reserve();

    /// Run `fn` on `loop` once a token is available.
    void Acquire(IEventLoop& loop, std::function<void()> fn);

    /// Block the calling thread until a token is available.
    void AcquireBlocking();

    bool Unlimited() const { return rate_ <= 0.0; }
    double Rate() const { return rate_; }
    uint32_t Burst() const { return burst_; }

private:
    void RefillLocked(IClock::TimePoint now);

    double rate_;
    uint32_t burst_;
    IClock& clock_;

    std::mutex mutex_;
    double tokens_;
    IClock::TimePoint last_;
};

}  // namespace wme_pipe
