// SPDX-License-Identifier: MIT

// src/rate_limiter.cpp
#include "src/rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace wme_pipe {

void SteadyClock::SleepFor(Duration d) {
    std::this_thread::sleep_for(d);
}

SteadyClock& SteadyClock::Instance() {
    static SteadyClock clock;
    return clock;
}

RateLimiter::RateLimiter(double rate_per_second, uint32_t burst, IClock& clock)
    : rate_(rate_per_second),
      burst_(std::max<uint32_t>(burst, 1)),
      clock_(clock),
      tokens_(static_cast<double>(burst_)),
      last_(clock.Now()) {}

void RateLimiter::RefillLocked(IClock::TimePoint now) {
    if (now <= last_) return;
    double elapsed = std::chrono::duration<double>(now - last_).count();
    tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * rate_);
    last_ = now;
}

RateLimiter::Duration RateLimiter::Reserve() {
    if (Unlimited()) return Duration::zero();

    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(clock_.Now());
    tokens_ -= 1.0;
    if (tokens_ >= 0.0) return Duration::zero();

    auto wait = std::chrono::duration<double>(-tokens_ / rate_);
    return std::chrono::ceil<Duration>(wait);
}

void RateLimiter::Acquire(IEventLoop& loop, std::function<void()> fn) {
    Duration wait = Reserve();
    if (wait <= Duration::zero()) {
        fn();
        return;
    }
    loop.Schedule(std::chrono::ceil<std::chrono::milliseconds>(wait), std::move(fn));
}

void RateLimiter::AcquireBlocking() {
    Duration wait = Reserve();
    if (wait > Duration::zero()) clock_.SleepFor(wait);
}

}  // namespace wme_pipe
