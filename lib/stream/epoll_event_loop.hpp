// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace wme_pipe {

class EpollWatch;

/// Edge-triggered epoll reactor.
///
/// Descriptors are keyed by fd in the epoll set and looked up in a table
/// on every wakeup, so a watch destroyed by an earlier callback of the same
/// wakeup is simply skipped. Every Schedule()d task sits in one ordered map
/// behind a single timerfd armed for the earliest deadline; equal deadlines
/// run in the order they were scheduled.
///
/// Poll(), Run() and the I/O callbacks belong to one thread, whichever last
/// entered Poll() (the constructing thread until then). Defer(),
/// Schedule() and Stop() may be called from anywhere.
class EpollEventLoop : public IEventLoop {
public:
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;

    std::unique_ptr<IEventHandle> Register(int fd, Interest interest,
                                           IoHandlers handlers) override;
    void Defer(Task task) override;
    void Schedule(std::chrono::milliseconds delay, Task task) override;
    bool IsInEventLoopThread() const override;

    // Deferred tasks, then I/O and due timers (waiting up to timeout_ms),
    // then the tasks those queued.
    void Poll(int timeout_ms);

    void Run();
    void Stop();

    size_t PendingTimers() const;

private:
    friend class EpollWatch;
    using Clock = std::chrono::steady_clock;

    void Control(int op, int fd, Interest interest);
    void Forget(int fd, const EpollWatch* watch);
    void RunDeferred();
    void RunDueTimers();
    void RearmTimerFd();
    void Wake();
    bool HasDeferred();

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    int timer_fd_ = -1;

    std::unordered_map<int, EpollWatch*> watches_;

    std::mutex deferred_mutex_;
    std::vector<Task> deferred_;

    mutable std::mutex timers_mutex_;
    std::multimap<Clock::time_point, Task> timers_;

    std::atomic<std::thread::id> owner_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace wme_pipe
