// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.cpp
#include "lib/stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <system_error>
#include <utility>

namespace wme_pipe {

namespace {

constexpr int kEventBatch = 64;

std::system_error SysError(const char* call) {
    return std::system_error(errno, std::generic_category(), call);
}

uint32_t EpollMask(Interest interest) {
    uint32_t mask = EPOLLET;
    if (interest.read) mask |= EPOLLIN;
    if (interest.write) mask |= EPOLLOUT;
    return mask;
}

void Drain(int fd) {
    uint64_t counter = 0;
    while (::read(fd, &counter, sizeof(counter)) > 0) continue;
}

}  // namespace

class EpollWatch : public IEventHandle {
public:
    EpollWatch(EpollEventLoop& loop, int fd, IoHandlers handlers)
        : loop_(loop), fd_(fd), handlers_(std::move(handlers)) {}

    ~EpollWatch() override { loop_.Forget(fd_, this); }

    void Update(Interest interest) override { loop_.Control(EPOLL_CTL_MOD, fd_, interest); }

    int fd() const override { return fd_; }

    void Dispatch(uint32_t events) {
        if (events & (EPOLLERR | EPOLLHUP)) {
            int pending = 0;
            socklen_t len = sizeof(pending);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &pending, &len) != 0) pending = errno;
            if (handlers_.on_failure) handlers_.on_failure(pending);
            return;
        }
        if ((events & EPOLLIN) && handlers_.on_readable) handlers_.on_readable();
        if ((events & EPOLLOUT) && handlers_.on_writable) handlers_.on_writable();
    }

private:
    EpollEventLoop& loop_;
    int fd_;
    IoHandlers handlers_;
};

EpollEventLoop::EpollEventLoop() : owner_(std::this_thread::get_id()) {
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) throw SysError("epoll_create1");

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        auto err = SysError("eventfd");
        ::close(epoll_fd_);
        throw err;
    }
    timer_fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        auto err = SysError("timerfd_create");
        ::close(wake_fd_);
        ::close(epoll_fd_);
        throw err;
    }

    for (int internal : {wake_fd_, timer_fd_}) {
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = internal;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, internal, &ev) != 0) {
            auto err = SysError("epoll_ctl");
            ::close(timer_fd_);
            ::close(wake_fd_);
            ::close(epoll_fd_);
            throw err;
        }
    }
}

EpollEventLoop::~EpollEventLoop() {
    ::close(timer_fd_);
    ::close(wake_fd_);
    ::close(epoll_fd_);
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(int fd, Interest interest,
                                                       IoHandlers handlers) {
    auto watch = std::make_unique<EpollWatch>(*this, fd, std::move(handlers));
    Control(EPOLL_CTL_ADD, fd, interest);
    watches_[fd] = watch.get();
    return watch;
}

void EpollEventLoop::Control(int op, int fd, Interest interest) {
    epoll_event ev{};
    ev.events = EpollMask(interest);
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, op, fd, &ev) != 0) throw SysError("epoll_ctl");
}

void EpollEventLoop::Forget(int fd, const EpollWatch* watch) {
    auto it = watches_.find(fd);
    // A reused descriptor may already belong to a newer watch
    if (it == watches_.end() || it->second != watch) return;
    watches_.erase(it);
    // The owner may have closed the descriptor already, which removed it
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
}

void EpollEventLoop::Defer(Task task) {
    {
        std::lock_guard lock(deferred_mutex_);
        deferred_.push_back(std::move(task));
    }
    if (!IsInEventLoopThread()) Wake();
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, Task task) {
    auto due = Clock::now() + std::max(delay, std::chrono::milliseconds::zero());
    std::lock_guard lock(timers_mutex_);
    bool new_earliest = timers_.empty() || due < timers_.begin()->first;
    // Inserted after any entry with the same deadline
    timers_.emplace(due, std::move(task));
    if (new_earliest) RearmTimerFd();
}

size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard lock(timers_mutex_);
    return timers_.size();
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return owner_.load() == std::this_thread::get_id();
}

// Caller holds timers_mutex_
void EpollEventLoop::RearmTimerFd() {
    itimerspec spec{};
    if (!timers_.empty()) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      timers_.begin()->first.time_since_epoch())
                      .count();
        // An all-zero it_value would disarm the timer
        ns = std::max<int64_t>(ns, 1);
        spec.it_value.tv_sec = static_cast<time_t>(ns / 1'000'000'000);
        spec.it_value.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    }
    if (::timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &spec, nullptr) != 0) {
        throw SysError("timerfd_settime");
    }
}

void EpollEventLoop::RunDueTimers() {
    Drain(timer_fd_);
    std::vector<Task> due;
    {
        std::lock_guard lock(timers_mutex_);
        auto end = timers_.upper_bound(Clock::now());
        for (auto it = timers_.begin(); it != end; ++it) due.push_back(std::move(it->second));
        timers_.erase(timers_.begin(), end);
        RearmTimerFd();
    }
    for (auto& task : due) {
        if (task) task();
    }
}

void EpollEventLoop::RunDeferred() {
    std::vector<Task> batch;
    {
        std::lock_guard lock(deferred_mutex_);
        batch.swap(deferred_);
    }
    for (auto& task : batch) {
        if (task) task();
    }
}

bool EpollEventLoop::HasDeferred() {
    std::lock_guard lock(deferred_mutex_);
    return !deferred_.empty();
}

void EpollEventLoop::Poll(int timeout_ms) {
    owner_.store(std::this_thread::get_id());
    RunDeferred();
    if (HasDeferred()) timeout_ms = 0;

    std::array<epoll_event, kEventBatch> events;
    int ready = ::epoll_wait(epoll_fd_, events.data(), kEventBatch, timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) return;
        throw SysError("epoll_wait");
    }

    for (int i = 0; i < ready; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            Drain(wake_fd_);
        } else if (fd == timer_fd_) {
            RunDueTimers();
        } else if (auto it = watches_.find(fd); it != watches_.end()) {
            it->second->Dispatch(events[i].events);
        }
    }

    RunDeferred();
}

void EpollEventLoop::Run() {
    if (running_.exchange(true)) return;
    while (!stop_requested_.load()) Poll(100);
    running_ = false;
}

void EpollEventLoop::Stop() {
    stop_requested_ = true;
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t one = 1;
    // A full counter already guarantees a wakeup
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        throw SysError("eventfd write");
    }
}

}  // namespace wme_pipe
