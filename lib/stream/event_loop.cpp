// SPDX-License-Identifier: MIT

// lib/stream/event_loop.cpp
#include "lib/stream/event_loop.hpp"

#include "lib/stream/epoll_event_loop.hpp"

namespace wme_pipe {

struct EventLoop::Impl {
    EpollEventLoop reactor;
};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) {
    impl_->reactor.Poll(timeout_ms);
}

void EventLoop::Run() {
    impl_->reactor.Run();
}

void EventLoop::Stop() {
    impl_->reactor.Stop();
}

size_t EventLoop::PendingTimers() const {
    return impl_->reactor.PendingTimers();
}

EventLoop::operator IEventLoop&() {
    return impl_->reactor;
}

EventLoop::operator const IEventLoop&() const {
    return impl_->reactor;
}

}  // namespace wme_pipe
