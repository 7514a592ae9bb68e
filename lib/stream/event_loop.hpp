// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace wme_pipe {

// Which readiness events a registered descriptor wants
struct Interest {
    bool read = false;
    bool write = false;

    bool operator==(const Interest&) const = default;
};

// What the loop calls for a registered descriptor. on_failure gets the
// pending socket error (SO_ERROR) when the peer hangs up or the socket
// fails; no read or write callback follows it in the same wakeup.
struct IoHandlers {
    std::function<void()> on_readable;
    std::function<void()> on_writable;
    std::function<void(int error_code)> on_failure;
};

// A descriptor's membership in a loop; it leaves the loop with the handle.
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    virtual void Update(Interest interest) = 0;
    virtual int fd() const = 0;
};

// The single-threaded reactor every connection, retry and rate limiter
// wait runs on. Callers that already own a loop can implement this and
// hand it to ApiClient::Create.
class IEventLoop {
public:
    using Task = std::function<void()>;

    virtual ~IEventLoop() = default;

    virtual std::unique_ptr<IEventHandle> Register(int fd, Interest interest,
                                                   IoHandlers handlers) = 0;

    // Runs `task` after the current callback has returned, in queue order.
    // Work queued by a deferred task waits for the following turn.
    virtual void Defer(Task task) = 0;

    // Runs `task` once, `delay` or later from now
    virtual void Schedule(std::chrono::milliseconds delay, Task task) = 0;

    virtual bool IsInEventLoopThread() const = 0;
};

/// Owning handle on the default reactor, usable wherever an IEventLoop& is
/// expected.
///
///   EventLoop loop;
///   auto client = ApiClient::Create(loop, ClientConfig{}, tokens);
///   client->GetProjects({}, on_projects);
///   loop.Run();
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // One turn, waiting at most timeout_ms for I/O (-1 waits indefinitely)
    void Poll(int timeout_ms = -1);

    void Run();
    void Stop();

    size_t PendingTimers() const;

    operator IEventLoop&();
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace wme_pipe
