// SPDX-License-Identifier: MIT

// lib/stream/tcp_socket.hpp
#pragma once

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <functional>
#include <memory>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/dns_resolver.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/segment_pool.hpp"

namespace wme_pipe {

// Non-blocking client socket feeding the first pipeline stage.
//
// Bytes read are handed to D in batches; D (or anything below it) pauses
// reading through Suspend()/Resume(). If D exposes SetWireWriter(), the
// socket becomes its outbound path: writes are queued until the kernel
// takes them.
template <Downstream D>
class TcpSocket : public Suspendable,
                  public std::enable_shared_from_this<TcpSocket<D>> {
public:
    static std::shared_ptr<TcpSocket> Create(IEventLoop& loop, std::shared_ptr<D> downstream) {
        struct MakeSharedEnabler : public TcpSocket {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds)
                : TcpSocket(l, std::move(ds)) {}
        };
        std::shared_ptr<TcpSocket> sock =
            std::make_shared<MakeSharedEnabler>(loop, std::move(downstream));
        sock->Attach();
        return sock;
    }

    ~TcpSocket() override { Close(); }

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    void OnConnect(std::function<void()> cb) { on_connect_ = std::move(cb); }

    void Connect(const Endpoint& endpoint) {
        assert(phase_ == Phase::Idle);
        int fd = ::socket(endpoint.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            Fail("socket", errno);
            return;
        }
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        if (::connect(fd, endpoint.data(), endpoint.length) != 0 && errno != EINPROGRESS) {
            int err = errno;
            ::close(fd);
            Fail("connect", err);
            return;
        }

        fd_ = fd;
        phase_ = Phase::Connecting;
        std::weak_ptr<TcpSocket> weak = this->weak_from_this();
        // Writability signals the end of a non-blocking connect
        watch_ = loop_.Register(fd_, {.read = false, .write = true}, IoHandlers{
            .on_readable = [weak]() { if (auto s = weak.lock()) s->ReadAvailable(); },
            .on_writable = [weak]() { if (auto s = weak.lock()) s->Writable(); },
            .on_failure = [weak](int err) { if (auto s = weak.lock()) s->Fail("socket", err); },
        });
        registered_ = {.read = false, .write = true};
    }

    void Write(BufferChain data) {
        if (phase_ == Phase::Idle || phase_ == Phase::Closed) return;
        outbox_.Splice(std::move(data));
        if (phase_ == Phase::Open) FlushOutbox();
    }

    // The descriptor is closed on the next turn so that closing from inside
    // one of our own callbacks never pulls the watch out from under it.
    void Close() override {
        if (phase_ == Phase::Closed) return;
        phase_ = Phase::Closed;
        outbox_.Clear();
        if (fd_ < 0) return;
        std::shared_ptr<IEventHandle> watch(std::move(watch_));
        loop_.Defer([watch, fd = fd_]() mutable {
            watch.reset();
            ::close(fd);
        });
        fd_ = -1;
    }

    void Suspend() override {
        if (pauses_++ == 0) Refresh();
    }

    void Resume() override {
        assert(pauses_ > 0);
        if (--pauses_ > 0) return;
        Refresh();
        // Edge triggered: data that arrived during the pause raised no event
        if (phase_ == Phase::Open) ReadAvailable();
    }

    bool IsSuspended() const override { return pauses_ > 0; }

    bool IsConnected() const { return phase_ == Phase::Open; }

private:
    enum class Phase { Idle, Connecting, Open, Closed };

    TcpSocket(IEventLoop& loop, std::shared_ptr<D> downstream)
        : loop_(loop), next_(std::move(downstream)) {}

    void Attach() {
        if constexpr (requires(D& d) { d.SetWireWriter(std::function<void(BufferChain)>{}); }) {
            std::weak_ptr<TcpSocket> weak = this->weak_from_this();
            next_->SetWireWriter([weak](BufferChain bytes) {
                if (auto s = weak.lock()) s->Write(std::move(bytes));
            });
        }
        if constexpr (requires(D& d, Suspendable* up) { d.SetUpstream(up); }) {
            next_->SetUpstream(this);
        }
    }

    void Fail(std::string_view call, int err) {
        if (phase_ == Phase::Closed) return;
        auto next = next_;
        Close();
        next->OnError(Error{ErrorCode::ConnectionFailed,
                            fmt::format("{}: {}", call, std::system_category().message(err)),
                            err});
    }

    void Refresh() {
        if (!watch_ || phase_ != Phase::Open) return;
        Interest want{.read = pauses_ == 0, .write = !outbox_.Empty()};
        if (want == registered_) return;
        watch_->Update(want);
        registered_ = want;
    }

    void Writable() {
        if (phase_ == Phase::Connecting) {
            int err = 0;
            socklen_t len = sizeof(err);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0) err = errno;
            if (err != 0) {
                Fail("connect", err);
                return;
            }
            phase_ = Phase::Open;
            Refresh();
            if (on_connect_) on_connect_();
            if (phase_ != Phase::Open) return;
        }
        FlushOutbox();
    }

    void FlushOutbox() {
        while (!outbox_.Empty()) {
            ssize_t sent = ::send(fd_, outbox_.DataAt(0), outbox_.ContiguousSize(), MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                Fail("send", errno);
                return;
            }
            outbox_.Consume(static_cast<size_t>(sent));
        }
        Refresh();
    }

    void ReadAvailable() {
        BufferChain batch;
        batch.SetRecycleCallback(segments_.Recycler());
        auto hand_over = [this, &batch]() {
            if (!batch.Empty()) next_->OnData(batch);
        };

        while (phase_ == Phase::Open && pauses_ == 0) {
            auto seg = segments_.Acquire();
            ssize_t got = ::recv(fd_, seg->data.data(), Segment::kSize, 0);
            if (got > 0) {
                seg->size = static_cast<size_t>(got);
                batch.Append(std::move(seg));
                if (batch.Size() >= kBatchBytes) hand_over();
                continue;
            }
            if (got == 0) {
                hand_over();
                if (phase_ == Phase::Open) next_->OnDone();
                return;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            int err = errno;
            hand_over();
            Fail("recv", err);
            return;
        }
        hand_over();
    }

    static constexpr size_t kBatchBytes = 4 * Segment::kSize;

    IEventLoop& loop_;
    std::shared_ptr<D> next_;
    std::unique_ptr<IEventHandle> watch_;
    Interest registered_;
    int fd_ = -1;
    Phase phase_ = Phase::Idle;
    int pauses_ = 0;
    BufferChain outbox_;
    SegmentPool segments_;
    std::function<void()> on_connect_;
};

}  // namespace wme_pipe
