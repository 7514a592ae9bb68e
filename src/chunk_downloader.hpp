// SPDX-License-Identifier: MIT

// src/chunk_downloader.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/http_fetcher.hpp"
#include "src/log.hpp"
#include "src/range_planner.hpp"
#include "src/rate_limiter.hpp"
#include "src/resource.hpp"
#include "src/response_handlers.hpp"
#include "src/retry_policy.hpp"

namespace wme_pipe {

struct DownloadOptions {
    uint64_t chunk_size = 0;       ///< 0 = one range for the whole resource
    uint32_t concurrency = 10;     ///< Hard cap on in-flight range fetches
    RetryConfig retry = RetryConfig::DownloadDefaults();
};

// Collects one ranged response. Only a 206 for exactly the requested
// slice is accepted.
class RangeHandler : public IResponseHandler {
public:
    using Callback = std::function<void(std::expected<BufferChain, Error>)>;

    RangeHandler(ByteRange range, Callback on_complete)
        : range_(range), on_complete_(std::move(on_complete)) {}

    void OnHead(const HttpResponseHead& head) override {
        if (head.status != 206) {
            Complete(std::unexpected(Error{ErrorCode::RangeNotSatisfiable,
                fmt::format("server ignored Range header (HTTP {})", head.status)}));
            return;
        }
        if (auto cr = head.Header("content-range")) {
            auto start = ContentRangeStart(*cr);
            if (start && *start != range_.start) {
                Complete(std::unexpected(Error{ErrorCode::RangeNotSatisfiable,
                    fmt::format("server returned range starting at {}", *start)}));
            }
        }
    }

    void OnBody(BufferChain& body) override {
        if (!on_complete_) {
            body.Consume(body.Size());
            return;
        }
        if (bytes_.Size() + body.Size() > range_.Length()) {
            body.Consume(body.Size());
            Complete(std::unexpected(Error{ErrorCode::HttpError,
                fmt::format("server sent more than the {} bytes requested", range_.Length())}));
            return;
        }
        bytes_.Splice(std::move(body));
    }

    void OnError(const Error& e) override { Complete(std::unexpected(e)); }

    void OnDone() override {
        if (bytes_.Size() != range_.Length()) {
            Complete(std::unexpected(Error{ErrorCode::ConnectionClosed,
                fmt::format("short body: got {} of {} bytes", bytes_.Size(), range_.Length())}));
            return;
        }
        Complete(std::move(bytes_));
    }

private:
    void Complete(std::expected<BufferChain, Error> result) {
        if (auto cb = std::exchange(on_complete_, nullptr)) cb(std::move(result));
    }

    ByteRange range_;
    Callback on_complete_;
    BufferChain bytes_;
};

// ChunkDownloader - head of a pipeline that turns one resource into an
// ordered byte stream.
//
// With a known size and ranged access the resource is split by PlanRanges()
// and fetched by at most `concurrency` workers. Each worker holds its range
// through rate limiting, retries and backoff, and writes its body into that
// range's slot exactly once. Nothing reaches the downstream until every slot
// is filled; the slots then drain in resource order. The first range that
// fails for good cancels its siblings and ends the job with an error naming
// the range.
//
// Without a known size (and no usable HEAD answer) or with a single range,
// the body streams straight through; a transient failure mid-body resumes
// with "Range: bytes=<emitted>-".
//
// Data flow: IHttpFetcher -> ChunkDownloader -> Downstream
// Backpressure: Downstream -> ChunkDownloader (via Suspend/Resume)
template <Downstream D>
class ChunkDownloader : public PipelineComponent<ChunkDownloader<D>, D>,
                        public std::enable_shared_from_this<ChunkDownloader<D>> {
    using Base = PipelineComponent<ChunkDownloader<D>, D>;

public:
    using Abort = std::function<void()>;

    static std::shared_ptr<ChunkDownloader> Create(IEventLoop& loop,
                                                   std::shared_ptr<D> downstream,
                                                   IHttpFetcher& fetcher,
                                                   RateLimiter* limiter,
                                                   ResourceDescriptor resource,
                                                   DownloadOptions options,
                                                   RequestFactory make_request) {
        struct MakeSharedEnabler : public ChunkDownloader {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds, IHttpFetcher& f,
                              RateLimiter* rl, ResourceDescriptor r, DownloadOptions o,
                              RequestFactory m)
                : ChunkDownloader(l, std::move(ds), f, rl, std::move(r), std::move(o),
                                  std::move(m)) {}
        };
        auto dl = std::make_shared<MakeSharedEnabler>(loop, std::move(downstream), fetcher,
                                                      limiter, std::move(resource),
                                                      std::move(options), std::move(make_request));
        if constexpr (requires(D& d) { d.SetUpstream(static_cast<Suspendable*>(nullptr)); }) {
            dl->GetDownstream().SetUpstream(dl.get());
        }
        return dl;
    }

    // Probe the size if needed, then fetch.
    void Start() {
        if (started_ || this->IsClosed()) return;
        started_ = true;
        if (resource_.size) {
            BeginTransfer(resource_.size, true);
        } else {
            ProbeSize();
        }
    }

    // Stop every worker; the downstream sees ErrorCode::Cancelled.
    void Cancel() {
        Fail(Error{ErrorCode::Cancelled, fmt::format("download of {} cancelled", resource_.url)});
    }

    void Suspend() override {
        Base::Suspend();
        SuspendStream();
    }

    // =========================================================================
    // PipelineComponent hooks
    // =========================================================================


    void DoClose() {
        CancelAll();
        slots_.clear();
        out_.Clear();
        stream_exchange_.reset();
        this->ResetDownstream();
    }

    void ResumeWork() {
        if (sequential_) {
            if (stream_suspended_ && stream_exchange_ && stream_exchange_->exchange) {
                stream_suspended_ = false;
                stream_exchange_->exchange->Resume();
            }
            return;
        }
        if (draining_) DrainSlots();
    }

    void ReleaseHeldDone() { ResumeWork(); }

    // =========================================================================
    // Introspection
    // =========================================================================

    const std::vector<ByteRange>& Plan() const { return plan_; }
    bool IsSequential() const { return sequential_; }
    bool IsFinished() const { return terminal_; }
    size_t InFlight() const { return in_flight_; }
    size_t PeakInFlight() const { return peak_in_flight_; }
    uint64_t BytesEmitted() const { return emitted_; }
    const std::optional<ResourceInfo>& ProbedInfo() const { return probed_; }

private:
    ChunkDownloader(IEventLoop& loop, std::shared_ptr<D> downstream, IHttpFetcher& fetcher,
                    RateLimiter* limiter, ResourceDescriptor resource, DownloadOptions options,
                    RequestFactory make_request)
        : Base(loop),
          fetcher_(fetcher),
          limiter_(limiter),
          resource_(std::move(resource)),
          options_(std::move(options)),
          make_request_(std::move(make_request)) {
        options_.concurrency = std::max<uint32_t>(options_.concurrency, 1);
        this->SetDownstream(std::move(downstream));
        out_.SetRecycleCallback(this->Segments().Recycler());
    }

    // Open one request through the limiter, shaped by `shape`.
    template <typename Shape>
    std::shared_ptr<PendingExchange> Open(Shape shape,
                                          std::shared_ptr<IResponseHandler> handler,
                                          std::function<void(Error)> fail) {
        RequestFactory build = [make = make_request_, shape = std::move(shape)]()
            -> std::expected<HttpRequest, Error> {
            auto request = make();
            if (!request) return request;
            shape(*request);
            return request;
        };
        return OpenGated(this->loop_, fetcher_, limiter_, std::move(build),
                         std::move(handler), std::move(fail));
    }

    void ProbeSize() {
        std::weak_ptr<ChunkDownloader> weak = this->weak_from_this();
        head_op_ = RetryingOperation<ResourceInfo>::Start(
            this->loop_, options_.retry, fmt::format("HEAD {}", resource_.url),
            [weak](uint32_t, RetryingOperation<ResourceInfo>::Callback done) -> Abort {
                auto self = weak.lock();
                if (!self) return {};
                auto handler = std::make_shared<BufferedResponseHandler>(
                    [done](std::expected<BufferedResponse, Error> r) {
                        if (!r) {
                            done(std::unexpected(std::move(r.error())));
                            return;
                        }
                        done(ResourceInfoFromHead(r->head));
                    },
                    kMaxHeadBody);
                auto pending = self->Open([](HttpRequest& req) { req.method = "HEAD"; },
                                          handler,
                                          [done](Error e) { done(std::unexpected(std::move(e))); });
                return [pending]() { pending->Abort(); };
            },
            [weak](std::expected<ResourceInfo, Error> r) {
                if (auto self = weak.lock()) self->OnProbed(std::move(r));
            });
    }

    void OnProbed(std::expected<ResourceInfo, Error> r) {
        if (terminal_) return;
        if (!r) {
            Fail(std::move(r.error()));
            return;
        }
        probed_ = *r;
        bool ranged = r->content_length.has_value() && r->accept_ranges;
        if (!ranged) {
            WME_LOG_INFO("{}: no ranged access advertised, fetching sequentially", resource_.url);
        }
        BeginTransfer(r->content_length, ranged);
    }

    void BeginTransfer(std::optional<uint64_t> size, bool ranged) {
        total_size_ = size;
        plan_ = ranged ? PlanRanges(size, options_.chunk_size) : PlanRanges(std::nullopt, 0);
        if (plan_.empty()) {
            terminal_ = true;
            this->EmitDone();
            this->RequestClose();
            return;
        }
        if (plan_.size() == 1) {
            sequential_ = true;
            StartStream();
            return;
        }
        WME_LOG_DEBUG("{}: {} ranges, concurrency {}", resource_.url, plan_.size(),
                      options_.concurrency);
        slots_.resize(plan_.size());
        ops_.resize(plan_.size());
        LaunchMore();
    }

    // =========================================================================
    // Parallel ranges
    // =========================================================================

    void LaunchMore() {
        while (!terminal_ && in_flight_ < options_.concurrency && next_launch_ < plan_.size()) {
            LaunchChunk(next_launch_++);
        }
    }

    void LaunchChunk(size_t index) {
        ++in_flight_;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight_);

        ByteRange range = plan_[index];
        std::weak_ptr<ChunkDownloader> weak = this->weak_from_this();
        auto op = RetryingOperation<ChunkResult>::Start(
            this->loop_, options_.retry,
            fmt::format("chunk {} {} of {}", index, range, resource_.url),
            [weak, range](uint32_t attempt, RetryingOperation<ChunkResult>::Callback done) -> Abort {
                auto self = weak.lock();
                if (!self) return {};
                auto handler = std::make_shared<RangeHandler>(
                    range, [done, range, attempt](std::expected<BufferChain, Error> r) {
                        if (!r) {
                            done(std::unexpected(std::move(r.error())));
                            return;
                        }
                        done(ChunkResult{range, std::move(*r), attempt});
                    });
                auto pending = self->Open([range](HttpRequest& req) { req.range = range; },
                                          handler,
                                          [done](Error e) { done(std::unexpected(std::move(e))); });
                return [pending]() { pending->Abort(); };
            },
            [weak, index](std::expected<ChunkResult, Error> r) {
                if (auto self = weak.lock()) self->OnChunkDone(index, std::move(r));
            });
        // A synchronous failure may already have ended the job
        if (!terminal_) ops_[index] = std::move(op);
    }

    void OnChunkDone(size_t index, std::expected<ChunkResult, Error> r) {
        --in_flight_;
        if (terminal_) return;
        if (!r) {
            Fail(std::move(r.error()));
            return;
        }
        if (slots_[index]) {
            Fail(Error{ErrorCode::InvalidState,
                       fmt::format("chunk {} of {} completed twice", index, resource_.url)});
            return;
        }
        slots_[index] = std::move(*r);
        if (++completed_ == plan_.size()) {
            DrainSlots();
            return;
        }
        LaunchMore();
    }

    // In resource order; stops while the downstream is suspended.
    void DrainSlots() {
        auto guard = this->Enter();
        if (!guard) return;
        draining_ = true;

        while (true) {
            if (out_.Empty()) {
                if (next_emit_ == slots_.size()) break;
                auto& slot = slots_[next_emit_++];
                out_.Splice(std::move(slot->bytes));
                slot.reset();
                continue;
            }
            size_t before = out_.Size();
            bool suspended = this->PassDown(out_);
            emitted_ += before - out_.Size();
            if (terminal_ || suspended) return;  // cancelled from inside OnData
            if (!out_.Empty()) {
                Fail(Error{ErrorCode::InvalidState,
                    fmt::format("downstream left {} bytes unconsumed", out_.Size())});
                return;
            }
        }
        terminal_ = true;
        this->EmitDone();
        this->RequestClose();
    }

    // =========================================================================
    // Sequential stream
    // =========================================================================

    // Forwards body bytes as they arrive.
    class StreamHandler : public IResponseHandler {
    public:
        using Callback = RetryingOperation<uint64_t>::Callback;

        StreamHandler(std::weak_ptr<ChunkDownloader> owner, uint64_t offset, Callback done)
            : owner_(std::move(owner)), offset_(offset), done_(std::move(done)) {}

        void OnHead(const HttpResponseHead& head) override {
            if (offset_ == 0) return;
            if (head.status != 206) {
                Complete(std::unexpected(Error{ErrorCode::RangeNotSatisfiable,
                    fmt::format("cannot resume at byte {}: server ignored Range (HTTP {})",
                                offset_, head.status)}));
                return;
            }
            if (auto cr = head.Header("content-range")) {
                auto start = ContentRangeStart(*cr);
                if (start && *start != offset_) {
                    Complete(std::unexpected(Error{ErrorCode::RangeNotSatisfiable,
                        fmt::format("resumed at byte {} instead of {}", *start, offset_)}));
                }
            }
        }

        void OnBody(BufferChain& body) override {
            auto owner = owner_.lock();
            if (!done_ || !owner || owner->terminal_) {
                body.Consume(body.Size());
                return;
            }
            if (owner->IsSuspended()) {
                owner->SuspendStream();
                return;
            }
            size_t before = body.Size();
            bool suspended = owner->PassDown(body);
            owner->emitted_ += before - body.Size();
            if (owner->terminal_) {
                body.Consume(body.Size());
                return;
            }
            if (suspended) {
                owner->SuspendStream();
                return;
            }
            if (!body.Empty()) {
                size_t left = body.Size();
                body.Consume(left);
                Complete(std::unexpected(Error{ErrorCode::InvalidState,
                    fmt::format("downstream left {} bytes unconsumed", left)}));
            }
        }

        void OnError(const Error& e) override { Complete(std::unexpected(e)); }

        void OnDone() override {
            auto owner = owner_.lock();
            if (!owner) return;
            if (owner->total_size_ && owner->emitted_ != *owner->total_size_) {
                Complete(std::unexpected(Error{ErrorCode::ConnectionClosed,
                    fmt::format("short body: got {} of {} bytes", owner->emitted_,
                                *owner->total_size_)}));
                return;
            }
            Complete(owner->emitted_);
        }

    private:
        void Complete(std::expected<uint64_t, Error> result) {
            if (auto cb = std::exchange(done_, nullptr)) cb(std::move(result));
        }

        std::weak_ptr<ChunkDownloader> owner_;
        uint64_t offset_;
        Callback done_;
    };

    void StartStream() {
        std::weak_ptr<ChunkDownloader> weak = this->weak_from_this();
        stream_op_ = RetryingOperation<uint64_t>::Start(
            this->loop_, options_.retry, fmt::format("download of {}", resource_.url),
            [weak](uint32_t, RetryingOperation<uint64_t>::Callback done) -> Abort {
                auto self = weak.lock();
                if (!self) return {};
                uint64_t offset = self->emitted_;
                if (offset > 0) {
                    WME_LOG_INFO("{}: resuming at byte {}", self->resource_.url, offset);
                }
                auto handler = std::make_shared<StreamHandler>(weak, offset, done);
                auto pending = self->Open(
                    [offset](HttpRequest& req) {
                        if (offset > 0) req.range = ByteRange{offset, std::nullopt};
                    },
                    handler,
                    [done](Error e) { done(std::unexpected(std::move(e))); });
                self->stream_exchange_ = pending;
                self->stream_suspended_ = false;
                return [pending]() { pending->Abort(); };
            },
            [weak](std::expected<uint64_t, Error> r) {
                if (auto self = weak.lock()) self->OnStreamDone(std::move(r));
            });
    }

    void OnStreamDone(std::expected<uint64_t, Error> r) {
        if (terminal_) return;
        stream_exchange_.reset();
        if (!r) {
            Fail(std::move(r.error()));
            return;
        }
        terminal_ = true;
        this->EmitDone();
        this->RequestClose();
    }

    void SuspendStream() {
        if (!sequential_ || stream_suspended_ || !stream_exchange_ || !stream_exchange_->exchange) {
            return;
        }
        stream_suspended_ = true;
        stream_exchange_->exchange->Suspend();
    }

    // =========================================================================
    // Termination
    // =========================================================================

    void Fail(Error e) {
        if (terminal_) return;
        terminal_ = true;
        CancelAll();
        slots_.clear();
        out_.Clear();
        this->EmitError(e);
        this->RequestClose();
    }

    void CancelAll() {
        if (head_op_) head_op_->Cancel();
        if (stream_op_) stream_op_->Cancel();
        for (auto& op : ops_) {
            if (op) op->Cancel();
        }
    }

    static constexpr size_t kMaxHeadBody = 64 * 1024;

    IHttpFetcher& fetcher_;
    RateLimiter* limiter_;
    ResourceDescriptor resource_;
    DownloadOptions options_;
    RequestFactory make_request_;

    std::optional<uint64_t> total_size_;
    std::optional<ResourceInfo> probed_;
    std::vector<ByteRange> plan_;

    // One write-once slot per range; filled by workers, drained in order
    std::vector<std::optional<ChunkResult>> slots_;
    std::vector<std::shared_ptr<RetryingOperation<ChunkResult>>> ops_;
    std::shared_ptr<RetryingOperation<ResourceInfo>> head_op_;
    std::shared_ptr<RetryingOperation<uint64_t>> stream_op_;
    std::shared_ptr<PendingExchange> stream_exchange_;

    BufferChain out_;
    size_t next_launch_ = 0;
    size_t next_emit_ = 0;
    size_t completed_ = 0;
    size_t in_flight_ = 0;
    size_t peak_in_flight_ = 0;
    uint64_t emitted_ = 0;

    bool started_ = false;
    bool sequential_ = false;
    bool draining_ = false;
    bool stream_suspended_ = false;
    bool terminal_ = false;
};

}  // namespace wme_pipe
