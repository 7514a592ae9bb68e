// SPDX-License-Identifier: MIT

// src/realtime_client.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <rapidjson/document.h>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_client.hpp"
#include "src/entry_sink.hpp"
#include "src/http_fetcher.hpp"
#include "src/rate_limiter.hpp"
#include "src/request.hpp"
#include "src/retry_policy.hpp"

namespace wme_pipe {

enum class StreamState {
    Disconnected,
    Connecting,
    Streaming,
    Draining,
    Closed,
    Failed,
};

constexpr std::string_view stream_state_name(StreamState s) {
    switch (s) {
        case StreamState::Disconnected: return "disconnected";
        case StreamState::Connecting: return "connecting";
        case StreamState::Streaming: return "streaming";
        case StreamState::Draining: return "draining";
        case StreamState::Closed: return "closed";
        case StreamState::Failed: return "failed";
    }
    return "unknown";
}

enum class StreamDecision { Continue, Stop };

/// One decoded push event. Partition and offset come from the payload's
/// "event" object when the server includes them.
struct StreamEvent {
    uint64_t sequence = 0;          ///< 1-based dispatch count, across reconnects
    std::string raw;
    rapidjson::Document document;
    std::optional<int> partition;
    std::optional<int64_t> offset;
};

/// Last dispatched offset per partition.
///
/// Serialized as "partition:offset" pairs joined by commas, e.g. "0:1520,3:88".
class ResumeCursor {
public:
    /// Record an offset; a partition never moves backwards.
    void Advance(int partition, int64_t offset);

    bool Empty() const { return positions_.empty(); }
    const std::map<int, int64_t>& Positions() const { return positions_; }

    /// Offsets to request on reconnect: one past each recorded position.
    std::map<int, int64_t> NextOffsets() const;

    std::string Serialize() const;
    static std::expected<ResumeCursor, Error> Parse(std::string_view token);

    bool operator==(const ResumeCursor&) const = default;

private:
    std::map<int, int64_t> positions_;
};

enum class OutcomeKind {
    Stopped,           ///< Predicate or caller asked to stop
    PredicateFailed,   ///< Predicate threw; error holds what it threw
    Exhausted,         ///< Reconnect budget used up
    Failed,            ///< Unrecoverable error (auth, 4xx, corrupt stream)
};

constexpr std::string_view outcome_kind_name(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::Stopped: return "stopped";
        case OutcomeKind::PredicateFailed: return "predicate_failed";
        case OutcomeKind::Exhausted: return "exhausted";
        case OutcomeKind::Failed: return "failed";
    }
    return "unknown";
}

struct StreamOutcome {
    OutcomeKind kind = OutcomeKind::Stopped;
    std::optional<Error> error;
    uint64_t dispatched = 0;
    ResumeCursor cursor;
};

struct StreamOptions {
    Request request = {};
    RetryConfig reconnect = RetryConfig::StreamDefaults();
    size_t max_line_size = 20 * 1024 * 1024;
    std::optional<ResumeCursor> resume_from = {};
};

// RealtimeClient - one long-lived push stream and the predicate that consumes it.
//
// Chains per connection: IHttpExchange -> StreamDecompressor -> NdjsonParser -> EntrySink
//
// Disconnected -> Connecting -> Streaming -> Draining -> Closed, with Failed
// reachable from Connecting and Streaming. Each event is handed to the
// predicate in arrival order; Stop (or a throw) moves to Draining, where the
// current read finishes but nothing more is dispatched. The connection and
// decoder state are released before the outcome callback runs.
//
// A transport failure reconnects with backoff, asking for one past the last
// dispatched offset of each partition. The reconnect budget starts over once
// a reconnected stream delivers an event. Malformed lines are logged and
// skipped.
//
// Thread safety: Not thread-safe. Start() and Stop() must be called from the
// event loop thread; the predicate and outcome callback run there too.
class RealtimeClient : public std::enable_shared_from_this<RealtimeClient> {
public:
    using Predicate = std::function<StreamDecision(const StreamEvent&)>;
    using OutcomeCallback = std::function<void(const StreamOutcome&)>;
    /// Turns the payload into a complete request (URL, headers, token).
    using RequestBuilder = std::function<std::expected<HttpRequest, Error>(const Request&)>;

    /// `fetcher` and `limiter` (may be null) must outlive the client.
    static std::shared_ptr<RealtimeClient> Create(IEventLoop& loop,
                                                  IHttpFetcher& fetcher,
                                                  RateLimiter* limiter,
                                                  RequestBuilder build,
                                                  StreamOptions options,
                                                  Predicate predicate,
                                                  OutcomeCallback on_outcome);

    RealtimeClient(const RealtimeClient&) = delete;
    RealtimeClient& operator=(const RealtimeClient&) = delete;

    void Start();

    /// External cancellation; same as the predicate returning Stop.
    void Stop();

    StreamState State() const { return state_; }
    uint64_t Dispatched() const { return dispatched_; }
    uint32_t Reconnects() const { return reconnects_; }
    const ResumeCursor& Cursor() const { return cursor_; }

    /// Decoders created for connections whose stages have not yet closed.
    uint32_t OpenDecoders() const { return open_decoders_; }

private:
    struct Connection;
    class ResponseBridge;

    RealtimeClient(IEventLoop& loop, IHttpFetcher& fetcher, RateLimiter* limiter,
                   RequestBuilder build, StreamOptions options, Predicate predicate,
                   OutcomeCallback on_outcome);

    void Connect();
    Request ResumePayload() const;

    void OnConnected(uint64_t gen, const HttpResponseHead& head);
    void OnBytes(uint64_t gen, BufferChain& body);
    void OnRecord(uint64_t gen, RecordResult&& record);
    void OnConnectionLost(uint64_t gen, Error e);

    void Dispatch(ArchiveEntry&& entry);
    void Finish(OutcomeKind kind, std::optional<Error> error);
    void RetireConnection(std::function<void()> then = nullptr);
    void SetState(StreamState s);

    IEventLoop& loop_;
    IHttpFetcher& fetcher_;
    RateLimiter* limiter_;
    RequestBuilder build_;
    StreamOptions options_;
    Predicate predicate_;
    OutcomeCallback on_outcome_;

    RetryPolicy reconnect_policy_;
    std::shared_ptr<Connection> connection_;
    ResumeCursor cursor_;
    std::string context_ = "stream";

    StreamState state_ = StreamState::Disconnected;
    uint64_t generation_ = 0;
    uint64_t dispatched_ = 0;
    uint32_t reconnects_ = 0;
    uint32_t open_decoders_ = 0;
    bool finishing_ = false;
};

}  // namespace wme_pipe
