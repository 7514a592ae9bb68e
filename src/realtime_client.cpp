// SPDX-License-Identifier: MIT

// src/realtime_client.cpp
#include "src/realtime_client.hpp"

#include <charconv>
#include <exception>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/codec.hpp"
#include "lib/stream/decompressor.hpp"
#include "src/log.hpp"
#include "src/ndjson_parser.hpp"
#include "src/tar_reader.hpp"

namespace wme_pipe {

// ============================================================================
// ResumeCursor
// ============================================================================

void ResumeCursor::Advance(int partition, int64_t offset) {
    auto [it, inserted] = positions_.try_emplace(partition, offset);
    if (!inserted && offset > it->second) it->second = offset;
}

std::map<int, int64_t> ResumeCursor::NextOffsets() const {
    std::map<int, int64_t> next;
    for (const auto& [partition, offset] : positions_) next.emplace(partition, offset + 1);
    return next;
}

std::string ResumeCursor::Serialize() const {
    std::string out;
    for (const auto& [partition, offset] : positions_) {
        if (!out.empty()) out.push_back(',');
        fmt::format_to(std::back_inserter(out), "{}:{}", partition, offset);
    }
    return out;
}

std::expected<ResumeCursor, Error> ResumeCursor::Parse(std::string_view token) {
    ResumeCursor cursor;
    auto invalid = [&token](std::string_view why) {
        return std::unexpected(Error{ErrorCode::ValidationError,
            fmt::format("invalid resume cursor '{}': {}", token, why)});
    };

    std::string_view rest = token;
    while (!rest.empty()) {
        size_t comma = rest.find(',');
        std::string_view pair = rest.substr(0, comma);
        if (comma == std::string_view::npos) {
            rest = {};
        } else {
            rest = rest.substr(comma + 1);
            if (rest.empty()) return invalid("trailing ','");
        }

        size_t colon = pair.find(':');
        if (colon == std::string_view::npos) return invalid("missing ':'");

        int partition = 0;
        int64_t offset = 0;
        const char* p_end = pair.data() + colon;
        auto [p_ptr, p_ec] = std::from_chars(pair.data(), p_end, partition);
        if (p_ec != std::errc{} || p_ptr != p_end) return invalid("bad partition");

        const char* o_begin = pair.data() + colon + 1;
        const char* o_end = pair.data() + pair.size();
        auto [o_ptr, o_ec] = std::from_chars(o_begin, o_end, offset);
        if (o_ec != std::errc{} || o_ptr != o_end || o_begin == o_end) return invalid("bad offset");

        cursor.Advance(partition, offset);
    }
    return cursor;
}

// ============================================================================
// Connection plumbing
// ============================================================================

namespace {

using Parser = NdjsonParser<EntrySink>;
using Decompressor = StreamDecompressor<Parser>;

std::optional<int> ReadPartition(const rapidjson::Value& event) {
    auto it = event.FindMember("partition");
    if (it == event.MemberEnd() || !it->value.IsInt()) return std::nullopt;
    return it->value.GetInt();
}

std::optional<int64_t> ReadOffset(const rapidjson::Value& event) {
    auto it = event.FindMember("offset");
    if (it == event.MemberEnd() || !it->value.IsInt64()) return std::nullopt;
    return it->value.GetInt64();
}

}  // namespace

struct RealtimeClient::Connection {
    uint64_t generation = 0;
    std::shared_ptr<PendingExchange> pending;
    std::shared_ptr<EntrySink> sink;
    std::shared_ptr<Parser> parser;
    std::shared_ptr<Decompressor> decompressor;
};

// Routes exchange callbacks to the client, tagged with the connection they
// belong to so a retired connection cannot touch the current one.
class RealtimeClient::ResponseBridge : public IResponseHandler {
public:
    ResponseBridge(std::weak_ptr<RealtimeClient> client, uint64_t gen)
        : client_(std::move(client)), gen_(gen) {}

    void OnHead(const HttpResponseHead& head) override {
        if (auto c = client_.lock()) c->OnConnected(gen_, head);
    }

    void OnBody(BufferChain& body) override {
        if (auto c = client_.lock()) {
            c->OnBytes(gen_, body);
        } else {
            body.Consume(body.Size());
        }
    }

    void OnError(const Error& e) override {
        if (auto c = client_.lock()) c->OnConnectionLost(gen_, e);
    }

    void OnDone() override {
        if (auto c = client_.lock()) {
            c->OnConnectionLost(gen_, Error{ErrorCode::ConnectionClosed, "server ended the stream"});
        }
    }

private:
    std::weak_ptr<RealtimeClient> client_;
    uint64_t gen_;
};

// ============================================================================
// RealtimeClient
// ============================================================================

std::shared_ptr<RealtimeClient> RealtimeClient::Create(IEventLoop& loop,
                                                       IHttpFetcher& fetcher,
                                                       RateLimiter* limiter,
                                                       RequestBuilder build,
                                                       StreamOptions options,
                                                       Predicate predicate,
                                                       OutcomeCallback on_outcome) {
    struct MakeSharedEnabler : public RealtimeClient {
        MakeSharedEnabler(IEventLoop& l, IHttpFetcher& f, RateLimiter* rl, RequestBuilder b,
                          StreamOptions o, Predicate p, OutcomeCallback cb)
            : RealtimeClient(l, f, rl, std::move(b), std::move(o), std::move(p),
                             std::move(cb)) {}
    };
    return std::make_shared<MakeSharedEnabler>(loop, fetcher, limiter, std::move(build),
                                               std::move(options), std::move(predicate),
                                               std::move(on_outcome));
}

RealtimeClient::RealtimeClient(IEventLoop& loop, IHttpFetcher& fetcher, RateLimiter* limiter,
                               RequestBuilder build, StreamOptions options, Predicate predicate,
                               OutcomeCallback on_outcome)
    : loop_(loop),
      fetcher_(fetcher),
      limiter_(limiter),
      build_(std::move(build)),
      options_(std::move(options)),
      predicate_(std::move(predicate)),
      on_outcome_(std::move(on_outcome)),
      reconnect_policy_(options_.reconnect) {
    if (options_.resume_from) cursor_ = *options_.resume_from;
}

void RealtimeClient::Start() {
    if (state_ != StreamState::Disconnected || finishing_) return;
    Connect();
}

void RealtimeClient::Stop() {
    if (finishing_ || state_ == StreamState::Closed || state_ == StreamState::Failed) return;
    Finish(OutcomeKind::Stopped, std::nullopt);
}

void RealtimeClient::SetState(StreamState s) {
    if (state_ == s) return;
    WME_LOG_DEBUG("{}: {} -> {}", context_, stream_state_name(state_), stream_state_name(s));
    state_ = s;
}

Request RealtimeClient::ResumePayload() const {
    Request payload = options_.request;
    // Partitions the cursor has not reached keep whatever the caller asked for
    for (const auto& [partition, next] : cursor_.NextOffsets()) {
        payload.offsets[partition] = next;
        payload.since_per_partition.erase(partition);
    }
    return payload;
}

void RealtimeClient::Connect() {
    if (finishing_) return;
    SetState(StreamState::Connecting);

    uint64_t gen = ++generation_;
    connection_ = std::make_shared<Connection>();
    connection_->generation = gen;

    std::weak_ptr<RealtimeClient> weak = weak_from_this();
    RequestFactory factory = [weak, build = build_, payload = ResumePayload()]()
        -> std::expected<HttpRequest, Error> {
        auto request = build(payload);
        if (request) {
            if (auto self = weak.lock()) self->context_ = fmt::format("stream {}", request->url);
        }
        return request;
    };

    auto pending = OpenGated(loop_, fetcher_, limiter_, std::move(factory),
                             std::make_shared<ResponseBridge>(weak, gen),
                             [weak, gen](Error e) {
                                 if (auto self = weak.lock()) self->OnConnectionLost(gen, std::move(e));
                             });

    // A synchronous failure may already have retired this connection
    if (connection_ && connection_->generation == gen) {
        connection_->pending = std::move(pending);
    } else {
        pending->Abort();
    }
}

void RealtimeClient::OnConnected(uint64_t gen, const HttpResponseHead& head) {
    if (gen != generation_ || finishing_ || !connection_) return;

    Codec codec = Codec::Identity;
    if (auto encoding = head.Header("content-encoding")) codec = CodecFromHint(*encoding);

    std::weak_ptr<RealtimeClient> weak = weak_from_this();
    auto& conn = *connection_;
    conn.sink = std::make_shared<EntrySink>(
        [weak, gen](RecordResult&& record) {
            if (auto self = weak.lock()) self->OnRecord(gen, std::move(record));
        },
        [weak, gen](const Error& e) {
            if (auto self = weak.lock()) self->OnConnectionLost(gen, e);
        },
        [weak, gen]() {
            if (auto self = weak.lock()) {
                self->OnConnectionLost(gen, Error{ErrorCode::ConnectionClosed,
                                                  "server ended the stream"});
            }
        });
    conn.parser = Parser::Create(loop_, conn.sink, options_.max_line_size);
    conn.parser->OnEntryBegin(TarEntryHeader{"stream", std::nullopt});
    conn.decompressor = Decompressor::Create(loop_, conn.parser, codec);
    ++open_decoders_;

    SetState(StreamState::Streaming);
}

void RealtimeClient::OnBytes(uint64_t gen, BufferChain& body) {
    if (gen != generation_ || finishing_ || !connection_ || !connection_->decompressor) {
        body.Consume(body.Size());
        return;
    }
    auto decompressor = connection_->decompressor;
    decompressor->OnData(body);
    // Nothing here suspends; whatever is left belongs to a retired connection
    if (!body.Empty()) body.Consume(body.Size());
}

void RealtimeClient::OnRecord(uint64_t gen, RecordResult&& record) {
    if (gen != generation_ || finishing_ || state_ != StreamState::Streaming) return;
    if (!record) {
        WME_LOG_WARN("{}: skipping malformed line: {}", context_, record.error().message);
        return;
    }
    Dispatch(std::move(*record));
}

void RealtimeClient::Dispatch(ArchiveEntry&& entry) {
    StreamEvent event;
    event.sequence = ++dispatched_;
    event.raw = std::move(entry.raw);
    event.document = std::move(entry.document);

    if (event.document.IsObject()) {
        auto it = event.document.FindMember("event");
        if (it != event.document.MemberEnd() && it->value.IsObject()) {
            event.partition = ReadPartition(it->value);
            event.offset = ReadOffset(it->value);
        }
    }
    if (event.partition && event.offset) cursor_.Advance(*event.partition, *event.offset);

    // A reconnected stream that delivers again earns a fresh budget
    if (reconnect_policy_.Attempts() > 0) reconnect_policy_.Reset();

    StreamDecision decision = StreamDecision::Continue;
    try {
        decision = predicate_(event);
    } catch (const std::exception& ex) {
        Finish(OutcomeKind::PredicateFailed,
               Error{ErrorCode::PredicateFailed,
                     fmt::format("{}: predicate threw on event {}: {}", context_,
                                 event.sequence, ex.what())});
        return;
    } catch (...) {
        Finish(OutcomeKind::PredicateFailed,
               Error{ErrorCode::PredicateFailed,
                     fmt::format("{}: predicate threw a non-standard exception on event {}",
                                 context_, event.sequence)});
        return;
    }
    if (decision == StreamDecision::Stop) Finish(OutcomeKind::Stopped, std::nullopt);
}

void RealtimeClient::OnConnectionLost(uint64_t gen, Error e) {
    if (gen != generation_ || finishing_) return;
    bool was_streaming = state_ == StreamState::Streaming;
    RetireConnection();

    if (!RetryPolicy::IsRetryable(e.code)) {
        Finish(OutcomeKind::Failed, WithContext(std::move(e), context_));
        return;
    }
    if (!reconnect_policy_.ShouldRetry()) {
        Finish(OutcomeKind::Exhausted,
               MakeRetriesExhausted(context_, reconnect_policy_.Attempts() + 1, std::move(e)));
        return;
    }

    auto delay = reconnect_policy_.GetNextDelay(e);
    reconnect_policy_.RecordAttempt();
    ++reconnects_;
    WME_LOG_WARN("{}: {} ({}), reconnecting in {} ms from {}", context_,
                 was_streaming ? "connection lost" : "connect failed", e.message, delay.count(),
                 cursor_.Empty() ? std::string("now") : cursor_.Serialize());
    SetState(StreamState::Connecting);

    std::weak_ptr<RealtimeClient> weak = weak_from_this();
    uint64_t scheduled_gen = generation_;
    loop_.Schedule(delay, [weak, scheduled_gen]() {
        auto self = weak.lock();
        if (self && !self->finishing_ && self->generation_ == scheduled_gen) self->Connect();
    });
}

// Detach the current connection now; tear it down on the next loop turn,
// outside any callback it may be running. `then` runs after every stage of
// the retired connection has closed.
void RealtimeClient::RetireConnection(std::function<void()> then) {
    ++generation_;
    auto conn = std::exchange(connection_, nullptr);
    if (conn) {
        if (conn->sink) conn->sink->Invalidate();
        if (conn->pending) conn->pending->aborted = true;
    }

    IEventLoop& loop = loop_;
    std::weak_ptr<RealtimeClient> weak = weak_from_this();
    loop.Defer([&loop, weak, conn, then = std::move(then)]() mutable {
        if (conn) {
            if (conn->pending && conn->pending->exchange) conn->pending->exchange->Cancel();
            if (conn->decompressor) conn->decompressor->RequestClose();
            if (conn->parser) conn->parser->RequestClose();
        }
        // Queued behind the DoClose calls scheduled above
        loop.Defer([weak, conn = std::move(conn), then = std::move(then)]() {
            if (conn && conn->decompressor && !conn->decompressor->HasDownstream()) {
                if (auto self = weak.lock()) --self->open_decoders_;
            }
            if (then) then();
        });
    });
}

void RealtimeClient::Finish(OutcomeKind kind, std::optional<Error> error) {
    if (finishing_) return;
    finishing_ = true;

    bool clean = kind == OutcomeKind::Stopped || kind == OutcomeKind::PredicateFailed;
    if (clean && state_ == StreamState::Streaming) SetState(StreamState::Draining);

    if (error) {
        if (clean) {
            WME_LOG_WARN("{}", error->message);
        } else {
            WME_LOG_ERROR("{}", error->message);
        }
    }

    StreamOutcome outcome{kind, std::move(error), dispatched_, cursor_};
    StreamState final_state = clean ? StreamState::Closed : StreamState::Failed;
    auto self = shared_from_this();
    RetireConnection([self, final_state, outcome = std::move(outcome)]() {
        self->SetState(final_state);
        self->predicate_ = nullptr;
        if (auto cb = std::exchange(self->on_outcome_, nullptr)) cb(outcome);
    });
}

}  // namespace wme_pipe
