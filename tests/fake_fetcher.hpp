// SPDX-License-Identifier: MIT

// tests/fake_fetcher.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_client.hpp"
#include "src/http_fetcher.hpp"

namespace wme_pipe::testing {

// What the fake server does with one request.
struct FakeResponse {
    enum class End { Done, Error, Hang };

    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers = {};
    std::vector<std::string> pieces = {};          // one OnBody per piece
    std::chrono::milliseconds latency{0};          // before the head
    std::optional<Error> transport_error = {};     // fail before any head
    std::optional<std::chrono::milliseconds> retry_after = {};
    End end = End::Done;
    Error end_error = Error{ErrorCode::ConnectionClosed, "connection reset mid-body"};

    static FakeResponse Ok(std::string body,
                           std::vector<std::pair<std::string, std::string>> headers = {}) {
        FakeResponse r;
        r.headers = std::move(headers);
        if (!body.empty()) r.pieces.push_back(std::move(body));
        return r;
    }

    static FakeResponse Status(int status) {
        FakeResponse r;
        r.status = status;
        return r;
    }

    static FakeResponse Fail(Error e) {
        FakeResponse r;
        r.transport_error = std::move(e);
        return r;
    }

    FakeResponse After(std::chrono::milliseconds d) && {
        latency = d;
        return std::move(*this);
    }
};

// Serve `content` the way a static file server with range support would:
// HEAD reports length and Accept-Ranges, a Range request gets a 206 slice.
inline FakeResponse ServeContent(const std::string& content, const HttpRequest& req,
                                 bool ranges = true, size_t piece_size = 64 * 1024) {
    FakeResponse r;
    if (req.method == "HEAD") {
        r.headers.emplace_back("content-length", std::to_string(content.size()));
        r.headers.emplace_back("etag", "\"v1\"");
        if (ranges) r.headers.emplace_back("accept-ranges", "bytes");
        return r;
    }
    size_t start = 0;
    size_t end = content.size();
    if (req.range && ranges) {
        start = static_cast<size_t>(req.range->start);
        if (req.range->end) end = std::min<size_t>(content.size(), *req.range->end + 1);
        r.status = 206;
        r.headers.emplace_back("content-range",
                               fmt::format("bytes {}-{}/{}", start, end - 1, content.size()));
    }
    r.headers.emplace_back("content-length", std::to_string(end - start));
    for (size_t pos = start; pos < end; pos += piece_size) {
        r.pieces.push_back(content.substr(pos, std::min(piece_size, end - pos)));
    }
    return r;
}

// In-process IHttpFetcher. Each Open() asks the responder what to do and
// plays it back on the event loop, honouring Suspend/Resume and Cancel.
class FakeFetcher : public IHttpFetcher {
public:
    using Responder = std::function<FakeResponse(const HttpRequest&)>;

    struct Stats {
        std::vector<HttpRequest> requests;
        size_t in_flight = 0;
        size_t peak_in_flight = 0;
        size_t cancelled = 0;
        size_t completed = 0;
    };

    FakeFetcher(IEventLoop& loop, Responder responder)
        : loop_(loop), responder_(std::move(responder)), stats_(std::make_shared<Stats>()) {}

    std::unique_ptr<IHttpExchange> Open(HttpRequest request,
                                        std::shared_ptr<IResponseHandler> handler) override {
        stats_->requests.push_back(request);
        ++stats_->in_flight;
        stats_->peak_in_flight = std::max(stats_->peak_in_flight, stats_->in_flight);

        auto call = std::make_shared<Call>(loop_, stats_, std::move(handler),
                                           responder_(request));
        auto latency = call->response.latency;
        if (latency.count() > 0) {
            loop_.Schedule(latency, [call]() { call->Pump(); });
        } else {
            loop_.Defer([call]() { call->Pump(); });
        }
        return std::make_unique<Exchange>(call);
    }

    void SetResponder(Responder r) { responder_ = std::move(r); }

    std::shared_ptr<Stats> GetStats() const { return stats_; }
    const std::vector<HttpRequest>& Requests() const { return stats_->requests; }

private:
    struct Call {
        Call(IEventLoop& l, std::shared_ptr<Stats> s, std::shared_ptr<IResponseHandler> h,
             FakeResponse r)
            : loop(l), stats(std::move(s)), handler(std::move(h)), response(std::move(r)) {}

        void Pump() {
            if (closed) return;
            if (!started) {
                started = true;
                if (response.transport_error) {
                    auto e = *response.transport_error;
                    Close(false);
                    handler->OnError(e);
                    return;
                }
                if (response.status >= 300) {
                    Error e{StatusToErrorCode(response.status),
                            fmt::format("HTTP {}", response.status), 0, response.retry_after};
                    Close(false);
                    handler->OnError(e);
                    return;
                }
                HttpResponseHead head;
                head.status = response.status;
                head.headers = response.headers;
                handler->OnHead(head);
                if (closed) return;
            }

            while (!closed && suspended == 0) {
                if (pending.Empty()) {
                    if (next_piece == response.pieces.size()) break;
                    pending.AppendBytes(response.pieces[next_piece++]);
                }
                handler->OnBody(pending);
                if (closed || suspended > 0) return;
                // Handlers must take everything unless they suspend
                if (!pending.Empty()) pending.Clear();
            }
            if (closed || suspended > 0) return;

            switch (response.end) {
                case FakeResponse::End::Done:
                    Close(false);
                    handler->OnDone();
                    break;
                case FakeResponse::End::Error: {
                    auto e = response.end_error;
                    Close(false);
                    handler->OnError(e);
                    break;
                }
                case FakeResponse::End::Hang:
                    break;
            }
        }

        void Close(bool cancelled) {
            if (closed) return;
            closed = true;
            --stats->in_flight;
            if (cancelled) {
                ++stats->cancelled;
            } else {
                ++stats->completed;
            }
        }

        IEventLoop& loop;
        std::shared_ptr<Stats> stats;
        std::shared_ptr<IResponseHandler> handler;
        FakeResponse response;
        BufferChain pending;
        size_t next_piece = 0;
        int suspended = 0;
        bool started = false;
        bool closed = false;
    };

    class Exchange : public IHttpExchange {
    public:
        explicit Exchange(std::shared_ptr<Call> call) : call_(std::move(call)) {}
        ~Exchange() override { Cancel(); }

        void Suspend() override { ++call_->suspended; }

        void Resume() override {
            if (call_->suspended == 0 || --call_->suspended > 0) return;
            auto call = call_;
            call_->loop.Defer([call]() { call->Pump(); });
        }

        void Cancel() override { call_->Close(true); }

    private:
        std::shared_ptr<Call> call_;
    };

    IEventLoop& loop_;
    Responder responder_;
    std::shared_ptr<Stats> stats_;
};

// Deterministic non-repeating-ish bytes
inline std::string PatternContent(size_t size) {
    std::string s(size, '\0');
    for (size_t i = 0; i < size; ++i) s[i] = static_cast<char>((i * 31 + i / 7) % 251);
    return s;
}

}  // namespace wme_pipe::testing
