// SPDX-License-Identifier: MIT

// src/https_fetcher.cpp
#include "src/https_fetcher.hpp"

#include <iterator>
#include <string>
#include <utility>

#include "lib/stream/http_client.hpp"
#include "lib/stream/dns_resolver.hpp"
#include "lib/stream/http_request_builder.hpp"
#include "lib/stream/tcp_socket.hpp"
#include "lib/stream/timer.hpp"
#include "lib/stream/tls_transport.hpp"
#include "lib/stream/url.hpp"
#include "src/log.hpp"

namespace wme_pipe {

namespace {

class HttpsSession;

// Terminal stage of the connection pipeline; relays to the session.
class ResponseBridge {
public:
    explicit ResponseBridge(std::weak_ptr<HttpsSession> session)
        : session_(std::move(session)) {}

    void OnHead(const HttpResponseHead& head);
    void OnData(BufferChain& chain);
    void OnError(const Error& e);
    void OnDone();

private:
    std::weak_ptr<HttpsSession> session_;
};

using Http = HttpClient<ResponseBridge>;
using Tls = TlsTransport<Http>;
using Tcp = TcpSocket<Tls>;

class HttpsSession : public std::enable_shared_from_this<HttpsSession> {
public:
    HttpsSession(IEventLoop& loop, HttpRequest request,
                 std::shared_ptr<IResponseHandler> handler,
                 std::chrono::milliseconds idle_timeout)
        : loop_(loop),
          request_(std::move(request)),
          handler_(std::move(handler)),
          idle_timeout_(idle_timeout),
          idle_timer_(loop) {}

    void Start() {
        auto url = ParseUrl(request_.url);
        if (!url) {
            FailLater(url.error());
            return;
        }
        if (url->scheme != "https") {
            FailLater(Error{ErrorCode::ValidationError,
                            "only https URLs are supported: " + request_.url});
            return;
        }
        url_ = std::move(*url);

        std::weak_ptr<HttpsSession> weak = weak_from_this();
        bridge_ = std::make_shared<ResponseBridge>(weak);
        http_ = Http::Create(loop_, bridge_);
        http_->SetExpectNoBody(request_.method == "HEAD");
        tls_ = Tls::Create(loop_, http_);
        tls_->SetHostname(url_.host);
        http_->SetUpstream(tls_.get());
        tcp_ = Tcp::Create(loop_, tls_);

        tcp_->OnConnect([weak]() {
            auto self = weak.lock();
            if (!self || self->finished_) return;
            self->tls_->OnHandshake([weak]() {
                if (auto inner = weak.lock()) inner->SendRequest();
            });
            self->tls_->StartHandshake();
        });

        idle_timer_.OnTimer([weak, this]() {
            if (auto self = weak.lock()) {
                HandleError(Error{ErrorCode::Timeout,
                    fmt::format("no data from {} for {} ms", url_.host, idle_timeout_.count())});
            }
        });

        // Resolve and connect on the next turn so Open() never calls back
        loop_.Defer([weak]() {
            if (auto self = weak.lock()) self->Connect();
        });
    }

    void Suspend() {
        if (finished_) return;
        if (suspend_count_++ == 0) {
            idle_timer_.Stop();
            if (http_) http_->Suspend();
        }
    }

    void Resume() {
        if (finished_ || suspend_count_ == 0) return;
        if (--suspend_count_ == 0) {
            ArmIdleTimer();
            if (http_) http_->Resume();
        }
    }

    void Cancel() {
        if (finished_) return;
        finished_ = true;
        handler_.reset();
        Teardown();
    }

    bool IsSuspended() const { return suspend_count_ > 0; }

    void HandleHead(const HttpResponseHead& head) {
        if (finished_) return;
        ArmIdleTimer();
        auto handler = handler_;
        handler->OnHead(head);
    }

    // Bytes left in `chain` stay buffered in HttpClient until Resume()
    void HandleBody(BufferChain& chain) {
        if (finished_ || IsSuspended()) return;
        ArmIdleTimer();
        auto handler = handler_;
        handler->OnBody(chain);
    }

    void HandleError(const Error& e) {
        if (finished_) return;
        finished_ = true;
        auto handler = std::move(handler_);
        Teardown();
        handler->OnError(e);
    }

    void HandleDone() {
        if (finished_) return;
        finished_ = true;
        auto handler = std::move(handler_);
        Teardown();
        handler->OnDone();
    }

private:
    void FailLater(Error e) {
        std::weak_ptr<HttpsSession> weak = weak_from_this();
        loop_.Defer([weak, e = std::move(e)]() {
            if (auto self = weak.lock()) self->HandleError(e);
        });
    }

    void Connect() {
        if (finished_) return;
        auto endpoints = ResolveEndpoints(url_.host, url_.port);
        if (!endpoints) {
            HandleError(endpoints.error());
            return;
        }
        WME_LOG_DEBUG("{} {} ({})", request_.method, request_.url,
                      request_.range ? fmt::format("{}", *request_.range) : "full");
        ArmIdleTimer();
        tcp_->Connect(endpoints->front());
    }

    void SendRequest() {
        if (finished_) return;

        std::string out;
        HttpRequestBuilder builder(std::back_inserter(out), request_.method, url_.target,
                                   url_.HostHeader());
        for (const auto& [name, value] : request_.headers) {
            builder.Header(name, value);
        }
        if (request_.range) {
            builder.Range(request_.range->start, request_.range->end);
        }
        if (!request_.body.empty()) {
            builder.Finish(request_.content_type.empty() ? "application/json"
                                                         : request_.content_type,
                           request_.body);
        } else {
            builder.Finish();
        }

        BufferChain chain;
        chain.AppendBytes(out);
        tls_->Write(std::move(chain));
    }

    void ArmIdleTimer() {
        if (finished_ || IsSuspended() || idle_timeout_.count() <= 0) return;
        idle_timer_.Start(idle_timeout_);
    }

    // Components may still be on the call stack; release them next turn.
    void Teardown() {
        idle_timer_.Stop();
        if (tcp_) tcp_->Close();
        if (http_) http_->RequestClose();
        loop_.Defer([tcp = std::move(tcp_), tls = std::move(tls_),
                     http = std::move(http_), bridge = std::move(bridge_)]() {});
    }

    IEventLoop& loop_;
    HttpRequest request_;
    std::shared_ptr<IResponseHandler> handler_;
    std::chrono::milliseconds idle_timeout_;
    Timer idle_timer_;
    Url url_;

    std::shared_ptr<ResponseBridge> bridge_;
    std::shared_ptr<Http> http_;
    std::shared_ptr<Tls> tls_;
    std::shared_ptr<Tcp> tcp_;

    int suspend_count_ = 0;
    bool finished_ = false;
};

void ResponseBridge::OnHead(const HttpResponseHead& head) {
    if (auto s = session_.lock()) s->HandleHead(head);
}

void ResponseBridge::OnData(BufferChain& chain) {
    if (auto s = session_.lock()) s->HandleBody(chain);
}

void ResponseBridge::OnError(const Error& e) {
    if (auto s = session_.lock()) s->HandleError(e);
}

void ResponseBridge::OnDone() {
    if (auto s = session_.lock()) s->HandleDone();
}

class HttpsExchange : public IHttpExchange {
public:
    explicit HttpsExchange(std::shared_ptr<HttpsSession> session)
        : session_(std::move(session)) {}

    ~HttpsExchange() override { session_->Cancel(); }

    void Suspend() override { session_->Suspend(); }
    void Resume() override { session_->Resume(); }
    void Cancel() override { session_->Cancel(); }

private:
    std::shared_ptr<HttpsSession> session_;
};

}  // namespace

std::unique_ptr<IHttpExchange> HttpsFetcher::Open(HttpRequest request,
                                                  std::shared_ptr<IResponseHandler> handler) {
    auto session = std::make_shared<HttpsSession>(loop_, std::move(request),
                                                  std::move(handler), idle_timeout_);
    session->Start();
    return std::make_unique<HttpsExchange>(std::move(session));
}

}  // namespace wme_pipe
