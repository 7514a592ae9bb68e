// SPDX-License-Identifier: MIT

// src/http_fetcher.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_client.hpp"
#include "src/rate_limiter.hpp"
#include "src/resource.hpp"

namespace wme_pipe {

/// One outbound HTTP request. Authorization and User-Agent are ordinary headers.
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers = {};
    std::string content_type = {};
    std::string body = {};
    std::optional<ByteRange> range = {};
};

/// Receives the response of one exchange.
///
/// OnHead is called once for a 2xx response before any body bytes. Exactly
/// one of OnError/OnDone ends the exchange; non-2xx statuses arrive as
/// OnError with the mapped ErrorCode. OnBody must consume all of `body`
/// unless it suspends the exchange first.
class IResponseHandler {
public:
    virtual ~IResponseHandler() = default;
    virtual void OnHead(const HttpResponseHead& head) = 0;
    virtual void OnBody(BufferChain& body) = 0;
    virtual void OnError(const Error& e) = 0;
    virtual void OnDone() = 0;
};

/// Handle for an in-flight exchange. Destroying it cancels the exchange.
class IHttpExchange {
public:
    virtual ~IHttpExchange() = default;

    /// Stop delivering body bytes (nested calls count).
    virtual void Suspend() = 0;
    virtual void Resume() = 0;

    /// Release the connection. No handler callback follows.
    virtual void Cancel() = 0;
};

/// The seam every network call goes through. Implementations call the
/// handler on the event loop thread, never from inside Open().
class IHttpFetcher {
public:
    virtual ~IHttpFetcher() = default;

    virtual std::unique_ptr<IHttpExchange> Open(HttpRequest request,
                                                std::shared_ptr<IResponseHandler> handler) = 0;
};

/// One attempt's exchange; a rate limiter wait may come before the open.
struct PendingExchange {
    bool aborted = false;
    std::unique_ptr<IHttpExchange> exchange;

    void Abort() {
        aborted = true;
        if (exchange) exchange->Cancel();
    }
};

using RequestFactory = std::function<std::expected<HttpRequest, Error>()>;

/// Take a token from `limiter` (null means unlimited), then build the request
/// and open it. A failure to build the request (no bearer token, say) goes to
/// `fail` and nothing is opened. `fetcher` and `limiter` must outlive the
/// returned exchange.
std::shared_ptr<PendingExchange> OpenGated(IEventLoop& loop,
                                           IHttpFetcher& fetcher,
                                           RateLimiter* limiter,
                                           RequestFactory build,
                                           std::shared_ptr<IResponseHandler> handler,
                                           std::function<void(Error)> fail);

}  // namespace wme_pipe
