// SPDX-License-Identifier: MIT

// src/https_fetcher.hpp
#pragma once

#include <chrono>
#include <memory>

#include "lib/stream/event_loop.hpp"
#include "src/http_fetcher.hpp"

namespace wme_pipe {

// HttpsFetcher - one fresh TLS connection per exchange.
//
// Chains: TcpSocket -> TlsTransport -> HttpClient -> IResponseHandler
//
// The connection is closed after the first response. An exchange that sees
// no bytes for `idle_timeout` fails with ErrorCode::Timeout; the clock stops
// while the exchange is suspended.
//
// Thread safety: Not thread-safe. Open() and every exchange method must be
// called from the event loop thread.
class HttpsFetcher : public IHttpFetcher {
public:
    HttpsFetcher(IEventLoop& loop, std::chrono::milliseconds idle_timeout)
        : loop_(loop), idle_timeout_(idle_timeout) {}

    std::unique_ptr<IHttpExchange> Open(HttpRequest request,
                                        std::shared_ptr<IResponseHandler> handler) override;

private:
    IEventLoop& loop_;
    std::chrono::milliseconds idle_timeout_;
};

}  // namespace wme_pipe
