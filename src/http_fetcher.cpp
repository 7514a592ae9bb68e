// SPDX-License-Identifier: MIT

// src/http_fetcher.cpp
#include "src/http_fetcher.hpp"

#include <utility>

namespace wme_pipe {

std::shared_ptr<PendingExchange> OpenGated(IEventLoop& loop,
                                           IHttpFetcher& fetcher,
                                           RateLimiter* limiter,
                                           RequestFactory build,
                                           std::shared_ptr<IResponseHandler> handler,
                                           std::function<void(Error)> fail) {
    auto pending = std::make_shared<PendingExchange>();
    auto open = [pending, &fetcher, build = std::move(build),
                 handler = std::move(handler), fail = std::move(fail)]() {
        if (pending->aborted) return;
        auto request = build();
        if (!request) {
            fail(std::move(request.error()));
            return;
        }
        pending->exchange = fetcher.Open(std::move(*request), handler);
    };
    if (limiter) {
        limiter->Acquire(loop, std::move(open));
    } else {
        open();
    }
    return pending;
}

}  // namespace wme_pipe
