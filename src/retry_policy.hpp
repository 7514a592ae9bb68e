// SPDX-License-Identifier: MIT

// src/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/log.hpp"

namespace wme_pipe {

/// Configuration for exponential backoff retry behavior.
struct RetryConfig {
    uint32_t max_retries = 3;                          ///< Retries after the first attempt
    std::chrono::milliseconds initial_delay{1000};     ///< Delay before first retry
    std::chrono::milliseconds max_delay{30000};        ///< Delay cap
    double backoff_multiplier = 2.0;                   ///< Multiplier per attempt
    double jitter_factor = 0.1;                        ///< Random jitter range (+/- fraction)

    /// Simple API calls: fast retry, fewer attempts.
    static RetryConfig ApiDefaults() {
        return RetryConfig{
            .max_retries = 3,
            .initial_delay = std::chrono::milliseconds{1000},
            .max_delay = std::chrono::milliseconds{10000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.1,
        };
    }

    /// Ranged chunk fetches: more patience, more retries.
    static RetryConfig DownloadDefaults() {
        return RetryConfig{
            .max_retries = 5,
            .initial_delay = std::chrono::milliseconds{2000},
            .max_delay = std::chrono::milliseconds{60000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.1,
        };
    }

    /// Real-time stream reconnects.
    static RetryConfig StreamDefaults() {
        return RetryConfig{
            .max_retries = 10,
            .initial_delay = std::chrono::milliseconds{500},
            .max_delay = std::chrono::milliseconds{30000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.2,
        };
    }
};

/// Stateful retry policy with exponential backoff, jitter, and error classification.
///
/// Only ErrorKind::Transient errors are retried. Everything else (permanent
/// request errors, decode and auth failures) is final on first occurrence.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), rng_(std::random_device{}()) {}

    RetryPolicy(RetryConfig config, uint32_t seed) : config_(config), rng_(seed) {}

    bool ShouldRetry() const { return attempts_ < config_.max_retries; }

    bool ShouldRetry(const Error& e) const {
        return IsRetryable(e.code) && ShouldRetry();
    }

    /// Count one retry against the budget.
    void RecordAttempt() { ++attempts_; }

    void Reset() { attempts_ = 0; }

    /// Backoff for the next retry. Retry-After, when the server sent one,
    /// is a lower bound.
    std::chrono::milliseconds GetNextDelay(const Error& e) {
        auto delay = CalculateBackoff();
        if (e.retry_after) delay = std::max(delay, *e.retry_after);
        return delay;
    }

    std::chrono::milliseconds GetNextDelay() { return CalculateBackoff(); }

    static bool IsRetryable(ErrorCode code) {
        return error_kind(code) == ErrorKind::Transient;
    }

    uint32_t Attempts() const { return attempts_; }
    const RetryConfig& Config() const { return config_; }

private:
    std::chrono::milliseconds CalculateBackoff() {
        double delay_ms = static_cast<double>(config_.initial_delay.count());
        for (uint32_t i = 0; i < attempts_; ++i) {
            delay_ms *= config_.backoff_multiplier;
        }
        delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

        if (config_.jitter_factor > 0.0) {
            std::uniform_real_distribution<> dis(1.0 - config_.jitter_factor,
                                                 1.0 + config_.jitter_factor);
            delay_ms *= dis(rng_);
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    RetryConfig config_;
    uint32_t attempts_ = 0;
    std::mt19937 rng_;
};

/// Build the terminal error for a budget that ran out.
inline Error MakeRetriesExhausted(std::string_view context, uint32_t attempts, Error last) {
    Error e{ErrorCode::RetriesExhausted,
            fmt::format("{}: gave up after {} attempts: {}", context, attempts, last.message)};
    e.attempts = attempts;
    e.os_errno = last.os_errno;
    e.cause = std::make_shared<const Error>(std::move(last));
    return e;
}

/// One logical operation driven through RetryPolicy on an event loop.
///
/// The attempt function starts one try and must call its completion exactly
/// once; it may return an aborter for the in-flight try. Transient failures
/// are retried after the policy's delay; the caller's callback sees either
/// the first success, the first non-transient failure (with context), or
/// RetriesExhausted wrapping the last failure.
///
/// Cancel() aborts the in-flight try and any pending retry; the callback is
/// not invoked afterwards.
template <typename T>
class RetryingOperation : public std::enable_shared_from_this<RetryingOperation<T>> {
public:
    using Result = std::expected<T, Error>;
    using Callback = std::function<void(Result)>;
    using Abort = std::function<void()>;
    using Attempt = std::function<Abort(uint32_t attempt, Callback done)>;

    static std::shared_ptr<RetryingOperation> Start(IEventLoop& loop,
                                                    RetryConfig config,
                                                    std::string context,
                                                    Attempt attempt,
                                                    Callback on_done) {
        struct MakeSharedEnabler : public RetryingOperation {
            MakeSharedEnabler(IEventLoop& l, RetryConfig c, std::string ctx,
                              Attempt a, Callback cb)
                : RetryingOperation(l, c, std::move(ctx), std::move(a), std::move(cb)) {}
        };
        auto op = std::make_shared<MakeSharedEnabler>(loop, config, std::move(context),
                                                      std::move(attempt), std::move(on_done));
        op->RunAttempt();
        return op;
    }

    void Cancel() {
        if (finished_) return;
        finished_ = true;
        ++generation_;
        if (auto abort = std::exchange(abort_, nullptr)) abort();
        on_done_ = nullptr;
        attempt_ = nullptr;
    }

    /// Tries started so far (first attempt included).
    uint32_t Attempts() const { return attempt_no_; }
    bool IsFinished() const { return finished_; }
    const std::string& Context() const { return context_; }

private:
    RetryingOperation(IEventLoop& loop, RetryConfig config, std::string context,
                      Attempt attempt, Callback on_done)
        : loop_(loop),
          policy_(config),
          context_(std::move(context)),
          attempt_(std::move(attempt)),
          on_done_(std::move(on_done)) {}

    void RunAttempt() {
        if (finished_) return;
        ++attempt_no_;
        uint64_t gen = ++generation_;
        settled_ = false;

        std::weak_ptr<RetryingOperation> weak = this->weak_from_this();
        Abort abort = attempt_(attempt_no_, [weak, gen](Result r) {
            if (auto self = weak.lock()) self->OnAttemptDone(gen, std::move(r));
        });
        // A synchronous completion already settled this try
        if (!settled_ && gen == generation_) abort_ = std::move(abort);
    }

    void OnAttemptDone(uint64_t gen, Result r) {
        if (finished_ || gen != generation_) return;
        settled_ = true;
        abort_ = nullptr;

        if (r) {
            Finish(std::move(r));
            return;
        }

        Error err = std::move(r.error());
        if (!policy_.ShouldRetry(err)) {
            if (RetryPolicy::IsRetryable(err.code)) {
                Finish(std::unexpected(MakeRetriesExhausted(context_, attempt_no_, std::move(err))));
            } else {
                err.attempts = attempt_no_;
                Finish(std::unexpected(WithContext(std::move(err), context_)));
            }
            return;
        }

        auto delay = policy_.GetNextDelay(err);
        policy_.RecordAttempt();
        WME_LOG_WARN("{}: attempt {} failed ({}), retrying in {} ms",
                     context_, attempt_no_, err.message, delay.count());

        std::weak_ptr<RetryingOperation> weak = this->weak_from_this();
        uint64_t scheduled_gen = generation_;
        loop_.Schedule(delay, [weak, scheduled_gen]() {
            auto self = weak.lock();
            if (self && self->generation_ == scheduled_gen) self->RunAttempt();
        });
    }

    void Finish(Result r) {
        finished_ = true;
        attempt_ = nullptr;
        if (auto cb = std::exchange(on_done_, nullptr)) cb(std::move(r));
    }

    IEventLoop& loop_;
    RetryPolicy policy_;
    std::string context_;
    Attempt attempt_;
    Callback on_done_;
    Abort abort_;
    uint32_t attempt_no_ = 0;
    uint64_t generation_ = 0;
    bool settled_ = false;
    bool finished_ = false;
};

}  // namespace wme_pipe
