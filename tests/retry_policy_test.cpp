// SPDX-License-Identifier: MIT

// tests/retry_policy_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/error.hpp"
#include "src/retry_policy.hpp"
#include "tests/poll_helpers.hpp"

using namespace wme_pipe;
using namespace std::chrono_literals;
using wme_pipe::testing::PollFor;

TEST(RetryPolicyTest, ShouldRetryInitiallyTrue) {
    RetryPolicy policy(RetryConfig{.max_retries = 3});
    EXPECT_TRUE(policy.ShouldRetry());
}

TEST(RetryPolicyTest, ShouldRetryFalseAfterMaxAttempts) {
    RetryPolicy policy(RetryConfig{.max_retries = 2});

    policy.RecordAttempt();
    EXPECT_TRUE(policy.ShouldRetry());

    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry());
}

TEST(RetryPolicyTest, ZeroRetriesMeansSingleAttempt) {
    RetryPolicy policy(RetryConfig{.max_retries = 0});
    EXPECT_FALSE(policy.ShouldRetry(Error{ErrorCode::ServerError, "503"}));
}

TEST(RetryPolicyTest, ResetClearsAttempts) {
    RetryPolicy policy(RetryConfig{.max_retries = 2});
    policy.RecordAttempt();
    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry());

    policy.Reset();
    EXPECT_TRUE(policy.ShouldRetry());
    EXPECT_EQ(policy.Attempts(), 0u);
}

TEST(RetryPolicyTest, ExponentialBackoff) {
    RetryPolicy policy(RetryConfig{
        .initial_delay = 100ms,
        .max_delay = 10s,
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0,
    });

    EXPECT_EQ(policy.GetNextDelay(), 100ms);
    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay(), 200ms);
    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay(), 400ms);
}

TEST(RetryPolicyTest, BackoffCapsAtMaxDelay) {
    RetryPolicy policy(RetryConfig{
        .max_retries = 20,
        .initial_delay = 1000ms,
        .max_delay = 5000ms,
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0,
    });
    for (int i = 0; i < 10; ++i) policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay(), 5000ms);
}

TEST(RetryPolicyTest, JitterStaysInBand) {
    RetryPolicy policy(RetryConfig{
        .initial_delay = 1000ms,
        .jitter_factor = 0.1,
    }, 42);
    for (int i = 0; i < 50; ++i) {
        auto d = policy.GetNextDelay();
        EXPECT_GE(d, 900ms);
        EXPECT_LE(d, 1100ms);
    }
}

TEST(RetryPolicyTest, RetryAfterIsLowerBound) {
    RetryPolicy policy(RetryConfig{.initial_delay = 100ms, .jitter_factor = 0.0});

    Error throttled{ErrorCode::RateLimited, "HTTP 429"};
    throttled.retry_after = 30s;
    EXPECT_EQ(policy.GetNextDelay(throttled), 30000ms);

    Error short_hint{ErrorCode::RateLimited, "HTTP 429"};
    short_hint.retry_after = 10ms;
    EXPECT_EQ(policy.GetNextDelay(short_hint), 100ms);
}

TEST(RetryPolicyTest, OnlyTransientErrorsRetry) {
    RetryPolicy policy(RetryConfig{.max_retries = 3});

    for (auto code : {ErrorCode::ServerError, ErrorCode::ConnectionFailed,
                      ErrorCode::RateLimited, ErrorCode::Timeout,
                      ErrorCode::TlsHandshakeFailed}) {
        EXPECT_TRUE(policy.ShouldRetry(Error{code, ""})) << static_cast<int>(code);
    }
    for (auto code : {ErrorCode::Unauthorized, ErrorCode::NotFound,
                      ErrorCode::ValidationError, ErrorCode::ParseError,
                      ErrorCode::DecompressionError, ErrorCode::AuthFailed,
                      ErrorCode::Cancelled}) {
        EXPECT_FALSE(policy.ShouldRetry(Error{code, ""})) << static_cast<int>(code);
    }
}

TEST(RetryPolicyTest, Presets) {
    EXPECT_EQ(RetryConfig::ApiDefaults().max_retries, 3u);
    EXPECT_EQ(RetryConfig::DownloadDefaults().max_retries, 5u);
    EXPECT_GT(RetryConfig::StreamDefaults().max_retries,
              RetryConfig::DownloadDefaults().max_retries);
}

TEST(MakeRetriesExhaustedTest, WrapsLastFailure) {
    Error last{ErrorCode::ServerError, "HTTP 503", 0};
    auto e = MakeRetriesExhausted("chunk [0-9]", 4, last);

    EXPECT_EQ(e.code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(e.attempts, 4u);
    ASSERT_NE(e.cause, nullptr);
    EXPECT_EQ(e.cause->code, ErrorCode::ServerError);
    EXPECT_NE(e.message.find("chunk [0-9]"), std::string::npos);
    EXPECT_NE(e.message.find("4 attempts"), std::string::npos);
}

// RetryingOperation on a real loop, with millisecond backoff

namespace {

RetryConfig FastRetry(uint32_t max_retries) {
    return RetryConfig{
        .max_retries = max_retries,
        .initial_delay = 1ms,
        .max_delay = 5ms,
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0,
    };
}

using IntOp = RetryingOperation<int>;

// Answers each attempt synchronously from a script
IntOp::Attempt Scripted(std::vector<std::expected<int, Error>> script,
                        std::vector<uint32_t>* seen) {
    return [script, seen](uint32_t attempt, IntOp::Callback done) -> IntOp::Abort {
        seen->push_back(attempt);
        done(script.at(attempt - 1));
        return nullptr;
    };
}

}  // namespace

TEST(RetryingOperationTest, SucceedsAfterTransientFailures) {
    EpollEventLoop loop;
    std::vector<uint32_t> seen;
    std::optional<std::expected<int, Error>> result;

    auto op = IntOp::Start(loop, FastRetry(3), "GET /x",
        Scripted({std::unexpected(Error{ErrorCode::ServerError, "503"}),
                  std::unexpected(Error{ErrorCode::ConnectionClosed, "eof"}),
                  7},
                 &seen),
        [&](auto r) { result = std::move(r); });

    PollFor(loop, 1s, [&] { return result.has_value(); });

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ(**result, 7);
    EXPECT_EQ(seen, (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_EQ(op->Attempts(), 3u);
    EXPECT_TRUE(op->IsFinished());
}

TEST(RetryingOperationTest, PermanentErrorFailsImmediately) {
    EpollEventLoop loop;
    std::vector<uint32_t> seen;
    std::optional<std::expected<int, Error>> result;

    IntOp::Start(loop, FastRetry(3), "GET /missing",
        Scripted({std::unexpected(Error{ErrorCode::NotFound, "HTTP 404"})}, &seen),
        [&](auto r) { result = std::move(r); });

    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::NotFound);
    EXPECT_EQ(result->error().message, "GET /missing: HTTP 404");
    EXPECT_EQ(result->error().attempts, 1u);
    EXPECT_EQ(seen.size(), 1u);
}

TEST(RetryingOperationTest, ExhaustsBudget) {
    EpollEventLoop loop;
    std::vector<uint32_t> seen;
    std::optional<std::expected<int, Error>> result;
    Error fail{ErrorCode::ServerError, "HTTP 500"};

    IntOp::Start(loop, FastRetry(2), "GET /flaky",
        Scripted({std::unexpected(fail), std::unexpected(fail), std::unexpected(fail)}, &seen),
        [&](auto r) { result = std::move(r); });

    PollFor(loop, 1s, [&] { return result.has_value(); });

    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(result->error().attempts, 3u);
    ASSERT_NE(result->error().cause, nullptr);
    EXPECT_EQ(result->error().cause->code, ErrorCode::ServerError);
    EXPECT_EQ(seen.size(), 3u);
}

TEST(RetryingOperationTest, CancelAbortsInFlightAttempt) {
    EpollEventLoop loop;
    bool aborted = false;
    bool called = false;
    IntOp::Callback pending;

    auto op = IntOp::Start(loop, FastRetry(3), "GET /slow",
        [&](uint32_t, IntOp::Callback done) -> IntOp::Abort {
            pending = std::move(done);
            return [&] { aborted = true; };
        },
        [&](auto) { called = true; });

    op->Cancel();
    EXPECT_TRUE(aborted);

    // A late completion is ignored
    pending(1);
    loop.Poll(0);
    EXPECT_FALSE(called);
}

TEST(RetryingOperationTest, CancelDuringBackoffStopsRetry) {
    EpollEventLoop loop;
    std::vector<uint32_t> seen;
    bool called = false;

    auto op = IntOp::Start(loop, RetryConfig{.max_retries = 3, .initial_delay = 20ms,
                                             .jitter_factor = 0.0},
        "GET /x",
        Scripted({std::unexpected(Error{ErrorCode::Timeout, "idle"}), 1}, &seen),
        [&](auto) { called = true; });

    op->Cancel();
    PollFor(loop, 100ms, [] { return false; });

    EXPECT_EQ(seen.size(), 1u);
    EXPECT_FALSE(called);
}
