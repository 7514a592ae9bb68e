// SPDX-License-Identifier: MIT

// tests/api_client_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "lib/stream/epoll_event_loop.hpp"
#include "src/api_client.hpp"
#include "tests/archive_helpers.hpp"
#include "tests/fake_fetcher.hpp"
#include "tests/poll_helpers.hpp"

using namespace wme_pipe;
using namespace std::chrono_literals;
using wme_pipe::testing::ArticleLines;
using wme_pipe::testing::FakeFetcher;
using wme_pipe::testing::FakeResponse;
using wme_pipe::testing::Gzip;
using wme_pipe::testing::PollFor;
using wme_pipe::testing::ServeContent;
using wme_pipe::testing::TarBuilder;

namespace {

std::optional<std::string> HeaderOf(const HttpRequest& req, std::string_view name) {
    for (const auto& [k, v] : req.headers) {
        if (k == name) return v;
    }
    return std::nullopt;
}

RetryConfig Fast(uint32_t retries) {
    return RetryConfig{.max_retries = retries,
                       .initial_delay = 1ms,
                       .max_delay = 2ms,
                       .backoff_multiplier = 2.0,
                       .jitter_factor = 0.0};
}

class ApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.base_url = "https://api.example.test/";
        config.realtime_url = "https://realtime.example.test/";
        config.user_agent = "wme-pipe-test/1.0";
        config.retry = Fast(2);
        config.download_retry = Fast(2);
        config.stream_retry = Fast(2);
    }

    std::shared_ptr<ApiClient> Make(std::shared_ptr<ITokenProvider> tokens =
                                        std::make_shared<StaticTokenProvider>("secret")) {
        auto owned = std::make_unique<FakeFetcher>(loop, [this](const HttpRequest& req) {
            return responder(req);
        });
        fetcher = owned.get();
        return ApiClient::Create(loop, config, std::move(tokens), std::move(owned));
    }

    template <typename T>
    void Wait(const std::optional<T>& slot) {
        PollFor(loop, 2s, [&] { return slot.has_value(); });
    }

    EpollEventLoop loop;
    ClientConfig config;
    FakeFetcher::Responder responder = [](const HttpRequest&) {
        return FakeResponse::Ok("[]");
    };
    FakeFetcher* fetcher = nullptr;
};

using JsonResult = std::expected<rapidjson::Document, Error>;

}  // namespace

TEST_F(ApiClientTest, GetProjectsPostsJson) {
    responder = [](const HttpRequest&) {
        return FakeResponse::Ok(R"([{"identifier":"enwiki"},{"identifier":"dewiki"}])");
    };
    auto client = Make();

    Request req;
    req.fields = {"identifier"};
    std::optional<JsonResult> result;
    client->GetProjects(req, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value()) << result->error().message;
    ASSERT_TRUE((*result)->IsArray());
    EXPECT_EQ((*result)->Size(), 2u);

    ASSERT_EQ(fetcher->Requests().size(), 1u);
    const auto& sent = fetcher->Requests()[0];
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://api.example.test/v2/projects");
    EXPECT_EQ(sent.content_type, "application/json");
    EXPECT_EQ(sent.body, R"({"fields":["identifier"]})");
    EXPECT_EQ(HeaderOf(sent, "Authorization"), "Bearer secret");
    EXPECT_EQ(HeaderOf(sent, "User-Agent"), "wme-pipe-test/1.0");
    EXPECT_EQ(HeaderOf(sent, "Accept-Encoding"), "identity");
}

TEST_F(ApiClientTest, EmptyRequestSendsEmptyObject) {
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetCodes({}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);
    EXPECT_EQ(fetcher->Requests().at(0).body, "{}");
}

TEST_F(ApiClientTest, PathSegmentsAreEncoded) {
    responder = [](const HttpRequest&) { return FakeResponse::Ok("[]"); };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetArticles("Albert Einstein", {}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);
    EXPECT_EQ(fetcher->Requests().at(0).url,
              "https://api.example.test/v2/articles/Albert%20Einstein");
}

TEST_F(ApiClientTest, BatchesAddressedByDateAndHour) {
    auto client = Make();
    using namespace std::chrono;
    sys_seconds hour = sys_days{year{2024} / May / 1} + 13h + 27min;
    std::optional<JsonResult> result;
    client->GetBatches(hour, {}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);
    EXPECT_EQ(fetcher->Requests().at(0).url,
              "https://api.example.test/v2/batches/2024-05-01/13");
}

TEST_F(ApiClientTest, WrongShapeIsParseError) {
    responder = [](const HttpRequest&) { return FakeResponse::Ok(R"({"not":"a list"})"); };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetProjects({}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::ParseError);
}

TEST_F(ApiClientTest, TransientFailureIsRetried) {
    int calls = 0;
    responder = [&](const HttpRequest&) {
        return ++calls < 3 ? FakeResponse::Status(503) : FakeResponse::Ok(R"({"name":"en"})");
    };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetLanguage("en", {}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_TRUE(result->has_value()) << result->error().message;
    EXPECT_STREQ((**result)["name"].GetString(), "en");
    EXPECT_EQ(fetcher->Requests().size(), 3u);
}

TEST_F(ApiClientTest, RetriesExhaustedCarriesLastError) {
    responder = [](const HttpRequest&) { return FakeResponse::Status(502); };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetCodes({}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(result->error().attempts, 3u);
    ASSERT_NE(result->error().cause, nullptr);
    EXPECT_EQ(result->error().cause->code, ErrorCode::ServerError);
}

TEST_F(ApiClientTest, UnauthorizedIsNotRetried) {
    responder = [](const HttpRequest&) { return FakeResponse::Status(401); };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetCodes({}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::Unauthorized);
    EXPECT_EQ(fetcher->Requests().size(), 1u);
}

TEST_F(ApiClientTest, MissingTokenFailsBeforeSending) {
    auto client = Make(std::make_shared<CellTokenProvider>(std::make_shared<TokenCell>()));
    std::optional<JsonResult> result;
    client->GetCodes({}, [&](JsonResult r) { result = std::move(r); });
    Wait(result);

    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().code, ErrorCode::AuthFailed);
    EXPECT_TRUE(fetcher->Requests().empty());
}

TEST_F(ApiClientTest, OperationOutlivesCallerReference) {
    responder = [](const HttpRequest&) { return FakeResponse::Ok("[1]").After(10ms); };
    auto client = Make();
    std::optional<JsonResult> result;
    client->GetCodes({}, [&](JsonResult r) { result = std::move(r); });
    client.reset();
    Wait(result);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->has_value());
}

TEST_F(ApiClientTest, HeadSnapshotReportsResourceInfo) {
    responder = [](const HttpRequest&) {
        FakeResponse r;
        r.headers = {{"content-length", "123456"},
                     {"etag", "W/\"abc\""},
                     {"accept-ranges", "bytes"},
                     {"content-type", "application/gzip"}};
        return r;
    };
    auto client = Make();
    std::optional<std::expected<ResourceInfo, Error>> result;
    client->HeadSnapshot("enwiki_namespace_0", [&](auto r) { result = std::move(r); });
    Wait(result);

    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->content_length, 123456u);
    EXPECT_EQ((*result)->etag, "abc");
    EXPECT_TRUE((*result)->accept_ranges);
    EXPECT_EQ((*result)->content_type, "application/gzip");

    const auto& sent = fetcher->Requests().at(0);
    EXPECT_EQ(sent.method, "HEAD");
    EXPECT_EQ(sent.url, "https://api.example.test/v2/snapshots/enwiki_namespace_0/download");
}

TEST_F(ApiClientTest, ReadSnapshotDownloadsInChunks) {
    TarBuilder tar;
    tar.File("enwiki_namespace_0_0.ndjson", ArticleLines("Article ", 0, 400));
    tar.File("enwiki_namespace_0_1.ndjson", ArticleLines("Article ", 400, 600));
    std::string archive = Gzip(tar.Finish());

    config.download_chunk_size = archive.size() / 3 + 1;
    config.download_concurrency = 2;
    responder = [&archive](const HttpRequest& req) { return ServeContent(archive, req); };
    auto client = Make();

    std::vector<int64_t> ids;
    std::optional<std::expected<void, Error>> done;
    std::shared_ptr<LargeFetch> fetch;
    bool finished_while_reading = false;
    fetch = client->ReadSnapshot(
        "enwiki_namespace_0",
        [&](std::expected<ArchiveEntry, Error>&& r) {
            ASSERT_TRUE(r.has_value()) << r.error().message;
            ids.push_back(r->document["identifier"].GetInt64());
            if (fetch && fetch->IsFinished()) finished_while_reading = true;
        },
        [&](std::expected<void, Error> r) { done = r; });
    Wait(done);

    ASSERT_TRUE(done->has_value()) << done->error().message;
    EXPECT_FALSE(finished_while_reading);
    EXPECT_TRUE(fetch->IsFinished());
    ASSERT_EQ(ids.size(), 1000u);
    for (size_t i = 0; i < ids.size(); ++i) ASSERT_EQ(ids[i], static_cast<int64_t>(i));

    EXPECT_EQ(fetch->Plan().size(), 3u);
    EXPECT_LE(fetch->PeakInFlight(), 2u);
    EXPECT_EQ(fetch->ActiveCodec(), Codec::Gzip);
    EXPECT_EQ(fetch->RecordsDelivered(), 1000u);

    const auto& requests = fetcher->Requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0].method, "HEAD");
    for (const auto& req : requests) {
        EXPECT_EQ(req.url, "https://api.example.test/v2/snapshots/enwiki_namespace_0/download");
        EXPECT_EQ(HeaderOf(req, "Authorization"), "Bearer secret");
    }
}

TEST_F(ApiClientTest, DownloadChunkWritesStoredBytes) {
    std::string archive = Gzip(TarBuilder().File("c.ndjson", ArticleLines("C ", 0, 300)).Finish());
    config.download_chunk_size = archive.size() / 4 + 1;
    config.download_concurrency = 2;
    responder = [&archive](const HttpRequest& req) { return ServeContent(archive, req); };
    auto client = Make();

    std::string written;
    std::optional<std::expected<void, Error>> done;
    auto download = client->DownloadChunk(
        "enwiki_namespace_0", "enwiki_namespace_0_chunk_7",
        [&](std::span<const std::byte> bytes) {
            written.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        },
        [&](std::expected<void, Error> r) { done = r; });
    Wait(done);

    ASSERT_TRUE(done->has_value()) << done->error().message;
    EXPECT_EQ(written, archive);
    EXPECT_EQ(download->BytesWritten(), archive.size());
    EXPECT_EQ(download->Plan().size(), 4u);
    EXPECT_TRUE(download->IsFinished());

    for (const auto& req : fetcher->Requests()) {
        EXPECT_EQ(req.url, "https://api.example.test/v2/snapshots/enwiki_namespace_0/chunks/"
                           "enwiki_namespace_0_chunk_7/download");
        EXPECT_EQ(HeaderOf(req, "Accept-Encoding"), "identity");
    }
}

TEST_F(ApiClientTest, DownloadEndpointsAddressDownloadPaths) {
    responder = [](const HttpRequest& req) {
        return ServeContent("payload", req, /*ranges=*/false);
    };
    auto client = Make();

    std::vector<std::string> bodies;
    int completed = 0;
    auto writer = [&](std::span<const std::byte> bytes) {
        bodies.back().append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    };
    auto on_done = [&](std::expected<void, Error> r) {
        EXPECT_TRUE(r.has_value()) << r.error().message;
        ++completed;
    };
    auto hour = std::chrono::sys_days{std::chrono::year{2024} / 5 / 1} + std::chrono::hours{13};

    bodies.emplace_back();
    client->DownloadSnapshot("enwiki_namespace_0", writer, on_done);
    PollFor(loop, 2s, [&] { return completed == 1; });
    bodies.emplace_back();
    client->DownloadBatch(std::chrono::sys_seconds{hour}, "enwiki_namespace_0", writer, on_done);
    PollFor(loop, 2s, [&] { return completed == 2; });
    bodies.emplace_back();
    client->DownloadStructuredSnapshot("enwiki_namespace_0", writer, on_done);
    PollFor(loop, 2s, [&] { return completed == 3; });

    ASSERT_EQ(completed, 3);
    EXPECT_EQ(bodies, (std::vector<std::string>{"payload", "payload", "payload"}));

    std::vector<std::string> urls;
    for (const auto& req : fetcher->Requests()) {
        if (urls.empty() || urls.back() != req.url) urls.push_back(req.url);
    }
    EXPECT_EQ(urls, (std::vector<std::string>{
        "https://api.example.test/v2/snapshots/enwiki_namespace_0/download",
        "https://api.example.test/v2/batches/2024-05-01/13/enwiki_namespace_0/download",
        "https://api.example.test/v2/snapshots/structured-contents/enwiki_namespace_0/download",
    }));
}

TEST_F(ApiClientTest, DownloadFailureReachesCallback) {
    responder = [](const HttpRequest&) { return FakeResponse::Status(404); };
    auto client = Make();

    bool wrote = false;
    std::optional<std::expected<void, Error>> done;
    auto download = client->DownloadSnapshot(
        "missing", [&](std::span<const std::byte>) { wrote = true; },
        [&](std::expected<void, Error> r) { done = r; });
    Wait(done);

    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::NotFound);
    EXPECT_FALSE(wrote);
    EXPECT_TRUE(download->IsFinished());
    EXPECT_EQ(download->BytesWritten(), 0u);
}

TEST_F(ApiClientTest, FetchLargeCancel) {
    responder = [](const HttpRequest& req) {
        auto r = ServeContent(wme_pipe::testing::PatternContent(1 << 20), req);
        return std::move(r).After(req.method == "HEAD" ? 0ms : 500ms);
    };
    auto client = Make();

    std::optional<std::expected<void, Error>> done;
    auto fetch = client->FetchLarge(
        ResourceDescriptor{.url = "https://files.example.test/big.tar.gz", .size = 1u << 20},
        DownloadOptions{.chunk_size = 1u << 18, .concurrency = 4, .retry = Fast(1)},
        [](std::expected<ArchiveEntry, Error>&&) {},
        [&](std::expected<void, Error> r) { done = r; });

    PollFor(loop, 1s, [&] { return fetcher->GetStats()->in_flight == 4; });
    fetch->Cancel();
    Wait(done);

    ASSERT_FALSE(done->has_value());
    EXPECT_EQ(done->error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(fetch->IsFinished());
    PollFor(loop, 100ms, [&] { return fetcher->GetStats()->in_flight == 0; });
    EXPECT_EQ(fetcher->GetStats()->in_flight, 0u);
}

TEST_F(ApiClientTest, StreamArticlesSubscribes) {
    responder = [](const HttpRequest&) {
        auto r = FakeResponse::Ok(
            R"({"name":"A","event":{"partition":0,"offset":7}})" "\n"
            R"({"name":"B","event":{"partition":0,"offset":8}})" "\n");
        r.end = FakeResponse::End::Hang;
        return r;
    };
    auto client = Make();

    Request req;
    req.since = "2024-05-01T00:00:00Z";
    std::vector<std::string> names;
    std::optional<StreamOutcome> outcome;
    auto stream = client->StreamArticles(
        req,
        [&](const StreamEvent& e) {
            names.push_back(e.document["name"].GetString());
            return names.size() == 2 ? StreamDecision::Stop : StreamDecision::Continue;
        },
        [&](const StreamOutcome& o) { outcome = o; });
    Wait(outcome);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::Stopped);
    EXPECT_EQ(names, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(outcome->cursor.Serialize(), "0:8");

    const auto& sent = fetcher->Requests().at(0);
    EXPECT_EQ(sent.url, "https://realtime.example.test/v2/articles");
    EXPECT_EQ(HeaderOf(sent, "Accept"), "application/x-ndjson");
    EXPECT_EQ(HeaderOf(sent, "Accept-Encoding"), "gzip");
    EXPECT_EQ(sent.body, R"({"since":"2024-05-01T00:00:00Z"})");
}
