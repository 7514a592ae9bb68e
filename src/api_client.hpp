// SPDX-License-Identifier: MIT

// src/api_client.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

#include "lib/stream/codec.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/archive_reader.hpp"
#include "src/byte_sink.hpp"
#include "src/chunk_downloader.hpp"
#include "src/config.hpp"
#include "src/http_fetcher.hpp"
#include "src/rate_limiter.hpp"
#include "src/realtime_client.hpp"
#include "src/request.hpp"
#include "src/resource.hpp"
#include "src/retry_policy.hpp"
#include "src/token_provider.hpp"

namespace wme_pipe {

/// Root shape a JSON endpoint must answer with.
enum class JsonShape { Any, Array, Object };

// LargeFetch - one download-and-read of an archive resource.
//
// Chains: ChunkDownloader -> ArchiveReader (decompress, untar, parse)
//
// Records reach on_record one at a time, in archive order; on_complete
// fires exactly once afterwards with the terminal result. Suspend() and
// Resume() apply backpressure all the way to the network and must be called
// from the event loop thread, typically from inside on_record.
class LargeFetch {
public:
    using RecordCallback = ArchiveReader::RecordCallback;
    using CompletionCallback = std::function<void(std::expected<void, Error>)>;

    /// Stop every worker; on_complete sees ErrorCode::Cancelled.
    void Cancel() { downloader_->Cancel(); }

    void Suspend() { reader_->Suspend(); }
    void Resume() { reader_->Resume(); }

    /// True once on_complete has run, after the last record.
    bool IsFinished() const { return reader_->IsFinished(); }
    const std::vector<ByteRange>& Plan() const { return downloader_->Plan(); }
    size_t PeakInFlight() const { return downloader_->PeakInFlight(); }
    uint64_t RecordsDelivered() const { return reader_->RecordsDelivered(); }
    uint64_t LineErrors() const { return reader_->LineErrors(); }
    size_t EntriesSeen() const { return reader_->EntriesSeen(); }
    Codec ActiveCodec() const { return reader_->ActiveCodec(); }

private:
    friend class ApiClient;

    LargeFetch() = default;

    std::shared_ptr<ArchiveReader> reader_;
    std::shared_ptr<ChunkDownloader<ArchiveReader>> downloader_;
};

// Download - one transfer of a resource's bytes, as stored, into a writer.
//
// Chains: ChunkDownloader -> ByteSink
//
// Same ordering, retry and cancellation rules as LargeFetch; the bytes are
// not decompressed or parsed. Where they go (memory, a file, a socket) is up
// to the writer.
class Download {
public:
    using Writer = ByteSink::Writer;
    using CompletionCallback = std::function<void(std::expected<void, Error>)>;

    void Cancel() { downloader_->Cancel(); }

    void Suspend() { downloader_->Suspend(); }
    void Resume() { downloader_->Resume(); }

    bool IsFinished() const { return sink_->IsFinished(); }
    uint64_t BytesWritten() const { return sink_->BytesWritten(); }
    const std::vector<ByteRange>& Plan() const { return downloader_->Plan(); }

private:
    friend class ApiClient;

    Download() = default;

    std::shared_ptr<ByteSink> sink_;
    std::shared_ptr<ChunkDownloader<ByteSink>> downloader_;
};

// ApiClient - caller-facing surface of the retrieval engine.
//
// Every request takes a token from the shared rate limiter, carries the
// bearer token, user agent and Accept-Encoding headers, and (apart from the
// real-time stream, which reconnects on its own terms) runs under a
// RetryPolicy. Results arrive on the event loop thread.
//
// Operations keep the client alive until they finish.
//
// Usage:
//   EventLoop loop;
//   auto tokens = std::make_shared<StaticTokenProvider>(token);
//   auto client = ApiClient::Create(loop, ClientConfig{}, tokens);
//   client->GetProjects({}, [](auto r) { ... });
//   loop.Run();
class ApiClient : public std::enable_shared_from_this<ApiClient> {
public:
    using JsonCallback = std::function<void(std::expected<rapidjson::Document, Error>)>;
    using HeadCallback = std::function<void(std::expected<ResourceInfo, Error>)>;
    using RecordCallback = LargeFetch::RecordCallback;
    using CompletionCallback = LargeFetch::CompletionCallback;
    using Handle = std::shared_ptr<RetryingOperation<rapidjson::Document>>;
    using HeadHandle = std::shared_ptr<RetryingOperation<ResourceInfo>>;

    /// With no fetcher an HttpsFetcher using config.timeout is created.
    static std::shared_ptr<ApiClient> Create(IEventLoop& loop,
                                             ClientConfig config,
                                             std::shared_ptr<ITokenProvider> tokens,
                                             std::unique_ptr<IHttpFetcher> fetcher = nullptr);

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    // =========================================================================
    // Core operations
    // =========================================================================

    /// POST the request as JSON to base_url + "v2/" + path and parse the reply.
    Handle FetchSimple(std::string path, const Request& request, JsonShape shape,
                       JsonCallback on_done);

    /// HEAD base_url + "v2/" + path.
    HeadHandle Head(std::string path, HeadCallback on_done);

    /// Download `resource` (chunked when possible) and read it as an archive.
    std::shared_ptr<LargeFetch> FetchLarge(ResourceDescriptor resource,
                                           DownloadOptions options,
                                           RecordCallback on_record,
                                           CompletionCallback on_complete);

    /// Download `resource` (chunked when possible) into `writer` unchanged.
    std::shared_ptr<Download> FetchRaw(ResourceDescriptor resource,
                                       DownloadOptions options,
                                       Download::Writer writer,
                                       Download::CompletionCallback on_complete);

    /// Subscribe to realtime_url + "v2/" + endpoint. The stream is started
    /// before this returns.
    std::shared_ptr<RealtimeClient> ConsumeStream(std::string endpoint,
                                                  Request request,
                                                  RealtimeClient::Predicate predicate,
                                                  RealtimeClient::OutcomeCallback on_outcome,
                                                  std::optional<ResumeCursor> resume_from = {});

    // =========================================================================
    // Metadata
    // =========================================================================

    Handle GetCodes(const Request& req, JsonCallback cb);
    Handle GetCode(std::string_view id, const Request& req, JsonCallback cb);
    Handle GetLanguages(const Request& req, JsonCallback cb);
    Handle GetLanguage(std::string_view id, const Request& req, JsonCallback cb);
    Handle GetProjects(const Request& req, JsonCallback cb);
    Handle GetProject(std::string_view id, const Request& req, JsonCallback cb);
    Handle GetNamespaces(const Request& req, JsonCallback cb);
    Handle GetNamespace(int id, const Request& req, JsonCallback cb);

    // =========================================================================
    // Snapshots, chunks and batches
    // =========================================================================

    Handle GetSnapshots(const Request& req, JsonCallback cb);
    Handle GetSnapshot(std::string_view id, const Request& req, JsonCallback cb);
    HeadHandle HeadSnapshot(std::string_view id, HeadCallback cb);
    std::shared_ptr<LargeFetch> ReadSnapshot(std::string_view id, RecordCallback on_record,
                                             CompletionCallback on_complete);
    std::shared_ptr<Download> DownloadSnapshot(std::string_view id, Download::Writer writer,
                                               CompletionCallback on_complete);

    Handle GetChunks(std::string_view snapshot, const Request& req, JsonCallback cb);
    Handle GetChunk(std::string_view snapshot, std::string_view id, const Request& req,
                    JsonCallback cb);
    HeadHandle HeadChunk(std::string_view snapshot, std::string_view id, HeadCallback cb);
    std::shared_ptr<LargeFetch> ReadChunk(std::string_view snapshot, std::string_view id,
                                          RecordCallback on_record,
                                          CompletionCallback on_complete);
    std::shared_ptr<Download> DownloadChunk(std::string_view snapshot, std::string_view id,
                                            Download::Writer writer,
                                            CompletionCallback on_complete);

    /// Batches are addressed by UTC date and hour of `hour`.
    Handle GetBatches(std::chrono::sys_seconds hour, const Request& req, JsonCallback cb);
    Handle GetBatch(std::chrono::sys_seconds hour, std::string_view id, const Request& req,
                    JsonCallback cb);
    HeadHandle HeadBatch(std::chrono::sys_seconds hour, std::string_view id, HeadCallback cb);
    std::shared_ptr<LargeFetch> ReadBatch(std::chrono::sys_seconds hour, std::string_view id,
                                          RecordCallback on_record,
                                          CompletionCallback on_complete);
    std::shared_ptr<Download> DownloadBatch(std::chrono::sys_seconds hour, std::string_view id,
                                            Download::Writer writer,
                                            CompletionCallback on_complete);

    Handle GetStructuredSnapshots(const Request& req, JsonCallback cb);
    Handle GetStructuredSnapshot(std::string_view id, const Request& req, JsonCallback cb);
    HeadHandle HeadStructuredSnapshot(std::string_view id, HeadCallback cb);
    std::shared_ptr<LargeFetch> ReadStructuredSnapshot(std::string_view id,
                                                       RecordCallback on_record,
                                                       CompletionCallback on_complete);
    std::shared_ptr<Download> DownloadStructuredSnapshot(std::string_view id,
                                                         Download::Writer writer,
                                                         CompletionCallback on_complete);

    // =========================================================================
    // On-demand and real-time
    // =========================================================================

    Handle GetArticles(std::string_view name, const Request& req, JsonCallback cb);
    Handle GetStructuredContents(std::string_view name, const Request& req, JsonCallback cb);

    std::shared_ptr<RealtimeClient> StreamArticles(Request req,
                                                   RealtimeClient::Predicate predicate,
                                                   RealtimeClient::OutcomeCallback on_outcome,
                                                   std::optional<ResumeCursor> resume_from = {});

    const ClientConfig& Config() const { return config_; }
    RateLimiter& Limiter() { return limiter_; }

private:
    ApiClient(IEventLoop& loop, ClientConfig config, std::shared_ptr<ITokenProvider> tokens,
              std::unique_ptr<IHttpFetcher> fetcher);

    /// Method, URL and the headers every request carries; fails with AuthFailed
    /// when no token is available.
    std::expected<HttpRequest, Error> BaseRequest(std::string method, std::string url,
                                                  std::string_view accept) const;

    std::string ApiUrl(std::string_view path) const;
    DownloadOptions ConfiguredDownload() const;
    RequestFactory DownloadRequest(std::string url);
    std::shared_ptr<LargeFetch> ReadDownload(std::string path, RecordCallback on_record,
                                             CompletionCallback on_complete);
    std::shared_ptr<Download> RawDownload(std::string path, Download::Writer writer,
                                          CompletionCallback on_complete);

    IEventLoop& loop_;
    ClientConfig config_;
    std::shared_ptr<ITokenProvider> tokens_;
    std::unique_ptr<IHttpFetcher> fetcher_;
    RateLimiter limiter_;
};

}  // namespace wme_pipe
