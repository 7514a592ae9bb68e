// SPDX-License-Identifier: MIT

// src/api_client.cpp
#include "src/api_client.hpp"

#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <rapidjson/error/en.h>

#include "lib/stream/url.hpp"
#include "src/https_fetcher.hpp"
#include "src/log.hpp"
#include "src/response_handlers.hpp"

namespace wme_pipe {

namespace {

constexpr size_t kMaxJsonBody = 64 * 1024 * 1024;
constexpr size_t kMaxHeadBody = 64 * 1024;

constexpr std::string_view kJson = "application/json";
constexpr std::string_view kNdjson = "application/x-ndjson";

std::expected<rapidjson::Document, Error> ParseJsonBody(const std::string& body,
                                                        JsonShape shape) {
    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{ErrorCode::ParseError,
            fmt::format("invalid JSON response: {} at offset {}",
                        rapidjson::GetParseError_En(doc.GetParseError()),
                        doc.GetErrorOffset())});
    }
    if (shape == JsonShape::Array && !doc.IsArray()) {
        return std::unexpected(Error{ErrorCode::ParseError, "expected a JSON array"});
    }
    if (shape == JsonShape::Object && !doc.IsObject()) {
        return std::unexpected(Error{ErrorCode::ParseError, "expected a JSON object"});
    }
    return doc;
}

std::string BatchPrefix(std::chrono::sys_seconds hour) {
    return fmt::format("batches/{:%Y-%m-%d}/{:%H}", hour, hour);
}

// Keeps an operation alive until its callback has run
template <typename T>
std::shared_ptr<RetryingOperation<T>> StartOwned(
    IEventLoop& loop, RetryConfig config, std::string context,
    typename RetryingOperation<T>::Attempt attempt,
    std::function<void(std::expected<T, Error>)> on_done) {
    auto keep = std::make_shared<std::shared_ptr<RetryingOperation<T>>>();
    auto op = RetryingOperation<T>::Start(
        loop, config, std::move(context), std::move(attempt),
        [keep, on_done = std::move(on_done)](std::expected<T, Error> r) {
            auto self = std::move(*keep);
            on_done(std::move(r));
        });
    if (!op->IsFinished()) *keep = op;
    return op;
}

}  // namespace

std::shared_ptr<ApiClient> ApiClient::Create(IEventLoop& loop,
                                             ClientConfig config,
                                             std::shared_ptr<ITokenProvider> tokens,
                                             std::unique_ptr<IHttpFetcher> fetcher) {
    if (!fetcher) fetcher = std::make_unique<HttpsFetcher>(loop, config.timeout);
    struct MakeSharedEnabler : public ApiClient {
        MakeSharedEnabler(IEventLoop& l, ClientConfig c, std::shared_ptr<ITokenProvider> t,
                          std::unique_ptr<IHttpFetcher> f)
            : ApiClient(l, std::move(c), std::move(t), std::move(f)) {}
    };
    return std::make_shared<MakeSharedEnabler>(loop, std::move(config), std::move(tokens),
                                               std::move(fetcher));
}

ApiClient::ApiClient(IEventLoop& loop, ClientConfig config,
                     std::shared_ptr<ITokenProvider> tokens,
                     std::unique_ptr<IHttpFetcher> fetcher)
    : loop_(loop),
      config_(std::move(config)),
      tokens_(std::move(tokens)),
      fetcher_(std::move(fetcher)),
      limiter_(config_.rate_limit_per_second, config_.rate_limit_burst) {}

std::string ApiClient::ApiUrl(std::string_view path) const {
    return JoinUrl(config_.base_url, fmt::format("v2/{}", path));
}

std::expected<HttpRequest, Error> ApiClient::BaseRequest(std::string method, std::string url,
                                                         std::string_view accept) const {
    if (!tokens_) return std::unexpected(Error{ErrorCode::AuthFailed, "no token provider"});
    auto token = tokens_->GetValidToken();
    if (!token) {
        Error e = std::move(token.error());
        e.code = ErrorCode::AuthFailed;
        return std::unexpected(std::move(e));
    }

    HttpRequest req;
    req.method = std::move(method);
    req.url = std::move(url);
    req.headers = {
        {"Authorization", fmt::format("Bearer {}", *token)},
        {"User-Agent", config_.user_agent},
        {"Accept", std::string(accept)},
        {"Accept-Encoding", "identity"},
    };
    return req;
}

// ============================================================================
// Core operations
// ============================================================================

ApiClient::Handle ApiClient::FetchSimple(std::string path, const Request& request,
                                         JsonShape shape, JsonCallback on_done) {
    auto self = shared_from_this();
    std::string url = ApiUrl(path);
    std::string body = request.ToJson();

    using Op = RetryingOperation<rapidjson::Document>;
    Op::Attempt attempt = [self, url, body, shape](uint32_t, Op::Callback done) -> Op::Abort {
        auto handler = std::make_shared<BufferedResponseHandler>(
            [done, shape](std::expected<BufferedResponse, Error> r) {
                if (!r) {
                    done(std::unexpected(std::move(r.error())));
                    return;
                }
                done(ParseJsonBody(r->body, shape));
            },
            kMaxJsonBody);
        RequestFactory build = [self, url, body]() -> std::expected<HttpRequest, Error> {
            auto req = self->BaseRequest("POST", url, kJson);
            if (req) {
                req->content_type = std::string(kJson);
                req->body = body;
            }
            return req;
        };
        auto& loop = self->loop_;
        auto pending = OpenGated(loop, *self->fetcher_, &self->limiter_, std::move(build),
                                 handler, [&loop, done](Error e) {
                                     loop.Defer([done, e]() { done(std::unexpected(e)); });
                                 });
        return [pending]() { pending->Abort(); };
    };

    return StartOwned<rapidjson::Document>(loop_, config_.retry, fmt::format("POST {}", url),
                                           std::move(attempt), std::move(on_done));
}

ApiClient::HeadHandle ApiClient::Head(std::string path, HeadCallback on_done) {
    auto self = shared_from_this();
    std::string url = ApiUrl(path);

    using Op = RetryingOperation<ResourceInfo>;
    Op::Attempt attempt = [self, url](uint32_t, Op::Callback done) -> Op::Abort {
        auto handler = std::make_shared<BufferedResponseHandler>(
            [done](std::expected<BufferedResponse, Error> r) {
                if (!r) {
                    done(std::unexpected(std::move(r.error())));
                    return;
                }
                done(ResourceInfoFromHead(r->head));
            },
            kMaxHeadBody);
        RequestFactory build = [self, url]() { return self->BaseRequest("HEAD", url, "*/*"); };
        auto& loop = self->loop_;
        auto pending = OpenGated(loop, *self->fetcher_, &self->limiter_, std::move(build),
                                 handler, [&loop, done](Error e) {
                                     loop.Defer([done, e]() { done(std::unexpected(e)); });
                                 });
        return [pending]() { pending->Abort(); };
    };

    return StartOwned<ResourceInfo>(loop_, config_.retry, fmt::format("HEAD {}", url),
                                    std::move(attempt), std::move(on_done));
}

std::shared_ptr<LargeFetch> ApiClient::FetchLarge(ResourceDescriptor resource,
                                                  DownloadOptions options,
                                                  RecordCallback on_record,
                                                  CompletionCallback on_complete) {
    ArchiveOptions archive;
    archive.max_line_size = config_.max_line_size;
    if (resource.content_type.find("json") != std::string::npos) {
        archive.container = Container::None;
    }

    struct MakeSharedEnabler : public LargeFetch {
        MakeSharedEnabler() : LargeFetch() {}
    };
    std::shared_ptr<LargeFetch> fetch = std::make_shared<MakeSharedEnabler>();

    // Broken once the terminal callback has run
    auto keep = std::make_shared<std::shared_ptr<LargeFetch>>(fetch);
    auto complete = std::make_shared<CompletionCallback>(std::move(on_complete));
    fetch->reader_ = ArchiveReader::Create(
        loop_, archive, std::move(on_record),
        [keep, complete](const Error& e) {
            auto self = std::exchange(*keep, nullptr);
            if (*complete) (*complete)(std::unexpected(e));
        },
        [keep, complete]() {
            auto self = std::exchange(*keep, nullptr);
            if (*complete) (*complete)({});
        });

    RequestFactory make_request = DownloadRequest(resource.url);
    fetch->downloader_ = ChunkDownloader<ArchiveReader>::Create(
        loop_, fetch->reader_, *fetcher_, &limiter_, std::move(resource), std::move(options),
        std::move(make_request));
    fetch->downloader_->Start();
    return fetch;
}

std::shared_ptr<Download> ApiClient::FetchRaw(ResourceDescriptor resource,
                                              DownloadOptions options,
                                              Download::Writer writer,
                                              Download::CompletionCallback on_complete) {
    struct MakeSharedEnabler : public Download {
        MakeSharedEnabler() : Download() {}
    };
    std::shared_ptr<Download> download = std::make_shared<MakeSharedEnabler>();

    // Broken once the terminal callback has run
    auto keep = std::make_shared<std::shared_ptr<Download>>(download);
    auto complete = std::make_shared<Download::CompletionCallback>(std::move(on_complete));
    download->sink_ = std::make_shared<ByteSink>(
        std::move(writer),
        [keep, complete](const Error& e) {
            auto self = std::exchange(*keep, nullptr);
            if (*complete) (*complete)(std::unexpected(e));
        },
        [keep, complete]() {
            auto self = std::exchange(*keep, nullptr);
            if (*complete) (*complete)({});
        });

    RequestFactory make_request = DownloadRequest(resource.url);
    download->downloader_ = ChunkDownloader<ByteSink>::Create(
        loop_, download->sink_, *fetcher_, &limiter_, std::move(resource), std::move(options),
        std::move(make_request));
    download->downloader_->Start();
    return download;
}

std::shared_ptr<RealtimeClient> ApiClient::ConsumeStream(
    std::string endpoint, Request request, RealtimeClient::Predicate predicate,
    RealtimeClient::OutcomeCallback on_outcome, std::optional<ResumeCursor> resume_from) {
    auto self = shared_from_this();
    std::string url = JoinUrl(config_.realtime_url, fmt::format("v2/{}", endpoint));

    RealtimeClient::RequestBuilder build =
        [self, url](const Request& payload) -> std::expected<HttpRequest, Error> {
        auto req = self->BaseRequest("GET", url, kNdjson);
        if (!req) return req;
        req->headers.emplace_back("Cache-Control", "no-cache");
        req->headers.emplace_back("Connection", "keep-alive");
        // The stream itself may arrive compressed; the consumer decodes it
        for (auto& [name, value] : req->headers) {
            if (name == "Accept-Encoding") value = "gzip";
        }
        req->content_type = std::string(kJson);
        req->body = payload.ToJson();
        return req;
    };

    StreamOptions options;
    options.request = std::move(request);
    options.reconnect = config_.stream_retry;
    options.max_line_size = config_.max_line_size;
    options.resume_from = std::move(resume_from);

    auto stream = RealtimeClient::Create(loop_, *fetcher_, &limiter_, std::move(build),
                                         std::move(options), std::move(predicate),
                                         std::move(on_outcome));
    stream->Start();
    return stream;
}

DownloadOptions ApiClient::ConfiguredDownload() const {
    DownloadOptions options;
    options.chunk_size = config_.download_chunk_size;
    options.concurrency = config_.download_concurrency;
    options.retry = config_.download_retry;
    return options;
}

RequestFactory ApiClient::DownloadRequest(std::string url) {
    return [client = shared_from_this(), url = std::move(url)]() {
        return client->BaseRequest("GET", url, "*/*");
    };
}

std::shared_ptr<LargeFetch> ApiClient::ReadDownload(std::string path, RecordCallback on_record,
                                                    CompletionCallback on_complete) {
    return FetchLarge(ResourceDescriptor{ApiUrl(path)}, ConfiguredDownload(),
                      std::move(on_record), std::move(on_complete));
}

std::shared_ptr<Download> ApiClient::RawDownload(std::string path, Download::Writer writer,
                                                 CompletionCallback on_complete) {
    return FetchRaw(ResourceDescriptor{ApiUrl(path)}, ConfiguredDownload(), std::move(writer),
                    std::move(on_complete));
}

// ============================================================================
// Endpoint helpers
// ============================================================================

ApiClient::Handle ApiClient::GetCodes(const Request& req, JsonCallback cb) {
    return FetchSimple("codes", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetCode(std::string_view id, const Request& req, JsonCallback cb) {
    return FetchSimple(fmt::format("codes/{}", UrlEncode(id)), req, JsonShape::Object,
                       std::move(cb));
}

ApiClient::Handle ApiClient::GetLanguages(const Request& req, JsonCallback cb) {
    return FetchSimple("languages", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetLanguage(std::string_view id, const Request& req,
                                         JsonCallback cb) {
    return FetchSimple(fmt::format("languages/{}", UrlEncode(id)), req, JsonShape::Object,
                       std::move(cb));
}

ApiClient::Handle ApiClient::GetProjects(const Request& req, JsonCallback cb) {
    return FetchSimple("projects", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetProject(std::string_view id, const Request& req,
                                        JsonCallback cb) {
    return FetchSimple(fmt::format("projects/{}", UrlEncode(id)), req, JsonShape::Object,
                       std::move(cb));
}

ApiClient::Handle ApiClient::GetNamespaces(const Request& req, JsonCallback cb) {
    return FetchSimple("namespaces", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetNamespace(int id, const Request& req, JsonCallback cb) {
    return FetchSimple(fmt::format("namespaces/{}", id), req, JsonShape::Object, std::move(cb));
}

ApiClient::Handle ApiClient::GetSnapshots(const Request& req, JsonCallback cb) {
    return FetchSimple("snapshots", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetSnapshot(std::string_view id, const Request& req,
                                         JsonCallback cb) {
    return FetchSimple(fmt::format("snapshots/{}", UrlEncode(id)), req, JsonShape::Object,
                       std::move(cb));
}

ApiClient::HeadHandle ApiClient::HeadSnapshot(std::string_view id, HeadCallback cb) {
    return Head(fmt::format("snapshots/{}/download", UrlEncode(id)), std::move(cb));
}

std::shared_ptr<LargeFetch> ApiClient::ReadSnapshot(std::string_view id,
                                                    RecordCallback on_record,
                                                    CompletionCallback on_complete) {
    return ReadDownload(fmt::format("snapshots/{}/download", UrlEncode(id)),
                        std::move(on_record), std::move(on_complete));
}

std::shared_ptr<Download> ApiClient::DownloadSnapshot(std::string_view id,
                                                     Download::Writer writer,
                                                     CompletionCallback on_complete) {
    return RawDownload(fmt::format("snapshots/{}/download", UrlEncode(id)), std::move(writer),
                       std::move(on_complete));
}

ApiClient::Handle ApiClient::GetChunks(std::string_view snapshot, const Request& req,
                                       JsonCallback cb) {
    return FetchSimple(fmt::format("snapshots/{}/chunks", UrlEncode(snapshot)), req,
                       JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetChunk(std::string_view snapshot, std::string_view id,
                                      const Request& req, JsonCallback cb) {
    return FetchSimple(fmt::format("snapshots/{}/chunks/{}", UrlEncode(snapshot), UrlEncode(id)),
                       req, JsonShape::Object, std::move(cb));
}

ApiClient::HeadHandle ApiClient::HeadChunk(std::string_view snapshot, std::string_view id,
                                           HeadCallback cb) {
    return Head(fmt::format("snapshots/{}/chunks/{}/download", UrlEncode(snapshot),
                            UrlEncode(id)),
                std::move(cb));
}

std::shared_ptr<LargeFetch> ApiClient::ReadChunk(std::string_view snapshot, std::string_view id,
                                                 RecordCallback on_record,
                                                 CompletionCallback on_complete) {
    return ReadDownload(fmt::format("snapshots/{}/chunks/{}/download", UrlEncode(snapshot),
                                    UrlEncode(id)),
                        std::move(on_record), std::move(on_complete));
}

std::shared_ptr<Download> ApiClient::DownloadChunk(std::string_view snapshot,
                                                  std::string_view id, Download::Writer writer,
                                                  CompletionCallback on_complete) {
    return RawDownload(fmt::format("snapshots/{}/chunks/{}/download", UrlEncode(snapshot),
                                   UrlEncode(id)),
                       std::move(writer), std::move(on_complete));
}

ApiClient::Handle ApiClient::GetBatches(std::chrono::sys_seconds hour, const Request& req,
                                        JsonCallback cb) {
    return FetchSimple(BatchPrefix(hour), req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetBatch(std::chrono::sys_seconds hour, std::string_view id,
                                      const Request& req, JsonCallback cb) {
    return FetchSimple(fmt::format("{}/{}", BatchPrefix(hour), UrlEncode(id)), req,
                       JsonShape::Object, std::move(cb));
}

ApiClient::HeadHandle ApiClient::HeadBatch(std::chrono::sys_seconds hour, std::string_view id,
                                           HeadCallback cb) {
    return Head(fmt::format("{}/{}/download", BatchPrefix(hour), UrlEncode(id)), std::move(cb));
}

std::shared_ptr<LargeFetch> ApiClient::ReadBatch(std::chrono::sys_seconds hour,
                                                 std::string_view id,
                                                 RecordCallback on_record,
                                                 CompletionCallback on_complete) {
    return ReadDownload(fmt::format("{}/{}/download", BatchPrefix(hour), UrlEncode(id)),
                        std::move(on_record), std::move(on_complete));
}

std::shared_ptr<Download> ApiClient::DownloadBatch(std::chrono::sys_seconds hour,
                                                  std::string_view id, Download::Writer writer,
                                                  CompletionCallback on_complete) {
    return RawDownload(fmt::format("{}/{}/download", BatchPrefix(hour), UrlEncode(id)),
                       std::move(writer), std::move(on_complete));
}

ApiClient::Handle ApiClient::GetStructuredSnapshots(const Request& req, JsonCallback cb) {
    return FetchSimple("snapshots/structured-contents/", req, JsonShape::Array, std::move(cb));
}

ApiClient::Handle ApiClient::GetStructuredSnapshot(std::string_view id, const Request& req,
                                                   JsonCallback cb) {
    return FetchSimple(fmt::format("snapshots/structured-contents/{}", UrlEncode(id)), req,
                       JsonShape::Object, std::move(cb));
}

ApiClient::HeadHandle ApiClient::HeadStructuredSnapshot(std::string_view id, HeadCallback cb) {
    return Head(fmt::format("snapshots/structured-contents/{}/download", UrlEncode(id)),
                std::move(cb));
}

std::shared_ptr<LargeFetch> ApiClient::ReadStructuredSnapshot(std::string_view id,
                                                              RecordCallback on_record,
                                                              CompletionCallback on_complete) {
    return ReadDownload(fmt::format("snapshots/structured-contents/{}/download", UrlEncode(id)),
                        std::move(on_record), std::move(on_complete));
}

std::shared_ptr<Download> ApiClient::DownloadStructuredSnapshot(std::string_view id,
                                                               Download::Writer writer,
                                                               CompletionCallback on_complete) {
    return RawDownload(fmt::format("snapshots/structured-contents/{}/download", UrlEncode(id)),
                       std::move(writer), std::move(on_complete));
}

ApiClient::Handle ApiClient::GetArticles(std::string_view name, const Request& req,
                                         JsonCallback cb) {
    return FetchSimple(fmt::format("articles/{}", UrlEncode(name)), req, JsonShape::Array,
                       std::move(cb));
}

ApiClient::Handle ApiClient::GetStructuredContents(std::string_view name, const Request& req,
                                                   JsonCallback cb) {
    return FetchSimple(fmt::format("structured-contents/{}", UrlEncode(name)), req,
                       JsonShape::Array, std::move(cb));
}

std::shared_ptr<RealtimeClient> ApiClient::StreamArticles(
    Request req, RealtimeClient::Predicate predicate,
    RealtimeClient::OutcomeCallback on_outcome, std::optional<ResumeCursor> resume_from) {
    return ConsumeStream("articles", std::move(req), std::move(predicate),
                         std::move(on_outcome), std::move(resume_from));
}

}  // namespace wme_pipe
