// SPDX-License-Identifier: MIT

// lib/stream/http_client.hpp
#pragma once

#include <llhttp.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_response.hpp"

namespace wme_pipe {

// Response side of an HTTP/1.1 connection, parsed with llhttp.
//
// Fed plaintext by the transport, it shows a 2xx head to D (when D is
// HeadAwareDownstream), streams the body through, and signals OnDone at the
// end of each message. A status of 300 or more never reaches D as data: it
// becomes one OnError whose code follows StatusToErrorCode() and whose
// message carries the start of the error body.
//
// Input is parsed only while the stage is not suspended. Body bytes D has not
// taken, and input not yet parsed, wait in the stage until the final
// Resume(); a message that ends meanwhile pauses llhttp so the next one on
// the connection is not started.
template <Downstream D>
class HttpClient : public PipelineComponent<HttpClient<D>, D>,
                   public std::enable_shared_from_this<HttpClient<D>> {
public:
    static std::shared_ptr<HttpClient> Create(IEventLoop& loop, std::shared_ptr<D> downstream) {
        struct MakeSharedEnabler : public HttpClient {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds)
                : HttpClient(l, std::move(ds)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream));
    }

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Answers to HEAD announce a length but carry no body
    void SetExpectNoBody(bool no_body) { no_body_ = no_body; }

    void OnData(BufferChain& data) {
        auto busy = this->Enter();
        if (!busy) return;
        if (unparsed_.WouldOverflow(data.Size(), kMaxUnparsed)) {
            Fail(ErrorCode::BufferOverflow, "HTTP input buffer overflow");
            return;
        }
        unparsed_.Splice(std::move(data));
        Parse();
    }

    void OnError(const Error& e) { this->AbortWith(e); }

    // The transport reached end of stream
    void OnDone() {
        auto busy = this->Enter();
        if (!busy) return;
        Parse();
        if (this->IsClosed()) return;
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        FinishAtEof();
    }

    void DoClose() {
        unparsed_.Clear();
        body_.Clear();
        this->ResetDownstream();
    }

    void ResumeWork() {
        if (this->PassDown(body_)) return;
        if (complete_ && !FinishMessage()) return;
        llhttp_resume(&parser_);
        Parse();
    }

    void ReleaseHeldDone() {
        auto busy = this->Enter();
        if (!busy) return;
        Parse();
        if (this->IsClosed()) return;
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        FinishAtEof();
    }

private:
    HttpClient(IEventLoop& loop, std::shared_ptr<D> downstream)
        : PipelineComponent<HttpClient<D>, D>(loop) {
        this->SetDownstream(std::move(downstream));
        llhttp_settings_init(&settings_);
        settings_.on_status = OnStatus;
        settings_.on_header_field = OnHeaderField;
        settings_.on_header_value = OnHeaderValue;
        settings_.on_header_value_complete = OnHeaderValueComplete;
        settings_.on_headers_complete = OnHeadersComplete;
        settings_.on_body = OnBody;
        settings_.on_message_complete = OnMessageComplete;
        llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
        parser_.data = this;

        unparsed_.SetRecycleCallback(this->Segments().Recycler());
        body_.SetRecycleCallback(this->Segments().Recycler());
    }

    static HttpClient& Owner(llhttp_t* parser) { return *static_cast<HttpClient*>(parser->data); }

    // Runs llhttp over the buffered input until it is used up, the parser
    // pauses for a suspended downstream, or the stage fails.
    void Parse() {
        while (!unparsed_.Empty() && !this->IsClosed() && !this->IsSuspended()) {
            const char* begin = reinterpret_cast<const char*>(unparsed_.DataAt(0));
            size_t length = unparsed_.ContiguousSize();
            llhttp_errno_t rc = llhttp_execute(&parser_, begin, length);
            if (rc == HPE_PAUSED) {
                unparsed_.Consume(static_cast<size_t>(llhttp_get_error_pos(&parser_) - begin));
                return;
            }
            if (rc != HPE_OK) {
                // Callbacks that stop the parser have reported already
                if (!this->IsClosed()) {
                    Fail(ErrorCode::HttpError,
                         fmt::format("malformed HTTP response: {}", llhttp_errno_name(rc)));
                }
                return;
            }
            unparsed_.Consume(length);
        }
    }

    // Closes out a message whose body has been handed over. False when the
    // stage failed instead.
    bool FinishMessage() {
        if (!body_.Empty()) {
            Fail(ErrorCode::ParseError,
                 fmt::format("{} body bytes not taken at end of message", body_.Size()));
            return false;
        }
        this->EmitDone();
        ++completed_;
        NextMessage();
        return true;
    }

    void FinishAtEof() {
        if (status_ == 0) {
            if (completed_ == 0) {
                Fail(ErrorCode::ConnectionClosed, "connection closed before response");
            } else {
                this->RequestClose();
            }
            return;
        }
        if (status_ >= 300) {
            FailWithStatus();
            return;
        }
        if (llhttp_message_needs_eof(&parser_) != 0) {
            // Ends a close-delimited body through OnMessageComplete
            llhttp_errno_t rc = llhttp_finish(&parser_);
            if (rc != HPE_OK && !this->IsClosed()) {
                Fail(ErrorCode::HttpError,
                     fmt::format("malformed HTTP response: {}", llhttp_errno_name(rc)));
                return;
            }
            this->RequestClose();
            return;
        }
        Fail(ErrorCode::ConnectionClosed, "connection closed mid-response");
    }

    // llhttp carries on with the next response on a kept-alive connection
    void NextMessage() {
        status_ = 0;
        complete_ = false;
        head_ = HttpResponseHead{};
        field_.clear();
        value_.clear();
        retry_after_.reset();
        error_body_.clear();
        body_.Clear();
        this->Rearm();
    }

    void Fail(ErrorCode code, std::string message) {
        this->EmitError(Error{code, std::move(message)});
        this->RequestClose();
    }

    void FailWithStatus() {
        std::string message = fmt::format("HTTP {}", status_);
        if (!error_body_.empty()) message += ": " + error_body_;
        this->EmitError(Error{StatusToErrorCode(status_), std::move(message), 0, retry_after_});
        this->RequestClose();
    }

    static int OnStatus(llhttp_t* parser, const char*, size_t) {
        Owner(parser).status_ = static_cast<int>(parser->status_code);
        return 0;
    }

    // Names and values may arrive in several pieces
    static int OnHeaderField(llhttp_t* parser, const char* at, size_t length) {
        Owner(parser).field_.append(at, length);
        return 0;
    }

    static int OnHeaderValue(llhttp_t* parser, const char* at, size_t length) {
        Owner(parser).value_.append(at, length);
        return 0;
    }

    static int OnHeaderValueComplete(llhttp_t* parser) {
        auto& self = Owner(parser);
        if (http_detail::EqualsIgnoreCase(self.field_, "retry-after")) {
            int seconds = 0;
            const char* end = self.value_.data() + self.value_.size();
            auto [ptr, ec] = std::from_chars(self.value_.data(), end, seconds);
            if (ec == std::errc{} && ptr == end && seconds >= 0) {
                self.retry_after_ = std::chrono::seconds(seconds);
            }
        }
        self.head_.headers.emplace_back(std::exchange(self.field_, {}),
                                        std::exchange(self.value_, {}));
        return 0;
    }

    // Returning 1 tells llhttp the message has no body
    static int OnHeadersComplete(llhttp_t* parser) {
        auto& self = Owner(parser);
        self.head_.status = self.status_;
        if (self.status_ >= 300) return 0;

        if constexpr (HeadAwareDownstream<D>) {
            if (self.HasDownstream()) {
                self.GetDownstream().OnHead(self.head_);
                if (self.IsClosed()) return -1;
            }
        }
        return self.no_body_ ? 1 : 0;
    }

    static int OnBody(llhttp_t* parser, const char* at, size_t length) {
        auto& self = Owner(parser);
        if (self.status_ >= 300) {
            size_t room = kMaxErrorBody - self.error_body_.size();
            self.error_body_.append(at, std::min(length, room));
            return 0;
        }
        if (self.body_.WouldOverflow(length, kMaxBufferedBody)) {
            self.Fail(ErrorCode::BufferOverflow, "HTTP body buffer overflow");
            return -1;
        }
        self.body_.AppendBytes(at, length);
        // A suspension only holds back the next input chunk; what this one
        // produced waits in body_
        self.PassDown(self.body_);
        return self.IsClosed() ? -1 : 0;
    }

    static int OnMessageComplete(llhttp_t* parser) {
        auto& self = Owner(parser);
        self.complete_ = true;
        if (self.status_ >= 300) {
            self.FailWithStatus();
            return -1;
        }
        // Finished by ResumeWork()
        if (self.IsSuspended()) return HPE_PAUSED;
        if (!self.FinishMessage()) return -1;
        return self.IsClosed() ? -1 : 0;
    }

    static constexpr size_t kMaxUnparsed = 16 * 1024 * 1024;
    static constexpr size_t kMaxBufferedBody = 16 * 1024 * 1024;
    static constexpr size_t kMaxErrorBody = 4096;

    llhttp_t parser_;
    llhttp_settings_t settings_;
    bool no_body_ = false;

    int status_ = 0;
    bool complete_ = false;
    size_t completed_ = 0;
    HttpResponseHead head_;
    std::string field_;
    std::string value_;
    std::optional<std::chrono::milliseconds> retry_after_;
    std::string error_body_;

    BufferChain unparsed_;
    BufferChain body_;  // handed down but not yet taken
};

}  // namespace wme_pipe
