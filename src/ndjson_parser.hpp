// SPDX-License-Identifier: MIT

// src/ndjson_parser.hpp
#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/entry_sink.hpp"
#include "src/log.hpp"
#include "src/tar_reader.hpp"

namespace wme_pipe {

/// True for member names that hold newline-delimited JSON.
inline bool IsRecordFile(std::string_view name) {
    return name.ends_with(".ndjson") || name.ends_with(".json") || name.ends_with(".jsonl");
}

// NdjsonParser - splits entry bytes into lines and parses each line into
// an ArchiveEntry with rapidjson.
//
// Lines are parsed independently: a malformed or overlong line becomes one
// ParseError record and parsing carries on with the next line. Blank lines
// are skipped. Bytes are consumed only up to the last line delivered, so a
// sink that suspends mid-chunk leaves the rest with the upstream.
//
// Members that are not record files are skipped. A member of unknown size
// (a bare, non-tar stream) is always parsed.
template <RecordSink S>
class NdjsonParser : public PipelineComponent<NdjsonParser<S>, S>,
                     public std::enable_shared_from_this<NdjsonParser<S>> {
public:
    static std::shared_ptr<NdjsonParser> Create(IEventLoop& loop,
                                                std::shared_ptr<S> sink,
                                                size_t max_line_size) {
        struct MakeSharedEnabler : public NdjsonParser {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<S> s, size_t m)
                : NdjsonParser(l, std::move(s), m) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(sink), max_line_size);
    }

    void OnEntryBegin(const TarEntryHeader& header) {
        source_ = header.name;
        line_no_ = 0;
        line_.clear();
        overlong_ = false;
        parse_entry_ = !header.size.has_value() || IsRecordFile(header.name);
        if (!parse_entry_) {
            WME_LOG_DEBUG("skipping archive member {}", header.name);
        }
    }

    void OnData(BufferChain& data) {
        auto guard = this->Enter();
        if (!guard) return;

        if (!parse_entry_) {
            data.Consume(data.Size());
            return;
        }
        while (!data.Empty() && !this->IsSuspended() && !this->IsClosed()) {
            auto newline = data.Find(std::byte{'\n'});
            size_t take = newline ? *newline : data.Size();
            AppendToLine(data, take);
            data.Consume(take);
            if (!newline) break;
            data.Consume(1);
            EmitLine();
        }
    }

    // A last line without a trailing newline still counts
    void OnEntryEnd() {
        auto guard = this->Enter();
        if (!guard) return;
        if (parse_entry_ && (!line_.empty() || overlong_)) EmitLine();
        parse_entry_ = false;
    }

    void OnError(const Error& e) { this->AbortWith(e); }

    void OnDone() {
        auto guard = this->Enter();
        if (!guard) return;
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        ReleaseHeldDone();
    }


    void DoClose() {
        line_.clear();
        this->ResetDownstream();
    }

    // Unconsumed input stays upstream; nothing is buffered here but a partial line
    void ResumeWork() {}

    void ReleaseHeldDone() {
        if (this->IsTerminated() || !this->HasDownstream()) return;
        this->MarkTerminated();
        auto sink = sink_;
        sink->OnComplete();
        this->RequestClose();
    }

    uint64_t RecordsDelivered() const { return records_; }
    uint64_t LineErrors() const { return line_errors_; }

private:
    NdjsonParser(IEventLoop& loop, std::shared_ptr<S> sink, size_t max_line_size)
        : PipelineComponent<NdjsonParser<S>, S>(loop),
          sink_(sink),
          max_line_size_(max_line_size) {
        this->SetDownstream(std::move(sink));
    }

    void AppendToLine(const BufferChain& data, size_t n) {
        if (overlong_) return;
        if (max_line_size_ > 0 && line_.size() + n > max_line_size_) {
            overlong_ = true;
            line_.clear();
            return;
        }
        data.CopyTo(0, n, line_);
    }

    void EmitLine() {
        ++line_no_;
        if (overlong_) {
            overlong_ = false;
            line_.clear();
            Deliver(std::unexpected(Error{ErrorCode::ParseError,
                fmt::format("{}:{}: line exceeds {} bytes", source_, line_no_, max_line_size_)}));
            return;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();
        if (std::all_of(line_.begin(), line_.end(),
                        [](unsigned char c) { return std::isspace(c); })) {
            line_.clear();
            return;
        }

        rapidjson::Document doc;
        doc.Parse(line_.data(), line_.size());
        if (doc.HasParseError()) {
            Error e{ErrorCode::ParseError,
                    fmt::format("{}:{}: {} at offset {}", source_, line_no_,
                                rapidjson::GetParseError_En(doc.GetParseError()),
                                doc.GetErrorOffset())};
            line_.clear();
            Deliver(std::unexpected(std::move(e)));
            return;
        }
        ArchiveEntry entry{source_, line_no_, std::move(line_), std::move(doc)};
        line_.clear();
        Deliver(std::move(entry));
    }

    void Deliver(RecordResult record) {
        if (record) {
            ++records_;
        } else {
            ++line_errors_;
        }
        auto sink = sink_;
        sink->OnRecord(std::move(record));
    }

    std::shared_ptr<S> sink_;
    size_t max_line_size_;

    std::string source_;
    std::string line_;
    uint64_t line_no_ = 0;
    uint64_t records_ = 0;
    uint64_t line_errors_ = 0;
    bool parse_entry_ = false;
    bool overlong_ = false;
};

}  // namespace wme_pipe
