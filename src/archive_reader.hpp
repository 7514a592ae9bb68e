// SPDX-License-Identifier: MIT

// src/archive_reader.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/codec.hpp"
#include "lib/stream/decompressor.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/suspendable.hpp"
#include "src/entry_sink.hpp"
#include "src/ndjson_parser.hpp"
#include "src/tar_reader.hpp"

namespace wme_pipe {

struct ArchiveOptions {
    Codec codec = Codec::Auto;
    Container container = Container::Auto;
    size_t max_line_size = 20 * 1024 * 1024;
    std::string default_name = "stream.ndjson";   ///< Entry name for a bare stream
};

// ArchiveReader - compressed container in, records out.
//
// Chains: StreamDecompressor -> TarReader -> NdjsonParser -> EntrySink
//
// Sits as the downstream of a ChunkDownloader or any other byte source.
// Records are delivered one at a time in container order; the callback owns
// each record it receives. Suspend() from inside the record callback stops
// delivery until Resume(). A corrupt or truncated container ends the
// sequence through on_error; a bad line only yields an unexpected record.
//
// Not restartable: once the input is consumed a fresh source is needed.
class ArchiveReader {
public:
    using RecordCallback = EntrySink::RecordCallback;
    using ErrorCallback = std::function<void(const Error&)>;
    using CompleteCallback = std::function<void()>;

    static std::shared_ptr<ArchiveReader> Create(IEventLoop& loop,
                                                 ArchiveOptions options,
                                                 RecordCallback on_record,
                                                 ErrorCallback on_error,
                                                 CompleteCallback on_complete);

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    // Downstream interface for the byte source
    void OnData(BufferChain& data) { decompressor_->OnData(data); }
    void OnError(const Error& e) { decompressor_->OnError(e); }
    void OnDone() { decompressor_->OnDone(); }

    // Backpressure toward the byte source
    void SetUpstream(Suspendable* upstream) { decompressor_->SetUpstream(upstream); }

    void Suspend() { parser_->Suspend(); }
    void Resume() { parser_->Resume(); }
    bool IsSuspended() const { return parser_->IsSuspended(); }

    /// Stop delivering; no callback fires afterwards.
    void Close();

    Codec ActiveCodec() const { return decompressor_->ActiveCodec(); }
    size_t EntriesSeen() const { return tar_->EntriesSeen(); }
    uint64_t RecordsDelivered() const { return parser_->RecordsDelivered(); }
    uint64_t LineErrors() const { return parser_->LineErrors(); }

    /// True once the error or completion callback has run.
    bool IsFinished() const { return *finished_; }

private:
    using Parser = NdjsonParser<EntrySink>;
    using Tar = TarReader<Parser>;
    using Decompressor = StreamDecompressor<Tar>;

    ArchiveReader() = default;

    std::shared_ptr<bool> finished_;
    std::shared_ptr<EntrySink> sink_;
    std::shared_ptr<Parser> parser_;
    std::shared_ptr<Tar> tar_;
    std::shared_ptr<Decompressor> decompressor_;
};

}  // namespace wme_pipe
