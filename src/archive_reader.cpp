// SPDX-License-Identifier: MIT

// src/archive_reader.cpp
#include "src/archive_reader.hpp"

#include <utility>

namespace wme_pipe {

std::shared_ptr<ArchiveReader> ArchiveReader::Create(IEventLoop& loop,
                                                     ArchiveOptions options,
                                                     RecordCallback on_record,
                                                     ErrorCallback on_error,
                                                     CompleteCallback on_complete) {
    struct MakeSharedEnabler : public ArchiveReader {
        MakeSharedEnabler() : ArchiveReader() {}
    };
    std::shared_ptr<ArchiveReader> reader = std::make_shared<MakeSharedEnabler>();

    // Exactly one terminal callback reaches the caller
    auto finished = std::make_shared<bool>(false);
    reader->finished_ = finished;
    reader->sink_ = std::make_shared<EntrySink>(
        std::move(on_record),
        [finished, on_error = std::move(on_error)](const Error& e) {
            if (std::exchange(*finished, true)) return;
            on_error(e);
        },
        [finished, on_complete = std::move(on_complete)]() {
            if (std::exchange(*finished, true)) return;
            on_complete();
        });

    reader->parser_ = Parser::Create(loop, reader->sink_, options.max_line_size);
    reader->tar_ = Tar::Create(loop, reader->parser_, options.container,
                               std::move(options.default_name));
    reader->decompressor_ = Decompressor::Create(loop, reader->tar_, options.codec);
    reader->tar_->SetUpstream(reader->decompressor_.get());
    return reader;
}

void ArchiveReader::Close() {
    sink_->Invalidate();
    decompressor_->RequestClose();
    tar_->RequestClose();
    parser_->RequestClose();
}

}  // namespace wme_pipe
