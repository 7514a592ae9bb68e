// SPDX-License-Identifier: MIT

// src/byte_sink.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <utility>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"

namespace wme_pipe {

/// Terminal stage of a raw download: each contiguous run of bytes goes to
/// the caller's writer, in resource order.
///
/// Everything handed to OnData is written before it returns; pausing the
/// producer (ChunkDownloader::Suspend) holds back what comes after. Exactly
/// one of the error and completion callbacks runs.
class ByteSink {
public:
    using Writer = std::function<void(std::span<const std::byte>)>;
    using ErrorCallback = std::function<void(const Error&)>;
    using CompleteCallback = std::function<void()>;

    ByteSink(Writer writer, ErrorCallback on_error, CompleteCallback on_complete)
        : writer_(std::move(writer)),
          on_error_(std::move(on_error)),
          on_complete_(std::move(on_complete)) {}

    void OnData(BufferChain& data) {
        while (!data.Empty()) {
            size_t n = data.ContiguousSize();
            if (!finished_) writer_(std::span<const std::byte>(data.DataAt(0), n));
            data.Consume(n);
            written_ += n;
        }
    }

    void OnError(const Error& e) {
        if (std::exchange(finished_, true)) return;
        if (auto cb = std::exchange(on_error_, nullptr)) cb(e);
    }

    void OnDone() {
        if (std::exchange(finished_, true)) return;
        if (auto cb = std::exchange(on_complete_, nullptr)) cb();
    }

    bool IsFinished() const { return finished_; }
    uint64_t BytesWritten() const { return written_; }

private:
    Writer writer_;
    ErrorCallback on_error_;
    CompleteCallback on_complete_;
    uint64_t written_ = 0;
    bool finished_ = false;
};

}  // namespace wme_pipe
