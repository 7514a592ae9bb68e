// SPDX-License-Identifier: MIT

// lib/stream/decompressor.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/codec.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace wme_pipe {

// StreamDecompressor - incremental gzip/zstd/identity decoding stage.
//
// With Codec::Auto the codec is chosen from the first bytes of the stream.
// Output is decoded straight into pooled segments and forwarded as it is
// produced, so at most one input chunk's worth of output is buffered.
template <Downstream D>
class StreamDecompressor : public PipelineComponent<StreamDecompressor<D>, D>,
                           public std::enable_shared_from_this<StreamDecompressor<D>> {
public:
    static std::shared_ptr<StreamDecompressor> Create(IEventLoop& loop,
                                                      std::shared_ptr<D> downstream,
                                                      Codec codec = Codec::Auto) {
        struct MakeSharedEnabler : public StreamDecompressor {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds, Codec c)
                : StreamDecompressor(l, std::move(ds), c) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream), codec);
    }

    void OnData(BufferChain& data);
    void OnError(const Error& e) { this->AbortWith(e); }
    void OnDone();

    /// Codec in use; Auto until enough bytes arrived to decide.
    Codec ActiveCodec() const { return codec_; }


    void DoClose() {
        inflater_.reset();
        output_chain_.Clear();
        pending_input_.Clear();
        this->ResetDownstream();
    }

    void ResumeWork() {
        if (this->PassDown(output_chain_)) return;
        ProcessPendingData();
    }

    void ReleaseHeldDone() {
        auto result = ProcessPendingData();
        if (result == Result::Error) return;
        if (result == Result::Suspended) {
            this->HoldDone();
            return;
        }
        Finish();
    }

private:
    StreamDecompressor(IEventLoop& loop, std::shared_ptr<D> downstream, Codec codec)
        : PipelineComponent<StreamDecompressor<D>, D>(loop), codec_(codec) {
        this->SetDownstream(std::move(downstream));
        output_chain_.SetRecycleCallback(this->Segments().Recycler());
        if (codec_ != Codec::Auto) inflater_ = MakeInflater(codec_);
    }

    enum class Result { Complete, Suspended, Error };

    // Returns false until the codec is known
    bool ResolveCodec(bool at_eof);
    Result ProcessPendingData();
    Result DecodeChain(BufferChain& chain);
    void Finish();

    void Fail(Error e) {
        this->EmitError(e);
        this->RequestClose();
    }

    Codec codec_;
    std::unique_ptr<Inflater> inflater_;
    BufferChain output_chain_;   // decoded, not yet taken by downstream
    BufferChain pending_input_;  // encoded, waiting for resume or codec sniff

    static constexpr size_t kMaxPendingInput = 256 * 1024 * 1024;
};

// Implementation

template <Downstream D>
bool StreamDecompressor<D>::ResolveCodec(bool at_eof) {
    if (codec_ != Codec::Auto) return true;
    if (pending_input_.Size() < kCodecMagicSize && !at_eof) return false;

    std::byte head[kCodecMagicSize] = {};
    size_t n = std::min(pending_input_.Size(), kCodecMagicSize);
    pending_input_.CopyTo(0, n, head);
    codec_ = SniffCodec(std::span<const std::byte>(head, n));
    inflater_ = MakeInflater(codec_);
    return true;
}

template <Downstream D>
void StreamDecompressor<D>::OnData(BufferChain& data) {
    auto guard = this->Enter();
    if (!guard) return;

    if (pending_input_.WouldOverflow(data.Size(), kMaxPendingInput)) {
        Fail(Error{ErrorCode::BufferOverflow, "decompressor input buffer overflow"});
        return;
    }
    pending_input_.Splice(std::move(data));
    if (!ResolveCodec(false)) return;
    ProcessPendingData();
}

template <Downstream D>
auto StreamDecompressor<D>::ProcessPendingData() -> Result {
    if (this->IsClosed()) return Result::Error;
    if (codec_ == Codec::Auto) return Result::Complete;
    if (this->IsSuspended()) return Result::Suspended;

    if (!inflater_) {
        // Identity: hand the bytes on as they are
        output_chain_.Splice(std::move(pending_input_));
        return this->PassDown(output_chain_) ? Result::Suspended : Result::Complete;
    }
    return DecodeChain(pending_input_);
}

template <Downstream D>
auto StreamDecompressor<D>::DecodeChain(BufferChain& chain) -> Result {
    while (!chain.Empty()) {
        size_t chunk_size = chain.ContiguousSize();
        std::span<const std::byte> in(chain.DataAt(0), chunk_size);
        size_t in_pos = 0;
        bool output_full = false;

        // Keep calling while input remains or the last call filled its
        // segment (the codec may hold more output internally)
        while (in_pos < in.size() || output_full) {
            auto seg = this->Segments().Acquire();
            auto step = inflater_->Inflate(in.subspan(in_pos),
                                           std::span<std::byte>(seg->data.data(), Segment::kSize));
            if (!step) {
                Fail(step.error());
                return Result::Error;
            }
            in_pos += step->consumed;
            output_full = step->produced == Segment::kSize;

            if (step->produced > 0) {
                seg->size = step->produced;
                output_chain_.Append(std::move(seg));
                if (this->PassDown(output_chain_)) {
                    chain.Consume(in_pos);
                    return Result::Suspended;
                }
            } else if (step->consumed == 0) {
                break;  // codec needs more input than this chunk holds
            }
        }
        chain.Consume(in_pos);
        if (in_pos < chunk_size) {
            // Leftover that the codec refused to take means trailing garbage
            Fail(Error{ErrorCode::DecompressionError,
                       std::string(codec_name(codec_)) + ": trailing data after end of stream"});
            return Result::Error;
        }
    }
    return Result::Complete;
}

template <Downstream D>
void StreamDecompressor<D>::OnDone() {
    auto guard = this->Enter();
    if (!guard) return;

    if (this->IsSuspended()) {
        this->HoldDone();
        return;
    }
    ResolveCodec(true);
    auto result = ProcessPendingData();
    if (result == Result::Error) return;
    if (result == Result::Suspended) {
        this->HoldDone();
        return;
    }
    Finish();
}

template <Downstream D>
void StreamDecompressor<D>::Finish() {
    if (inflater_ && !inflater_->AtBoundary()) {
        Fail(Error{ErrorCode::DecompressionError,
                   std::string(codec_name(codec_)) + ": stream truncated"});
        return;
    }
    if (this->DeliverThenDone(output_chain_)) {
        this->RequestClose();
    }
}

}  // namespace wme_pipe
