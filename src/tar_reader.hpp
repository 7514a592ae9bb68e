// SPDX-License-Identifier: MIT

// src/tar_reader.hpp
#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/tar_header.hpp"

namespace wme_pipe {

enum class Container {
    Auto,   ///< ustar magic decides
    Tar,
    None,   ///< the whole stream is one entry
};

struct TarEntryHeader {
    std::string name;
    std::optional<uint64_t> size;   ///< Unknown for Container::None
};

// Receives the members of an archive: OnEntryBegin, then the member's bytes
// through OnData, then OnEntryEnd.
template <typename D>
concept EntryDownstream = Downstream<D> && requires(D& d, const TarEntryHeader& h) {
    { d.OnEntryBegin(h) } -> std::same_as<void>;
    { d.OnEntryEnd() } -> std::same_as<void>;
};

// TarReader - walks a decompressed byte stream as tar members.
//
// Header blocks are gathered into runs (extension headers plus the member
// header they qualify) and decoded by libarchive; member data is framed
// here and streamed without buffering the member. Regular files are
// announced with OnEntryBegin and their bytes forwarded; directories, links
// and other special members are skipped. Two zero blocks end the archive
// and anything after them is ignored. EOF anywhere but on a header boundary
// is an ArchiveError.
//
// With Container::None (or Auto on a stream without ustar magic) the whole
// stream is forwarded as a single entry named by `default_name`.
template <EntryDownstream D>
class TarReader : public PipelineComponent<TarReader<D>, D>,
                  public std::enable_shared_from_this<TarReader<D>> {
public:
    static std::shared_ptr<TarReader> Create(IEventLoop& loop,
                                             std::shared_ptr<D> downstream,
                                             Container container,
                                             std::string default_name) {
        struct MakeSharedEnabler : public TarReader {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds, Container c, std::string n)
                : TarReader(l, std::move(ds), c, std::move(n)) {}
        };
        auto reader = std::make_shared<MakeSharedEnabler>(loop, std::move(downstream), container,
                                                          std::move(default_name));
        if constexpr (requires(D& d) { d.SetUpstream(static_cast<Suspendable*>(nullptr)); }) {
            reader->GetDownstream().SetUpstream(reader.get());
        }
        return reader;
    }

    void OnData(BufferChain& data) {
        auto guard = this->Enter();
        if (!guard) return;
        if (pending_.WouldOverflow(data.Size(), kMaxPendingInput)) {
            Fail(Error{ErrorCode::BufferOverflow, "tar input buffer overflow"});
            return;
        }
        pending_.Splice(std::move(data));
        if (!this->IsSuspended()) Process();
    }

    void OnError(const Error& e) { this->AbortWith(e); }

    void OnDone() {
        auto guard = this->Enter();
        if (!guard) return;
        at_eof_ = true;
        if (!this->IsSuspended()) Process();
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        ReleaseHeldDone();
    }


    void DoClose() {
        pending_.Clear();
        body_.Clear();
        this->ResetDownstream();
    }

    void ResumeWork() {
        if (this->PassDown(body_)) return;
        Process();
    }

    void ReleaseHeldDone() {
        if (this->IsClosed()) return;
        Process();
        if (this->IsClosed()) return;
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        Finish();
    }

    Container DetectedContainer() const { return container_; }
    size_t EntriesSeen() const { return entries_; }

private:
    TarReader(IEventLoop& loop, std::shared_ptr<D> downstream, Container container,
              std::string default_name)
        : PipelineComponent<TarReader<D>, D>(loop),
          container_(container),
          default_name_(std::move(default_name)) {
        this->SetDownstream(std::move(downstream));
        body_.SetRecycleCallback(this->Segments().Recycler());
    }

    using Block = std::array<std::byte, tar::kBlockSize>;

    enum class State { Header, Extension, Body, Skip, End };

    void Fail(Error e) {
        this->EmitError(e);
        this->RequestClose();
    }

    // Runs until input is exhausted, the downstream suspends us, or we fail
    void Process() {
        while (!this->IsClosed() && !this->IsSuspended()) {
            if (container_ == Container::Auto && !Detect()) return;
            if (container_ == Container::None) {
                Passthrough();
                return;
            }
            bool progressed = false;
            switch (state_) {
                case State::Header: progressed = ReadHeaderBlock(); break;
                case State::Extension: progressed = ReadExtension(); break;
                case State::Body: progressed = ReadBody(); break;
                case State::Skip: progressed = SkipBytes(); break;
                case State::End:
                    pending_.Consume(pending_.Size());
                    return;
            }
            if (!progressed) return;
        }
    }

    bool Detect() {
        if (pending_.Size() < tar::kBlockSize && !at_eof_) return false;
        Block block{};
        if (pending_.Size() >= tar::kBlockSize) {
            pending_.CopyTo(0, tar::kBlockSize, block.data());
            container_ = tar::HasUstarMagic(block) ? Container::Tar : Container::None;
        } else {
            container_ = Container::None;
        }
        return true;
    }

    void Passthrough() {
        if (!entry_open_) {
            if (pending_.Empty()) return;
            OpenEntry(TarEntryHeader{default_name_, std::nullopt});
        }
        body_.Splice(std::move(pending_));
        this->PassDown(body_);
    }

    void OpenEntry(TarEntryHeader header) {
        entry_open_ = true;
        ++entries_;
        this->GetDownstream().OnEntryBegin(header);
    }

    void CloseEntry() {
        entry_open_ = false;
        this->GetDownstream().OnEntryEnd();
    }

    bool ReadHeaderBlock() {
        if (pending_.Size() < tar::kBlockSize) return false;
        Block block;
        pending_.CopyTo(0, tar::kBlockSize, block.data());
        pending_.Consume(tar::kBlockSize);

        if (run_.empty() && tar::IsZeroBlock(block)) {
            if (++zero_blocks_ == 2) state_ = State::End;
            return true;
        }
        zero_blocks_ = 0;
        run_.insert(run_.end(), block.begin(), block.end());

        if (tar::IsExtensionHeader(block)) {
            auto size = tar::ExtensionPayloadSize(block);
            if (!size) {
                Fail(std::move(size.error()));
                return false;
            }
            remaining_ = *size + tar::Padding(*size);
            if (run_.size() + remaining_ > kMaxHeaderRun) {
                Fail(Error{ErrorCode::ArchiveError,
                           fmt::format("tar extension header of {} bytes", *size)});
                return false;
            }
            state_ = State::Extension;
            return true;
        }
        return BeginMember();
    }

    // Extension payloads stay in the run for libarchive to interpret
    bool ReadExtension() {
        if (remaining_ > 0) {
            if (pending_.Empty()) return false;
            size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, pending_.Size()));
            size_t base = run_.size();
            run_.resize(base + n);
            pending_.CopyTo(0, n, run_.data() + base);
            pending_.Consume(n);
            remaining_ -= n;
            if (remaining_ > 0) return true;
        }
        state_ = State::Header;
        return true;
    }

    bool BeginMember() {
        auto member = tar::DecodeHeaderRun(run_);
        run_.clear();
        if (!member) {
            Fail(WithContext(std::move(member.error()),
                             fmt::format("tar member {}", entries_ + skipped_ + 1)));
            return false;
        }
        remaining_ = member->size;
        padding_ = tar::Padding(member->size);
        if (member->regular) {
            OpenEntry(TarEntryHeader{std::move(member->name), member->size});
            state_ = State::Body;
        } else {
            ++skipped_;
            remaining_ += padding_;
            padding_ = 0;
            state_ = State::Skip;
        }
        return true;
    }

    bool ReadBody() {
        if (!body_.Empty()) {
            if (this->PassDown(body_)) return false;
            if (!body_.Empty()) {
                Fail(Error{ErrorCode::InvalidState, "entry consumer left bytes unconsumed"});
                return false;
            }
        }
        if (remaining_ == 0) {
            CloseEntry();
            remaining_ = padding_;
            padding_ = 0;
            state_ = State::Skip;
            return true;
        }
        if (pending_.Empty()) return false;

        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, pending_.Size()));
        n = std::min(n, kForwardBatch);
        while (n > 0) {
            size_t chunk = std::min(n, Segment::kSize);
            auto seg = this->Segments().Acquire();
            pending_.CopyTo(0, chunk, seg->data.data());
            seg->size = chunk;
            body_.Append(std::move(seg));
            pending_.Consume(chunk);
            remaining_ -= chunk;
            n -= chunk;
        }
        return true;
    }

    bool SkipBytes() {
        if (remaining_ == 0) {
            state_ = State::Header;
            return true;
        }
        if (pending_.Empty()) return false;
        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining_, pending_.Size()));
        pending_.Consume(n);
        remaining_ -= n;
        return true;
    }

    void Finish() {
        if (container_ == Container::Auto) {
            container_ = Container::None;
        }
        if (container_ == Container::None) {
            if (!body_.Empty() || !pending_.Empty()) {
                Fail(Error{ErrorCode::InvalidState, "entry consumer left bytes unconsumed"});
                return;
            }
            if (entry_open_) CloseEntry();
            if (this->IsSuspended()) {
                this->HoldDone();
                return;
            }
            this->EmitDone();
            this->RequestClose();
            return;
        }

        bool clean = state_ == State::End ||
                     (state_ == State::Header && run_.empty() && pending_.Empty() &&
                      !entry_open_);
        if (!clean) {
            Fail(Error{ErrorCode::ArchiveError,
                       fmt::format("unexpected end of tar archive after {} entries", entries_)});
            return;
        }
        this->EmitDone();
        this->RequestClose();
    }

    static constexpr size_t kMaxPendingInput = 64 * 1024 * 1024;
    static constexpr size_t kMaxHeaderRun = 1024 * 1024;
    static constexpr size_t kForwardBatch = 4 * Segment::kSize;

    Container container_;
    std::string default_name_;
    State state_ = State::Header;
    BufferChain pending_;   // decompressed bytes not yet walked
    BufferChain body_;      // member bytes not yet taken by downstream
    std::vector<std::byte> run_;   // header blocks awaiting decode
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    int zero_blocks_ = 0;
    size_t entries_ = 0;
    size_t skipped_ = 0;
    bool entry_open_ = false;
    bool at_eof_ = false;
};

}  // namespace wme_pipe
