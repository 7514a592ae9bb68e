// SPDX-License-Identifier: MIT

// src/entry_sink.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <utility>

#include <rapidjson/document.h>

#include "lib/stream/error.hpp"

namespace wme_pipe {

/// One decoded record: a parsed JSON line plus where it came from.
struct ArchiveEntry {
    std::string source;           ///< Member name inside the archive
    uint64_t line = 0;            ///< 1-based line number within the member
    std::string raw;              ///< The line as read, without the newline
    rapidjson::Document document;
};

using RecordResult = std::expected<ArchiveEntry, Error>;

// End of a record pipeline. A line that fails to decode arrives as an
// unexpected RecordResult and the stream goes on; OnError and OnComplete
// end it. Invalidate() is how the owner detaches before the producer stops.
template <typename S>
concept RecordSink = requires(S& s, RecordResult&& record, const Error& e) {
    s.OnRecord(std::move(record));
    s.OnError(e);
    s.OnComplete();
    s.Invalidate();
};

// RecordSink over three callbacks. Exactly one of on_error or on_complete
// runs, and nothing runs once the sink has been invalidated.
class EntrySink {
public:
    using RecordCallback = std::function<void(RecordResult&&)>;
    using ErrorCallback = std::function<void(const Error&)>;
    using CompleteCallback = std::function<void()>;

    EntrySink(RecordCallback on_record, ErrorCallback on_error, CompleteCallback on_complete)
        : on_record_(std::move(on_record)),
          on_error_(std::move(on_error)),
          on_complete_(std::move(on_complete)) {}

    void OnRecord(RecordResult&& record) {
        if (state_.load(std::memory_order_acquire) == State::Open) on_record_(std::move(record));
    }

    void OnError(const Error& e) {
        if (Finish()) on_error_(e);
    }

    void OnComplete() {
        if (Finish()) on_complete_();
    }

    void Invalidate() { state_.store(State::Detached, std::memory_order_release); }

    bool IsValid() const { return state_.load(std::memory_order_acquire) != State::Detached; }

private:
    enum class State : uint8_t { Open, Finished, Detached };

    bool Finish() {
        State expected = State::Open;
        return state_.compare_exchange_strong(expected, State::Finished,
                                              std::memory_order_acq_rel);
    }

    RecordCallback on_record_;
    ErrorCallback on_error_;
    CompleteCallback on_complete_;
    std::atomic<State> state_{State::Open};
};

static_assert(RecordSink<EntrySink>);

}  // namespace wme_pipe
