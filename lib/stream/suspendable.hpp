// SPDX-License-Identifier: MIT

// lib/stream/suspendable.hpp
#pragma once

namespace wme_pipe {

/// Backpressure seam between a stage and whatever feeds it.
///
/// A downstream stage (the archive reader, a record callback) calls
/// Suspend() on its upstream when it cannot take more bytes; the upstream
/// stops pulling from the socket or releasing buffered chunks until a
/// matching Resume(). Calls nest: only the first Suspend() and the last
/// Resume() change anything, so several consumers can hold the same source.
///
/// A completion that arrives while suspended is held back and delivered
/// after the final Resume(), once everything buffered has been passed on.
///
/// All methods except IsSuspended() belong to the event loop thread.
class Suspendable {
public:
    virtual ~Suspendable() = default;

    virtual void Suspend() = 0;
    virtual void Resume() = 0;

    /// Release the source. Nothing is delivered afterwards.
    virtual void Close() = 0;

    virtual bool IsSuspended() const = 0;
};

}  // namespace wme_pipe
