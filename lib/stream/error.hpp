// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wme_pipe {

/// Error codes for all pipeline and API operations.
enum class ErrorCode {
    // Connection
    ConnectionFailed,      ///< TCP connection failed (ECONNREFUSED, reset, etc.)
    ConnectionClosed,      ///< Remote peer closed the connection early
    DnsResolutionFailed,   ///< Hostname could not be resolved
    Timeout,               ///< No progress within the configured idle timeout

    // TLS
    TlsHandshakeFailed,    ///< TLS handshake did not complete
    CertificateError,      ///< Server certificate validation failed

    // HTTP
    HttpError,             ///< Malformed response or unexpected status
    Unauthorized,          ///< HTTP 401/403
    NotFound,              ///< HTTP 404
    RangeNotSatisfiable,   ///< HTTP 416, or the server ignored a Range header
    ValidationError,       ///< HTTP 422, or a request rejected before sending
    RateLimited,           ///< HTTP 429
    ServerError,           ///< HTTP 5xx

    // Decode
    ParseError,            ///< Malformed record or HTTP response
    DecompressionError,    ///< gzip/zstd stream corrupt or truncated
    ArchiveError,          ///< tar container corrupt or truncated
    BufferOverflow,        ///< Internal buffer exceeded size limit

    // Auth
    AuthFailed,            ///< Token provider could not supply a token

    // State
    InvalidState,          ///< Method called in wrong state

    // Terminal outcomes
    Cancelled,             ///< Caller asked to stop
    PredicateFailed,       ///< Caller-supplied predicate threw
    RetriesExhausted,      ///< Retry budget used up; see Error::cause
};

/// Coarse classification used by retry and outcome reporting.
enum class ErrorKind {
    Transient,   ///< Retryable network failure
    Permanent,   ///< Request can never succeed as issued
    Decode,      ///< Corrupt or malformed data
    Auth,        ///< Token unavailable
    Cancelled,   ///< Caller-driven stop
    Exhausted,   ///< Transient failures outlasted the retry budget
    Callback,    ///< Caller code failed
};

/// Error payload delivered to OnError callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
    std::optional<std::chrono::milliseconds> retry_after = {};  ///< Server-requested delay (rate limiting)
    std::uint32_t attempts = 0;    ///< Attempts made, set on RetriesExhausted
    std::shared_ptr<const Error> cause = {};  ///< Last underlying failure, if wrapped
};

constexpr ErrorKind error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::Timeout:
        case ErrorCode::TlsHandshakeFailed:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
            return ErrorKind::Transient;
        case ErrorCode::CertificateError:
        case ErrorCode::HttpError:
        case ErrorCode::Unauthorized:
        case ErrorCode::NotFound:
        case ErrorCode::RangeNotSatisfiable:
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidState:
            return ErrorKind::Permanent;
        case ErrorCode::ParseError:
        case ErrorCode::DecompressionError:
        case ErrorCode::ArchiveError:
        case ErrorCode::BufferOverflow:
            return ErrorKind::Decode;
        case ErrorCode::AuthFailed:
            return ErrorKind::Auth;
        case ErrorCode::Cancelled:
            return ErrorKind::Cancelled;
        case ErrorCode::RetriesExhausted:
            return ErrorKind::Exhausted;
        case ErrorCode::PredicateFailed:
            return ErrorKind::Callback;
    }
    return ErrorKind::Permanent;
}

/// Prefix an error's message with context, keeping everything else.
inline Error WithContext(Error e, std::string_view context) {
    e.message = std::string(context) + ": " + e.message;
    return e;
}

}  // namespace wme_pipe
