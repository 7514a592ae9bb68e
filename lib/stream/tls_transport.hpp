// SPDX-License-Identifier: MIT

// lib/stream/tls_transport.hpp
#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cerrno>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"

namespace wme_pipe {

namespace tls_detail {

struct SslFree {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

struct SslCtxFree {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

// Empties the thread's OpenSSL error queue into one line
inline std::string DrainErrors() {
    std::string text;
    while (unsigned long code = ERR_get_error()) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!text.empty()) text += "; ";
        text += buf;
    }
    return text.empty() ? std::string("no OpenSSL detail") : text;
}

inline Error Failure(std::string_view op, int ssl_error) {
    if (ssl_error == SSL_ERROR_SYSCALL && errno != 0) {
        int err = errno;
        return Error{ErrorCode::ConnectionFailed,
                     fmt::format("{}: {}", op, std::system_category().message(err)), err};
    }
    if (ssl_error == SSL_ERROR_SSL) {
        return Error{ErrorCode::TlsHandshakeFailed, fmt::format("{}: {}", op, DrainErrors())};
    }
    return Error{ErrorCode::TlsHandshakeFailed, fmt::format("{}: SSL error {}", op, ssl_error)};
}

}  // namespace tls_detail

/// Client SSL_CTX shared by every connection in the process: TLS 1.2 or
/// newer, the system trust store, peer verification on. A snapshot
/// download opening many ranged connections loads the CA bundle once.
/// Null if OpenSSL could not build it.
inline SSL_CTX* ClientTlsContext() {
    static const std::unique_ptr<SSL_CTX, tls_detail::SslCtxFree> ctx = [] {
        std::unique_ptr<SSL_CTX, tls_detail::SslCtxFree> c(SSL_CTX_new(TLS_client_method()));
        if (c) {
            SSL_CTX_set_min_proto_version(c.get(), TLS1_2_VERSION);
            SSL_CTX_set_options(c.get(), SSL_OP_NO_COMPRESSION);
            SSL_CTX_set_default_verify_paths(c.get());
            SSL_CTX_set_verify(c.get(), SSL_VERIFY_PEER, nullptr);
        }
        return c;
    }();
    return ctx.get();
}

// TLS client session between the socket (ciphertext in, via OnData, and
// out, via the wire writer) and the HTTP stage (plaintext). OpenSSL runs on
// a pair of memory BIOs, so it never touches the descriptor.
//
// Plaintext is decrypted only while the downstream is not suspended; the
// ciphertext meanwhile waits inside the read BIO.
template <Downstream D>
class TlsTransport : public PipelineComponent<TlsTransport<D>, D>,
                     public std::enable_shared_from_this<TlsTransport<D>> {
public:
    using WireWriter = std::function<void(BufferChain)>;

    static std::shared_ptr<TlsTransport> Create(IEventLoop& loop, std::shared_ptr<D> downstream) {
        struct MakeSharedEnabler : public TlsTransport {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds)
                : TlsTransport(l, std::move(ds)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream));
    }

    void SetWireWriter(WireWriter writer) { wire_ = std::move(writer); }
    void OnHandshake(std::function<void()> cb) { on_handshake_ = std::move(cb); }

    // SNI plus the host name the peer certificate must carry
    void SetHostname(const std::string& host) {
        if (!ssl_) return;
        SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        SSL_set1_host(ssl_.get(), host.c_str());
    }

    void StartHandshake() {
        if (phase_ != Phase::Fresh) return;
        auto busy = this->Enter();
        if (!busy) return;
        if (setup_error_) {
            this->AbortWith(*setup_error_);
            return;
        }
        phase_ = Phase::Handshaking;
        Handshake();
    }

    bool IsHandshakeComplete() const { return phase_ == Phase::Established; }

    // Ciphertext from the socket; all of it is taken
    void OnData(BufferChain& cipher) {
        auto busy = this->Enter();
        if (!busy || !ssl_) {
            cipher.Clear();
            return;
        }
        if (BIO_ctrl_pending(in_) + cipher.Size() > kMaxBuffered) {
            cipher.Clear();
            this->AbortWith(Error{ErrorCode::BufferOverflow, "TLS input backlog too large"});
            return;
        }
        while (!cipher.Empty()) {
            int n = BIO_write(in_, cipher.DataAt(0), static_cast<int>(cipher.ContiguousSize()));
            if (n <= 0) {
                cipher.Clear();
                this->AbortWith(Error{ErrorCode::TlsHandshakeFailed, "BIO_write refused input"});
                return;
            }
            cipher.Consume(static_cast<size_t>(n));
        }
        if (phase_ == Phase::Handshaking) {
            Handshake();
        } else if (phase_ == Phase::Established) {
            Decrypt();
        }
    }

    void OnError(const Error& e) { this->AbortWith(e); }

    // TCP FIN without close_notify
    void OnDone() {
        auto busy = this->Enter();
        if (!busy) return;
        if (phase_ != Phase::Established) {
            this->AbortWith(Error{ErrorCode::ConnectionClosed,
                                  "connection closed during TLS handshake"});
            return;
        }
        Decrypt();
        if (!this->IsClosed()) EndOfStream();
    }

    // Plaintext request bytes
    void Write(BufferChain plain) {
        auto busy = this->Enter();
        if (!busy) return;
        if (phase_ != Phase::Established) {
            this->AbortWith(Error{ErrorCode::InvalidState, "TLS write before handshake finished"});
            return;
        }
        if (unsent_.WouldOverflow(plain.Size(), kMaxBuffered)) {
            this->AbortWith(Error{ErrorCode::BufferOverflow, "TLS write backlog too large"});
            return;
        }
        unsent_.Splice(std::move(plain));
        Encrypt();
    }

    void DoClose() {
        if (ssl_ && phase_ == Phase::Established) {
            SSL_shutdown(ssl_.get());
            FlushWire();
        }
        ssl_.reset();
        in_ = nullptr;
        out_ = nullptr;
        plain_.Clear();
        unsent_.Clear();
        this->ResetDownstream();
    }

    void ResumeWork() {
        if (this->PassDown(plain_)) return;
        if (phase_ == Phase::Established) Decrypt();
    }

    void ReleaseHeldDone() {
        if (this->DeliverThenDone(plain_)) this->RequestClose();
    }

private:
    enum class Phase { Fresh, Handshaking, Established };

    TlsTransport(IEventLoop& loop, std::shared_ptr<D> downstream)
        : PipelineComponent<TlsTransport<D>, D>(loop) {
        this->SetDownstream(std::move(downstream));
        plain_.SetRecycleCallback(this->Segments().Recycler());

        SSL_CTX* ctx = ClientTlsContext();
        if (ctx) ssl_.reset(SSL_new(ctx));
        if (!ssl_) {
            setup_error_ = Error{ErrorCode::TlsHandshakeFailed,
                                 "cannot create TLS session: " + tls_detail::DrainErrors()};
            return;
        }
        in_ = BIO_new(BIO_s_mem());
        out_ = BIO_new(BIO_s_mem());
        if (!in_ || !out_) {
            BIO_free(in_);
            BIO_free(out_);
            in_ = out_ = nullptr;
            ssl_.reset();
            setup_error_ = Error{ErrorCode::TlsHandshakeFailed, "cannot allocate TLS buffers"};
            return;
        }
        // From here the session owns both BIOs
        SSL_set_bio(ssl_.get(), in_, out_);
        SSL_set_connect_state(ssl_.get());
    }

    void Handshake() {
        int rc = SSL_do_handshake(ssl_.get());
        if (rc == 1) {
            phase_ = Phase::Established;
            FlushWire();
            if (on_handshake_) on_handshake_();
            // Application records may have come with the last flight
            if (!this->IsClosed() && ssl_) Decrypt();
            return;
        }
        int err = SSL_get_error(ssl_.get(), rc);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            FlushWire();
            return;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            this->AbortWith(Error{ErrorCode::ConnectionClosed,
                                  "peer closed TLS session during handshake"});
            return;
        }
        long verdict = SSL_get_verify_result(ssl_.get());
        if (verdict != X509_V_OK) {
            ERR_clear_error();
            this->AbortWith(Error{ErrorCode::CertificateError,
                fmt::format("certificate rejected: {}", X509_verify_cert_error_string(verdict))});
            return;
        }
        this->AbortWith(tls_detail::Failure("TLS handshake", err));
    }

    void Decrypt() {
        while (!this->IsClosed() && !this->IsSuspended()) {
            auto seg = this->Segments().Acquire();
            int n = SSL_read(ssl_.get(), seg->data.data(), static_cast<int>(Segment::kSize));
            if (n > 0) {
                if (plain_.WouldOverflow(static_cast<size_t>(n), kMaxBuffered)) {
                    this->AbortWith(Error{ErrorCode::BufferOverflow,
                                          "TLS plaintext backlog too large"});
                    return;
                }
                seg->size = static_cast<size_t>(n);
                plain_.Append(std::move(seg));
                if (plain_.Size() >= Segment::kSize && this->PassDown(plain_)) return;
                continue;
            }

            int err = SSL_get_error(ssl_.get(), n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                this->PassDown(plain_);
                // Session tickets and key updates produce output while reading
                FlushWire();
                if (!unsent_.Empty() && !this->IsClosed()) Encrypt();
                return;
            }
            if (err == SSL_ERROR_ZERO_RETURN) {
                EndOfStream();
                return;
            }
            this->AbortWith(tls_detail::Failure("TLS read", err));
            return;
        }
    }

    void Encrypt() {
        while (!unsent_.Empty()) {
            int n = SSL_write(ssl_.get(), unsent_.DataAt(0),
                              static_cast<int>(unsent_.ContiguousSize()));
            if (n > 0) {
                unsent_.Consume(static_cast<size_t>(n));
                continue;
            }
            int err = SSL_get_error(ssl_.get(), n);
            if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                this->AbortWith(tls_detail::Failure("TLS write", err));
                return;
            }
            // Retried once the next record from the peer has been read
            break;
        }
        FlushWire();
    }

    void FlushWire() {
        BufferChain records;
        while (BIO_ctrl_pending(out_) > 0) {
            auto seg = this->Segments().Acquire();
            int n = BIO_read(out_, seg->data.data(), static_cast<int>(Segment::kSize));
            if (n <= 0) break;
            seg->size = static_cast<size_t>(n);
            records.Append(std::move(seg));
        }
        if (!records.Empty() && wire_) wire_(std::move(records));
    }

    void EndOfStream() {
        if (this->IsSuspended()) {
            this->HoldDone();
            return;
        }
        if (this->DeliverThenDone(plain_)) this->RequestClose();
    }

    static constexpr size_t kMaxBuffered = 16 * 1024 * 1024;

    std::unique_ptr<SSL, tls_detail::SslFree> ssl_;
    BIO* in_ = nullptr;   // ciphertext from the peer, owned by ssl_
    BIO* out_ = nullptr;  // ciphertext for the peer, owned by ssl_
    std::optional<Error> setup_error_;
    Phase phase_ = Phase::Fresh;

    WireWriter wire_;
    std::function<void()> on_handshake_;

    BufferChain plain_;   // decrypted, waiting for the downstream
    BufferChain unsent_;  // plaintext SSL_write could not take yet
};

}  // namespace wme_pipe
