#pragma once

#include "ferry/byte_stream.hpp"
#include "ferry/tcp_socket.hpp"
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace ferry {

/// RAII wrapper for OpenSSL SSL_CTX (server or client).
class TlsContext {
public:
    TlsContext() = default;
    explicit TlsContext(SSL_CTX* ctx) : ctx_(ctx) {}
    ~TlsContext() { reset(); }

    TlsContext(TlsContext&& other) noexcept : ctx_(std::exchange(other.ctx_, nullptr)) {}
    TlsContext& operator=(TlsContext&& other) noexcept {
        if (this != &other) {
            reset();
            ctx_ = std::exchange(other.ctx_, nullptr);
        }
        return *this;
    }
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get() const { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

    void reset() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

private:
    SSL_CTX* ctx_{nullptr};
};

/// Create a server TLS context and load cert + key from PEM files.
/// Returns null on failure (the OpenSSL error queue holds the reason).
TlsContext make_tls_server_context(const char* cert_file, const char* key_file);

/// Create a client TLS context. With \a verify_peer the system trust store is loaded
/// and the server certificate must verify against the requested host name.
TlsContext make_tls_client_context(bool verify_peer);

/// Error category for OpenSSL error-queue codes.
const std::error_category& tls_category();

/// Drains the OpenSSL error queue into one readable string.
std::string tls_error_string();

enum class TlsRole : std::uint8_t {
    Server,
    Client,
};

/// TLS wrapper around TcpSocket. The handshake runs in handshake(); failures there and
/// on later records surface as IoStatus::Error like any other transport failure.
class TlsSocket final : public ByteStream {
public:
    TlsSocket() = default;
    /// Takes ownership of \a socket and \a ssl. SSL must have fd set via SSL_set_fd(ssl, socket.fd()).
    TlsSocket(TcpSocket&& socket, SSL* ssl, TlsRole role, std::string server_name = {});

    TlsSocket(TlsSocket&& other) noexcept;
    TlsSocket& operator=(TlsSocket&& other) noexcept;
    ~TlsSocket() override;

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    int fd() const { return socket_.fd(); }
    bool is_open() const { return socket_.is_open() && ssl_; }
    void close();

    std::error_code handshake() override;
    IoResult read(void* buf, std::size_t len) override;
    IoResult write(const void* buf, std::size_t len) override;
    void set_read_timeout(std::chrono::milliseconds timeout) override { socket_.set_read_timeout(timeout); }
    void set_write_timeout(std::chrono::milliseconds timeout) { socket_.set_write_timeout(timeout); }
    void shutdown() override;

    /// Negotiated ALPN protocol, empty if none.
    std::string alpn_protocol() const;

private:
    TcpSocket socket_;
    SSL* ssl_{nullptr};
    TlsRole role_{TlsRole::Server};
    std::string server_name_;
};

/// Wraps \a socket in a new SSL session from \a ctx. On failure \a ec is set and the
/// returned socket is closed.
TlsSocket wrap_tls(TcpSocket&& socket, const TlsContext& ctx, TlsRole role, std::string server_name,
                   std::error_code& ec);

}  // namespace ferry
