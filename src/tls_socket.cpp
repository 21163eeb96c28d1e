#include "ferry/tls_socket.hpp"
#include <cerrno>
#include <cstring>
#include <openssl/x509v3.h>

namespace ferry {

namespace {

constexpr unsigned char kAlpnHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

// ALPN select callback: only "http/1.1" is served.
int alpn_select_cb(SSL* /*ssl*/, const unsigned char** out, unsigned char* outlen,
                   const unsigned char* in, unsigned int inlen, void* /*arg*/) {
    unsigned char* selected = nullptr;
    int rv = SSL_select_next_proto(&selected, outlen, kAlpnHttp11, sizeof(kAlpnHttp11), in, inlen);
    if (rv != OPENSSL_NPN_NEGOTIATED) return SSL_TLSEXT_ERR_NOACK;
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

class TlsErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "tls"; }
    std::string message(int code) const override {
        char buf[256];
        ERR_error_string_n(static_cast<unsigned long>(code), buf, sizeof(buf));
        return buf;
    }
};

std::error_code last_tls_error(int ssl_error) {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code != 0) return {static_cast<int>(code), tls_category()};
    if (ssl_error == SSL_ERROR_SYSCALL && errno != 0) return {errno, std::system_category()};
    return std::make_error_code(std::errc::protocol_error);
}

bool is_retry(int err) { return err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE; }

void set_common_options(SSL_CTX* ctx) {
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx, SSL_MODE_AUTO_RETRY);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

}  // namespace

const std::error_category& tls_category() {
    static const TlsErrorCategory category;
    return category;
}

std::string tls_error_string() {
    std::string out;
    for (unsigned long code = ERR_get_error(); code != 0; code = ERR_get_error()) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

// -----------------------------------------------------------------------------
// TlsContext
// -----------------------------------------------------------------------------
TlsContext make_tls_server_context(const char* cert_file, const char* key_file) {
    if (OPENSSL_init_ssl(0, nullptr) != 1) return TlsContext(nullptr);
    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    if (!ctx) return TlsContext(nullptr);
    set_common_options(ctx);
    if (SSL_CTX_use_certificate_chain_file(ctx, cert_file) <= 0) {
        SSL_CTX_free(ctx);
        return TlsContext(nullptr);
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, key_file, SSL_FILETYPE_PEM) <= 0) {
        SSL_CTX_free(ctx);
        return TlsContext(nullptr);
    }
    if (SSL_CTX_check_private_key(ctx) != 1) {
        SSL_CTX_free(ctx);
        return TlsContext(nullptr);
    }
    SSL_CTX_set_alpn_select_cb(ctx, alpn_select_cb, nullptr);
    return TlsContext(ctx);
}

TlsContext make_tls_client_context(bool verify_peer) {
    if (OPENSSL_init_ssl(0, nullptr) != 1) return TlsContext(nullptr);
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) return TlsContext(nullptr);
    set_common_options(ctx);
    if (verify_peer) {
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            SSL_CTX_free(ctx);
            return TlsContext(nullptr);
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }
    // Returns 0 on success.
    if (SSL_CTX_set_alpn_protos(ctx, kAlpnHttp11, sizeof(kAlpnHttp11)) != 0) {
        SSL_CTX_free(ctx);
        return TlsContext(nullptr);
    }
    return TlsContext(ctx);
}

TlsSocket wrap_tls(TcpSocket&& socket, const TlsContext& ctx, TlsRole role, std::string server_name,
                   std::error_code& ec) {
    ec.clear();
    SSL* ssl = ctx ? SSL_new(ctx.get()) : nullptr;
    if (!ssl) {
        ec = last_tls_error(SSL_ERROR_SSL);
        socket.close();
        return TlsSocket();
    }
    if (SSL_set_fd(ssl, socket.fd()) != 1) {
        ec = last_tls_error(SSL_ERROR_SSL);
        SSL_free(ssl);
        socket.close();
        return TlsSocket();
    }
    return TlsSocket(std::move(socket), ssl, role, std::move(server_name));
}

// -----------------------------------------------------------------------------
// TlsSocket
// -----------------------------------------------------------------------------
TlsSocket::TlsSocket(TcpSocket&& socket, SSL* ssl, TlsRole role, std::string server_name)
    : socket_(std::move(socket)), ssl_(ssl), role_(role), server_name_(std::move(server_name)) {}

TlsSocket::TlsSocket(TlsSocket&& other) noexcept
    : socket_(std::move(other.socket_))
    , ssl_(std::exchange(other.ssl_, nullptr))
    , role_(other.role_)
    , server_name_(std::move(other.server_name_)) {}

TlsSocket& TlsSocket::operator=(TlsSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = std::move(other.socket_);
        ssl_ = std::exchange(other.ssl_, nullptr);
        role_ = other.role_;
        server_name_ = std::move(other.server_name_);
    }
    return *this;
}

TlsSocket::~TlsSocket() { close(); }

void TlsSocket::close() {
    if (ssl_) {
        if (SSL_is_init_finished(ssl_)) SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
        ERR_clear_error();
    }
    socket_.close();
}

std::error_code TlsSocket::handshake() {
    if (!is_open()) return std::make_error_code(std::errc::bad_file_descriptor);
    ERR_clear_error();
    if (role_ == TlsRole::Client && !server_name_.empty()) {
        SSL_set_tlsext_host_name(ssl_, server_name_.c_str());
        if (SSL_get_verify_mode(ssl_) & SSL_VERIFY_PEER) {
            if (SSL_set1_host(ssl_, server_name_.c_str()) != 1) return last_tls_error(SSL_ERROR_SSL);
        }
    }
    int ret = (role_ == TlsRole::Server) ? SSL_accept(ssl_) : SSL_connect(ssl_);
    if (ret == 1) return {};
    int err = SSL_get_error(ssl_, ret);
    if (is_retry(err)) return std::make_error_code(std::errc::timed_out);
    return last_tls_error(err);
}

IoResult TlsSocket::read(void* buf, std::size_t len) {
    if (!is_open()) return {0, IoStatus::Error, std::make_error_code(std::errc::bad_file_descriptor)};
    ERR_clear_error();
    std::size_t n = 0;
    if (SSL_read_ex(ssl_, buf, len, &n) == 1) return {n, IoStatus::Ok, {}};
    int err = SSL_get_error(ssl_, 0);
    if (err == SSL_ERROR_ZERO_RETURN) return {0, IoStatus::Eof, {}};
    // Blocking socket with SO_RCVTIMEO: a retry condition means the read timed out.
    if (is_retry(err)) return {0, IoStatus::Timeout, std::make_error_code(std::errc::timed_out)};
    if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
        return {0, IoStatus::Timeout, std::make_error_code(std::errc::timed_out)};
    if (err == SSL_ERROR_SYSCALL && errno == 0 && ERR_peek_error() == 0) return {0, IoStatus::Eof, {}};
    return {0, IoStatus::Error, last_tls_error(err)};
}

IoResult TlsSocket::write(const void* buf, std::size_t len) {
    if (!is_open()) return {0, IoStatus::Error, std::make_error_code(std::errc::bad_file_descriptor)};
    if (len == 0) return {0, IoStatus::Ok, {}};
    ERR_clear_error();
    std::size_t n = 0;
    if (SSL_write_ex(ssl_, buf, len, &n) == 1) return {n, IoStatus::Ok, {}};
    int err = SSL_get_error(ssl_, 0);
    if (is_retry(err)) return {0, IoStatus::Timeout, std::make_error_code(std::errc::timed_out)};
    return {0, IoStatus::Error, last_tls_error(err)};
}

void TlsSocket::shutdown() {
    if (ssl_ && SSL_is_init_finished(ssl_)) {
        SSL_shutdown(ssl_);
        ERR_clear_error();
    }
    socket_.shutdown();
}

std::string TlsSocket::alpn_protocol() const {
    if (!ssl_) return {};
    const unsigned char* data = nullptr;
    unsigned int len = 0;
    SSL_get0_alpn_selected(ssl_, &data, &len);
    return data ? std::string(reinterpret_cast<const char*>(data), len) : std::string();
}

}  // namespace ferry
