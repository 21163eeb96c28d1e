#include "ferry/http_server.hpp"
#include "ferry/log.hpp"
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>

namespace ferry {

namespace {

constexpr std::chrono::milliseconds kAcceptPoll{200};
constexpr std::chrono::milliseconds kRejectDrain{20};
constexpr std::size_t kRejectDrainLimit = 64 * 1024;

bool is_fatal_accept_error(const std::error_code& ec) {
    if (ec.category() != std::system_category()) return false;
    switch (ec.value()) {
        case EMFILE:
        case ENFILE:
        case EBADF:
        case EINVAL:
        case ENOTSOCK:
            return true;
        default:
            return false;
    }
}

}  // namespace

HttpServer::HttpServer(HttpServerOptions options, std::shared_ptr<const Router> router)
    : options_(std::move(options)), router_(std::move(router)) {
    if (!router_) throw std::invalid_argument("http_server: no route table");
    // OpenSSL writes through plain write(2); a vanished peer must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    if (!options_.cert_file.empty() || !options_.key_file.empty()) {
        if (!options_.use_tls()) throw std::runtime_error("http_server: TLS needs both a certificate and a key");
        tls_ = make_tls_server_context(options_.cert_file.c_str(), options_.key_file.c_str());
        if (!tls_) {
            throw std::runtime_error("http_server: failed to create TLS context (check cert/key files): " +
                                     tls_error_string());
        }
    }

    listener_.bind(options_.host.c_str(), options_.port);
    listener_.listen(options_.backlog);
    port_ = listener_.local_port();
    pool_ = std::make_unique<WorkerPool>(options_.pool);
}

HttpServer::~HttpServer() {
    stop();
    pool_->shutdown();
}

void HttpServer::run() {
    log_info("http_server") << "HTTP" << (tls_ ? "S" : "") << " server listening on " << options_.host << ":"
                            << port_ << " (" << pool_->num_workers() << " workers)";
    while (!stopping_.load()) {
        std::error_code ec;
        TcpSocket client = listener_.accept(kAcceptPoll, ec);
        if (ec) {
            if (is_fatal_accept_error(ec)) {
                log_error("http_server") << "accept failed: " << ec.message();
                stopping_.store(true);
                pool_->shutdown();
                throw std::system_error(ec, "http_server: accept");
            }
            log_warn("http_server") << "accept failed: " << ec.message();
            continue;
        }
        if (!client.is_open()) continue;

        client.set_write_timeout(options_.write_timeout);
        // std::function needs a copyable callable; the job owns the socket through it.
        auto socket = std::make_shared<TcpSocket>(std::move(client));
        SubmitResult admitted = pool_->submit([this, socket] { serve(std::move(*socket)); });
        if (admitted == SubmitResult::Rejected) reject(std::move(*socket));
    }
    pool_->shutdown();
    listener_.close();
    log_info("http_server") << "server stopped";
}

void HttpServer::serve(TcpSocket socket) {
    std::string peer = socket.peer_address();
    std::unique_ptr<ByteStream> stream;
    if (tls_) {
        std::error_code ec;
        TlsSocket tls = wrap_tls(std::move(socket), tls_, TlsRole::Server, {}, ec);
        if (ec) {
            log_warn("http_server") << peer << ": TLS session setup failed: " << ec.message();
            return;
        }
        stream = std::make_unique<TlsSocket>(std::move(tls));
    } else {
        stream = std::make_unique<TcpSocket>(std::move(socket));
    }
    ConnectionSupervisor supervisor(std::move(stream), router_, options_.connection, &stopping_, std::move(peer));
    supervisor.run();
}

void HttpServer::reject(TcpSocket socket) {
    log_warn("http_server") << socket.peer_address() << ": worker pool saturated, "
                            << (options_.overload == OverloadPolicy::Drop || tls_ ? "dropping" : "503");
    if (options_.overload == OverloadPolicy::ServiceUnavailable && !tls_) {
        // Read what the client already sent so closing does not reset the connection
        // before the 503 arrives.
        socket.set_read_timeout(kRejectDrain);
        char scratch[4096];
        for (std::size_t drained = 0; drained < kRejectDrainLimit;) {
            IoResult r = socket.read(scratch, sizeof(scratch));
            if (!r.ok()) break;
            drained += r.bytes;
        }
        HttpResponse resp = make_http_error(503);
        resp.headers.set("Connection", "close");
        frame_response(resp);
        if (auto ec = encode_response(resp, socket)) {
            log_debug("http_server") << "503 not written: " << ec.message();
        }
        socket.shutdown();
    }
    socket.close();
}

}  // namespace ferry
