#pragma once

#include "ferry/connection.hpp"
#include "ferry/router.hpp"
#include "ferry/tcp_socket.hpp"
#include "ferry/tls_socket.hpp"
#include "ferry/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ferry {

/// What the listener does with a connection the worker pool cannot take.
enum class OverloadPolicy : std::uint8_t {
    ServiceUnavailable,  // write 503 with Connection: close (plaintext only)
    Drop,
};

/// Options for running the HTTP(S) server. Fixed for the life of the server.
struct HttpServerOptions {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};  // 0 picks a free port; see HttpServer::port()
    int backlog{128};
    WorkerPoolOptions pool;
    ConnectionOptions connection;
    std::chrono::milliseconds write_timeout{5000};
    /// TLS is enabled when both are set.
    std::string cert_file;
    std::string key_file;
    OverloadPolicy overload{OverloadPolicy::ServiceUnavailable};

    bool use_tls() const { return !cert_file.empty() && !key_file.empty(); }
};

/// HTTP/1.1 server: one accept thread feeding accepted connections into a worker
/// pool, where each connection is served by a ConnectionSupervisor.
class HttpServer {
public:
    /// Binds and listens. Throws std::runtime_error if the address cannot be bound or
    /// the TLS certificate/key cannot be loaded.
    HttpServer(HttpServerOptions options, std::shared_ptr<const Router> router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Accept loop; returns after stop() once queued connections have been served.
    /// Throws std::system_error when accepting fails for good (descriptor exhaustion,
    /// invalid listener).
    void run();

    /// Thread-safe. Idle connections close; in-flight exchanges finish first.
    void stop() { stopping_.store(true); }

    std::uint16_t port() const { return port_; }
    bool is_tls() const { return static_cast<bool>(tls_); }
    const HttpServerOptions& options() const { return options_; }

private:
    void serve(TcpSocket socket);
    void reject(TcpSocket socket);

    HttpServerOptions options_;
    std::shared_ptr<const Router> router_;
    TcpListener listener_;
    TlsContext tls_;
    std::uint16_t port_{0};
    std::atomic<bool> stopping_{false};
    std::unique_ptr<WorkerPool> pool_;
};

}  // namespace ferry
