#pragma once

#include "ferry/byte_stream.hpp"
#include "ferry/http_codec.hpp"
#include "ferry/router.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ferry {

enum class ConnectionState : std::uint8_t {
    Handshaking,
    Idle,
    Reading,
    Dispatched,
    Closing,
    Closed,
};

std::string_view to_string(ConnectionState state);

struct ConnectionOptions {
    /// Bounds the handshake, the wait for a request and every read inside one.
    std::chrono::milliseconds read_timeout{5000};
    CodecLimits limits;
    /// Requests served before the connection is closed; 0 means no cap.
    std::size_t max_keep_alive_requests{0};
    /// One info line per dispatched exchange: peer, method, target, status.
    bool access_log{true};
};

/// Drives one accepted connection from handshake to close: reads requests, resolves
/// them against the route table, runs the handler and writes the response. Runs
/// entirely on the calling thread.
class ConnectionSupervisor {
public:
    /// \a stopping, when given, is polled while the connection is idle; once set the
    /// connection is closed after the current exchange.
    ConnectionSupervisor(std::unique_ptr<ByteStream> stream, std::shared_ptr<const Router> router,
                         ConnectionOptions options, const std::atomic<bool>* stopping = nullptr,
                         std::string peer = {});

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /// Runs the state machine until the connection is closed.
    void run();

    ConnectionState state() const { return state_; }
    std::size_t requests_served() const { return requests_served_; }

private:
    ConnectionState on_handshake();
    ConnectionState on_idle();
    ConnectionState on_request();
    void close();

    HttpResponse dispatch(HttpRequest& request) const;
    bool stopping() const { return stopping_ && stopping_->load(); }

    std::unique_ptr<ByteStream> stream_;
    std::shared_ptr<const Router> router_;
    ConnectionOptions options_;
    const std::atomic<bool>* stopping_;
    std::string peer_;
    ReadBuffer buffer_;
    ConnectionState state_{ConnectionState::Handshaking};
    std::size_t requests_served_{0};
};

}  // namespace ferry
