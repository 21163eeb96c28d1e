#pragma once

#include "ferry/byte_stream.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace ferry {

/// Blocking TCP connection. Owns the descriptor and closes it on destruction.
class TcpSocket final : public ByteStream {
public:
    TcpSocket() : fd_(-1) {}
    explicit TcpSocket(int fd) : fd_(fd) {}

    TcpSocket(TcpSocket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    TcpSocket& operator=(TcpSocket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~TcpSocket() override { close(); }

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    int fd() const { return fd_; }
    bool is_open() const { return fd_ != -1; }
    void close();

    IoResult read(void* buf, std::size_t len) override;
    IoResult write(const void* buf, std::size_t len) override;
    void set_read_timeout(std::chrono::milliseconds timeout) override;
    void set_write_timeout(std::chrono::milliseconds timeout);
    void shutdown() override;

    /// "a.b.c.d:port" of the remote end, or empty if unknown.
    std::string peer_address() const;

private:
    int fd_;
};

class TcpListener {
public:
    TcpListener() : fd_(-1) {}
    ~TcpListener() { close(); }

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    TcpListener(TcpListener&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    TcpListener& operator=(TcpListener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /// Throws std::runtime_error if the address is invalid or the port cannot be bound.
    void bind(const char* host, std::uint16_t port);
    void listen(int backlog = 128);
    void close();

    /// Waits up to \a timeout for a connection. Returns a closed socket on timeout
    /// (ec clear) or on failure (ec set).
    TcpSocket accept(std::chrono::milliseconds timeout, std::error_code& ec);

    int fd() const { return fd_; }
    bool is_open() const { return fd_ != -1; }

    /// Port actually bound (useful after binding port 0).
    std::uint16_t local_port() const;

private:
    int fd_;
};

/// Resolves \a host and connects. Returns a closed socket and sets \a ec on failure.
TcpSocket connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout,
                      std::error_code& ec);

}  // namespace ferry
