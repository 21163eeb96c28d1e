#include "ferry/tcp_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ferry {

namespace {

int create_tcp_socket(int family) {
    int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
    }
    return fd;
}

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

bool set_nonblocking(int fd, bool on) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

// Non-blocking connect bounded by timeout, then back to blocking mode.
std::error_code connect_with_timeout(int fd, const sockaddr* addr, socklen_t len,
                                     std::chrono::milliseconds timeout) {
    if (!set_nonblocking(fd, true)) return {errno, std::system_category()};
    int ret = ::connect(fd, addr, len);
    if (ret < 0 && errno != EINPROGRESS) return {errno, std::system_category()};
    if (ret < 0) {
        pollfd pfd{fd, POLLOUT, 0};
        int n;
        do {
            n = ::poll(&pfd, 1, timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1);
        } while (n < 0 && errno == EINTR);
        if (n == 0) return std::make_error_code(std::errc::timed_out);
        if (n < 0) return {errno, std::system_category()};
        int err = 0;
        socklen_t err_len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) < 0) return {errno, std::system_category()};
        if (err != 0) return {err, std::system_category()};
    }
    if (!set_nonblocking(fd, false)) return {errno, std::system_category()};
    return {};
}

}  // namespace

// -----------------------------------------------------------------------------
// TcpSocket
// -----------------------------------------------------------------------------
void TcpSocket::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult TcpSocket::read(void* buf, std::size_t len) {
    if (fd_ == -1) return {0, IoStatus::Error, std::make_error_code(std::errc::bad_file_descriptor)};
    for (;;) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n > 0) return {static_cast<std::size_t>(n), IoStatus::Ok, {}};
        if (n == 0) return {0, IoStatus::Eof, {}};
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return {0, IoStatus::Timeout, std::make_error_code(std::errc::timed_out)};
        return {0, IoStatus::Error, std::error_code(errno, std::system_category())};
    }
}

IoResult TcpSocket::write(const void* buf, std::size_t len) {
    if (fd_ == -1) return {0, IoStatus::Error, std::make_error_code(std::errc::bad_file_descriptor)};
    for (;;) {
        ssize_t n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        if (n >= 0) return {static_cast<std::size_t>(n), IoStatus::Ok, {}};
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return {0, IoStatus::Timeout, std::make_error_code(std::errc::timed_out)};
        return {0, IoStatus::Error, std::error_code(errno, std::system_category())};
    }
}

void TcpSocket::set_read_timeout(std::chrono::milliseconds timeout) {
    if (fd_ == -1) return;
    timeval tv = to_timeval(timeout);
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void TcpSocket::set_write_timeout(std::chrono::milliseconds timeout) {
    if (fd_ == -1) return;
    timeval tv = to_timeval(timeout);
    ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void TcpSocket::shutdown() {
    if (fd_ != -1) ::shutdown(fd_, SHUT_RDWR);
}

std::string TcpSocket::peer_address() const {
    if (fd_ == -1) return {};
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0 || addr.sin_family != AF_INET)
        return {};
    char host[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host))) return {};
    return std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));
}

// -----------------------------------------------------------------------------
// TcpListener
// -----------------------------------------------------------------------------
void TcpListener::bind(const char* host, std::uint16_t port) {
    if (fd_ != -1) return;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host, &addr.sin_addr) <= 0) {
        throw std::runtime_error(std::string("invalid bind address: ") + host);
    }
    fd_ = create_tcp_socket(AF_INET);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int e = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error(std::string("bind: ") + std::strerror(e));
    }
}

void TcpListener::listen(int backlog) {
    if (fd_ == -1) return;
    if (::listen(fd_, backlog) < 0) {
        throw std::runtime_error(std::string("listen: ") + std::strerror(errno));
    }
}

void TcpListener::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

TcpSocket TcpListener::accept(std::chrono::milliseconds timeout, std::error_code& ec) {
    ec.clear();
    if (fd_ == -1) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return TcpSocket();
    }
    pollfd pfd{fd_, POLLIN, 0};
    int n = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (n == 0) return TcpSocket();
    if (n < 0) {
        if (errno != EINTR) ec = std::error_code(errno, std::system_category());
        return TcpSocket();
    }
    int client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        ec = std::error_code(errno, std::system_category());
        return TcpSocket();
    }
    int one = 1;
    ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return TcpSocket(client_fd);
}

std::uint16_t TcpListener::local_port() const {
    if (fd_ == -1) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

TcpSocket connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout,
                      std::error_code& ec) {
    ec.clear();
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        ec = std::make_error_code(std::errc::host_unreachable);
        return TcpSocket();
    }
    TcpSocket connected;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            ec = std::error_code(errno, std::system_category());
            continue;
        }
        TcpSocket candidate(fd);
        ec = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
        if (!ec) {
            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            connected = std::move(candidate);
            break;
        }
    }
    ::freeaddrinfo(results);
    return connected;
}

}  // namespace ferry
