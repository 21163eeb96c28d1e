#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry {

/// Outcome kind of a transport operation. TLS handshake and record failures are
/// reported as Error, the same as plain socket failures.
enum class IoStatus : std::uint8_t {
    Ok,
    Eof,
    Timeout,
    Error,
};

struct IoResult {
    std::size_t bytes{0};
    IoStatus status{IoStatus::Ok};
    std::error_code ec;

    bool ok() const { return status == IoStatus::Ok; }
};

/// Uniform read/write contract over plaintext sockets, TLS sockets and in-memory buffers.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Reads at most \a len bytes. Ok with bytes > 0, or Eof / Timeout / Error.
    virtual IoResult read(void* buf, std::size_t len) = 0;
    virtual IoResult write(const void* buf, std::size_t len) = 0;

    /// Transport-level handshake; no-op for plaintext streams.
    virtual std::error_code handshake() { return {}; }

    /// Bounds every subsequent read. Zero disables the timeout.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void shutdown() = 0;
};

/// Writes all of \a data, looping over partial writes.
IoResult write_all(ByteStream& stream, std::string_view data);

/// In-memory stream: reads come from a fixed input, writes are appended to output().
class MemoryStream final : public ByteStream {
public:
    MemoryStream() = default;
    explicit MemoryStream(std::string input, std::size_t max_read = 0)
        : input_(std::move(input)), max_read_(max_read) {}

    IoResult read(void* buf, std::size_t len) override;
    IoResult write(const void* buf, std::size_t len) override;
    void set_read_timeout(std::chrono::milliseconds) override {}
    void shutdown() override { shut_down_ = true; }

    const std::string& output() const { return output_; }
    std::string take_output() { return std::move(output_); }
    bool is_shut_down() const { return shut_down_; }

private:
    std::string input_;
    std::size_t offset_{0};
    std::size_t max_read_{0};  // 0 = unlimited; otherwise simulates short reads
    std::string output_;
    bool shut_down_{false};
};

}  // namespace ferry
