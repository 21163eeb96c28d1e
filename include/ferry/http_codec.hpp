#pragma once

#include "ferry/byte_stream.hpp"
#include "ferry/http_message.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry {

/// Classified decode failure.
enum class ParseError : std::uint8_t {
    None,
    MalformedStartLine,
    UnsupportedMethod,
    UnsupportedVersion,
    InvalidHeader,
    HeadersTooLarge,
    InvalidContentLength,
    ConflictingFraming,
    UnsupportedTransferEncoding,
    InvalidChunk,
    BodyTooLarge,
    ConnectionClosed,
    Timeout,
    TransportError,
};

std::string_view to_string(ParseError error);

/// Status code of the error response for \a error; 0 when no response can be written
/// (peer gone or transport broken).
int status_for(ParseError error);

struct CodecLimits {
    std::size_t max_start_line{8 * 1024};
    std::size_t max_header_bytes{64 * 1024};
    std::size_t max_body_bytes{8 * 1024 * 1024};
};

/// Per-connection receive buffer. Bytes read past the end of one message stay here for
/// the next one; storage is reused across messages.
class ReadBuffer {
public:
    explicit ReadBuffer(std::size_t read_chunk = 4096) : read_chunk_(read_chunk) {}

    std::string_view data() const { return std::string_view(buf_).substr(start_); }
    std::size_t size() const { return buf_.size() - start_; }
    bool empty() const { return size() == 0; }

    void consume(std::size_t n);
    void clear();

    /// Appends one read from \a stream (at most read_chunk bytes).
    IoResult fill(ByteStream& stream);

private:
    std::string buf_;
    std::size_t start_{0};
    std::size_t read_chunk_;
};

/// Result of parsing: either a valid request or a classified error.
struct HttpParseResult {
    bool ok{false};
    HttpRequest request;
    ParseError error{ParseError::None};
    std::string detail;
    /// Bytes of this message received before the error (0: nothing arrived).
    std::size_t bytes_received{0};
};

struct HttpResponseParseResult {
    bool ok{false};
    HttpResponse response;
    ParseError error{ParseError::None};
    std::string detail;
};

/// Reads one request from \a stream. The body is fully delimited and read before returning.
HttpParseResult decode_request(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits = {});

/// Reads one response. \a head_request suppresses the body (reply to HEAD).
/// A response without framing is read until the peer closes.
HttpResponseParseResult decode_response(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits = {},
                                        bool head_request = false);

/// Writes status line, headers in order, CRLF and the body in the framing the headers
/// declare. Content-Length is written exactly as the caller set it.
std::error_code encode_response(const HttpResponse& response, ByteStream& stream, bool include_body = true);

std::error_code encode_request(const HttpRequest& request, ByteStream& stream);

/// Adds the framing header a response body needs: Content-Length for buffers, chunked
/// Transfer-Encoding for producers. Caller-set framing is kept. Returns false if the
/// response declares both Content-Length and chunked.
bool frame_response(HttpResponse& response);

/// Same as frame_response for outgoing requests; requests without body stay unframed.
bool frame_request(HttpRequest& request);

/// Serialize HttpResponse to HTTP/1.1 wire format.
std::string to_string(const HttpResponse& response);
std::string to_string(const HttpRequest& request);

/// Parse one request from an in-memory buffer.
HttpParseResult parse_http_request(std::string_view data, const CodecLimits& limits = {});

}  // namespace ferry
