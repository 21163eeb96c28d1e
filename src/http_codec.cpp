#include "ferry/http_codec.hpp"
#include "ferry/url.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <vector>

namespace ferry {

namespace {

constexpr std::size_t kChunkSize = 4096;
constexpr std::size_t kMaxChunkSizeLine = 1024;
constexpr int kMaxLeadingEmptyLines = 4;

bool is_tchar(char c) {
    auto uc = static_cast<unsigned char>(c);
    if ((uc >= 'a' && uc <= 'z') || (uc >= 'A' && uc <= 'Z') || (uc >= '0' && uc <= '9')) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*': case '+':
        case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(std::string_view s) { return !s.empty() && std::ranges::all_of(s, is_tchar); }

std::string_view trim_ows(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool parse_version(std::string_view s, HttpVersion& out) {
    // HTTP/DIGIT.DIGIT
    if (s.size() != 8 || s.substr(0, 5) != "HTTP/" || s[6] != '.') return false;
    if (s[5] < '0' || s[5] > '9' || s[7] < '0' || s[7] > '9') return false;
    out.major = s[5] - '0';
    out.minor = s[7] - '0';
    return true;
}

bool parse_decimal(std::string_view s, std::size_t& out) {
    if (s.empty() || !std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; })) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

ParseError map_io(const IoResult& r) {
    switch (r.status) {
        case IoStatus::Ok: return ParseError::None;
        case IoStatus::Eof: return ParseError::ConnectionClosed;
        case IoStatus::Timeout: return ParseError::Timeout;
        case IoStatus::Error: break;
    }
    return ParseError::TransportError;
}

// Transfer codings in the order they were applied, across every Transfer-Encoding line.
std::vector<std::string_view> transfer_codings(const HttpHeaders& headers) {
    std::vector<std::string_view> codings;
    for (std::string_view value : headers.get_all("Transfer-Encoding")) {
        while (!value.empty()) {
            std::size_t comma = value.find(',');
            std::string_view item = trim_ows(value.substr(0, comma));
            if (!item.empty()) codings.push_back(item);
            if (comma == std::string_view::npos) break;
            value.remove_prefix(comma + 1);
        }
    }
    return codings;
}

std::error_code to_error_code(const IoResult& r) {
    if (r.ec) return r.ec;
    if (r.status == IoStatus::Timeout) return std::make_error_code(std::errc::timed_out);
    return std::make_error_code(std::errc::connection_reset);
}

// Decodes one HTTP/1.x message through an explicit state machine. Subclasses interpret
// the start line and choose the framing of a message that declares none.
class MessageDecoder {
public:
    MessageDecoder(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits)
        : stream_(stream), buffer_(buffer), limits_(limits) {}
    virtual ~MessageDecoder() = default;

    MessageDecoder(const MessageDecoder&) = delete;
    MessageDecoder& operator=(const MessageDecoder&) = delete;

    ParseError run();

    const std::string& detail() const { return detail_; }
    std::size_t bytes_received() const { return bytes_received_; }

protected:
    virtual ParseError on_start_line(std::string_view line) = 0;
    /// The message cannot have a body whatever its headers say (HEAD reply, 204, 304).
    virtual bool body_forbidden() const { return false; }
    /// Framing of a message with neither Content-Length nor Transfer-Encoding.
    virtual bool read_until_close() const = 0;
    /// Whether codings other than chunked may sit under a final chunked coding.
    virtual bool accepts_layered_codings() const = 0;
    /// Transfer-Encoding present but not decodable as chunked.
    virtual ParseError on_unchunked_transfer_coding() = 0;

    ParseError fail(ParseError error, std::string detail) {
        detail_ = std::move(detail);
        return error;
    }

    HttpHeaders headers_;
    BodyFraming framing_{BodyFraming::None};
    std::string body_;
    HttpHeaders trailers_;
    bool until_close_{false};

private:
    enum class State : std::uint8_t {
        StartLine,
        Headers,
        Framing,
        FixedBody,
        ChunkSize,
        ChunkData,
        ChunkEnd,
        Trailers,
        UntilClose,
        Done,
    };

    ParseError fill();
    ParseError next_line(std::size_t max_len, ParseError too_long);
    ParseError parse_field(HttpHeaders& into);
    ParseError decide_framing(State& next);
    ParseError read_fixed();

    ByteStream& stream_;
    ReadBuffer& buffer_;
    const CodecLimits& limits_;
    std::string line_;
    std::string detail_;
    std::size_t bytes_received_{0};
    std::size_t header_bytes_{0};
    std::size_t remaining_{0};
};

ParseError MessageDecoder::fill() {
    IoResult r = buffer_.fill(stream_);
    if (r.ok()) {
        bytes_received_ += r.bytes;
        return ParseError::None;
    }
    return map_io(r);
}

ParseError MessageDecoder::next_line(std::size_t max_len, ParseError too_long) {
    for (;;) {
        std::string_view data = buffer_.data();
        std::size_t nl = data.find('\n');
        if (nl != std::string_view::npos) {
            if (nl > max_len) return fail(too_long, "line too long");
            std::string_view line = data.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            line_.assign(line);
            buffer_.consume(nl + 1);
            return ParseError::None;
        }
        if (data.size() > max_len) return fail(too_long, "line too long");
        if (ParseError err = fill(); err != ParseError::None) return err;
    }
}

ParseError MessageDecoder::parse_field(HttpHeaders& into) {
    std::string_view line = line_;
    if (line.front() == ' ' || line.front() == '\t') return fail(ParseError::InvalidHeader, "obsolete line folding");
    std::size_t colon = line.find(':');
    if (colon == std::string_view::npos) return fail(ParseError::InvalidHeader, "missing colon");
    std::string_view name = line.substr(0, colon);
    if (!is_token(name)) return fail(ParseError::InvalidHeader, "invalid header name");
    std::string_view value = trim_ows(line.substr(colon + 1));
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if ((uc < 0x20 && c != '\t') || uc == 0x7f) return fail(ParseError::InvalidHeader, "control character in value");
    }
    into.add(std::string(name), std::string(value));
    return ParseError::None;
}

ParseError MessageDecoder::decide_framing(State& next) {
    const bool has_te = headers_.contains("Transfer-Encoding");
    const bool has_cl = headers_.contains("Content-Length");
    if (has_cl && headers_.has_token("Transfer-Encoding", "chunked"))
        return fail(ParseError::ConflictingFraming, "both Content-Length and chunked");
    if (body_forbidden()) {
        next = State::Done;
        return ParseError::None;
    }
    bool chunked = false;
    if (has_te) {
        // chunked must be the final coding, and applied only once
        auto codings = transfer_codings(headers_);
        auto chunked_count = std::ranges::count_if(codings, [](std::string_view c) { return iequal(c, "chunked"); });
        chunked = !codings.empty() && iequal(codings.back(), "chunked") && chunked_count == 1 &&
                  (codings.size() == 1 || accepts_layered_codings());
    }
    if (chunked) {
        framing_ = BodyFraming::Chunked;
        next = State::ChunkSize;
        return ParseError::None;
    }
    if (has_te) {
        if (ParseError err = on_unchunked_transfer_coding(); err != ParseError::None) return err;
        next = until_close_ ? State::UntilClose : State::Done;
        return ParseError::None;
    }
    if (has_cl) {
        // Repeated or list-valued Content-Length is accepted only if every value agrees.
        std::optional<std::size_t> length;
        for (std::string_view value : headers_.get_all("Content-Length")) {
            while (!value.empty()) {
                std::size_t comma = value.find(',');
                std::size_t n = 0;
                if (!parse_decimal(trim_ows(value.substr(0, comma)), n))
                    return fail(ParseError::InvalidContentLength, "Content-Length is not a number");
                if (length && *length != n) return fail(ParseError::InvalidContentLength, "Content-Length values differ");
                length = n;
                if (comma == std::string_view::npos) break;
                value.remove_prefix(comma + 1);
            }
        }
        if (!length) return fail(ParseError::InvalidContentLength, "empty Content-Length");
        if (*length > limits_.max_body_bytes) return fail(ParseError::BodyTooLarge, "body exceeds limit");
        framing_ = BodyFraming::ContentLength;
        remaining_ = *length;
        body_.reserve(*length);
        next = remaining_ > 0 ? State::FixedBody : State::Done;
        return ParseError::None;
    }
    until_close_ = read_until_close();
    next = until_close_ ? State::UntilClose : State::Done;
    return ParseError::None;
}

ParseError MessageDecoder::read_fixed() {
    while (remaining_ > 0) {
        if (buffer_.empty()) {
            if (ParseError err = fill(); err != ParseError::None) return err;
        }
        std::string_view data = buffer_.data();
        std::size_t n = (std::min)(remaining_, data.size());
        body_.append(data.data(), n);
        buffer_.consume(n);
        remaining_ -= n;
    }
    return ParseError::None;
}

ParseError MessageDecoder::run() {
    State state = State::StartLine;
    int empty_lines = 0;
    while (state != State::Done) {
        ParseError err = ParseError::None;
        switch (state) {
            case State::StartLine:
                err = next_line(limits_.max_start_line, ParseError::MalformedStartLine);
                if (err != ParseError::None) break;
                if (line_.empty()) {
                    if (++empty_lines > kMaxLeadingEmptyLines) err = fail(ParseError::MalformedStartLine, "empty start line");
                    break;
                }
                err = on_start_line(line_);
                state = State::Headers;
                break;
            case State::Headers: {
                std::size_t budget = limits_.max_header_bytes > header_bytes_ ? limits_.max_header_bytes - header_bytes_ : 0;
                err = next_line(budget, ParseError::HeadersTooLarge);
                if (err != ParseError::None) break;
                header_bytes_ += line_.size() + 2;
                if (header_bytes_ > limits_.max_header_bytes) {
                    err = fail(ParseError::HeadersTooLarge, "header section exceeds limit");
                } else if (line_.empty()) {
                    state = State::Framing;
                } else {
                    err = parse_field(headers_);
                }
                break;
            }
            case State::Framing:
                err = decide_framing(state);
                break;
            case State::FixedBody:
                err = read_fixed();
                state = State::Done;
                break;
            case State::ChunkSize: {
                err = next_line(kMaxChunkSizeLine, ParseError::InvalidChunk);
                if (err != ParseError::None) break;
                std::string_view size_sv = line_;
                size_sv = trim_ows(size_sv.substr(0, size_sv.find(';')));  // chunk extensions are ignored
                if (size_sv.empty()) {
                    err = fail(ParseError::InvalidChunk, "missing chunk size");
                    break;
                }
                std::size_t size = 0;
                auto [ptr, ec] = std::from_chars(size_sv.data(), size_sv.data() + size_sv.size(), size, 16);
                if (ec == std::errc::result_out_of_range) {
                    err = fail(ParseError::BodyTooLarge, "chunk size overflow");
                    break;
                }
                if (ec != std::errc{} || ptr != size_sv.data() + size_sv.size()) {
                    err = fail(ParseError::InvalidChunk, "invalid chunk size");
                    break;
                }
                if (size > limits_.max_body_bytes - (std::min)(body_.size(), limits_.max_body_bytes)) {
                    err = fail(ParseError::BodyTooLarge, "body exceeds limit");
                    break;
                }
                remaining_ = size;
                state = size == 0 ? State::Trailers : State::ChunkData;
                header_bytes_ = 0;
                break;
            }
            case State::ChunkData:
                err = read_fixed();
                state = State::ChunkEnd;
                break;
            case State::ChunkEnd:
                err = next_line(2, ParseError::InvalidChunk);
                if (err == ParseError::None && !line_.empty()) err = fail(ParseError::InvalidChunk, "missing CRLF after chunk");
                state = State::ChunkSize;
                break;
            case State::Trailers: {
                std::size_t budget = limits_.max_header_bytes > header_bytes_ ? limits_.max_header_bytes - header_bytes_ : 0;
                err = next_line(budget, ParseError::HeadersTooLarge);
                if (err != ParseError::None) break;
                header_bytes_ += line_.size() + 2;
                if (line_.empty()) {
                    state = State::Done;
                } else if (header_bytes_ > limits_.max_header_bytes) {
                    err = fail(ParseError::HeadersTooLarge, "trailer section exceeds limit");
                } else {
                    err = parse_field(trailers_);
                }
                break;
            }
            case State::UntilClose: {
                std::string_view data = buffer_.data();
                if (body_.size() + data.size() > limits_.max_body_bytes) {
                    err = fail(ParseError::BodyTooLarge, "body exceeds limit");
                    break;
                }
                body_.append(data);
                buffer_.consume(data.size());
                err = fill();
                if (err == ParseError::ConnectionClosed) {
                    err = ParseError::None;
                    state = State::Done;
                }
                break;
            }
            case State::Done:
                break;
        }
        if (err != ParseError::None) return err;
    }
    return ParseError::None;
}

class RequestDecoder final : public MessageDecoder {
public:
    RequestDecoder(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits, HttpRequest& request)
        : MessageDecoder(stream, buffer, limits), request_(request) {}

    void finish() {
        request_.headers = std::move(headers_);
        request_.framing = framing_;
        request_.body = std::move(body_);
        request_.trailers = std::move(trailers_);
    }

protected:
    ParseError on_start_line(std::string_view line) override {
        // METHOD SP request-target SP HTTP-version
        std::size_t sp1 = line.find(' ');
        if (sp1 == std::string_view::npos) return fail(ParseError::MalformedStartLine, "bad request line");
        std::size_t sp2 = line.find(' ', sp1 + 1);
        if (sp2 == std::string_view::npos || line.find(' ', sp2 + 1) != std::string_view::npos)
            return fail(ParseError::MalformedStartLine, "bad request line");
        std::string_view method_sv = line.substr(0, sp1);
        std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        std::string_view version_sv = line.substr(sp2 + 1);

        if (!is_token(method_sv)) return fail(ParseError::MalformedStartLine, "bad method token");
        if (target.empty()) return fail(ParseError::MalformedStartLine, "empty request target");
        for (char c : target) {
            auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc == 0x7f) return fail(ParseError::MalformedStartLine, "invalid character in target");
        }
        if (!parse_version(version_sv, request_.version))
            return fail(ParseError::MalformedStartLine, "bad HTTP version");
        if (request_.version.major != 1) return fail(ParseError::UnsupportedVersion, std::string(version_sv));
        auto method = parse_http_method(method_sv);
        if (!method) return fail(ParseError::UnsupportedMethod, std::string(method_sv));
        request_.method = *method;
        request_.target = std::string(target);

        std::string_view origin = target;
        if (origin.front() != '/' && origin != "*") {
            // absolute-form: keep only path and query
            std::size_t scheme_end = origin.find("://");
            if (scheme_end == std::string_view::npos) return fail(ParseError::MalformedStartLine, "bad request target");
            std::size_t path_start = origin.find_first_of("/?", scheme_end + 3);
            origin = path_start == std::string_view::npos ? std::string_view("/") : origin.substr(path_start);
            if (origin.front() == '?') return fail(ParseError::MalformedStartLine, "bad request target");
        }
        std::size_t q = origin.find('?');
        auto path = percent_decode(origin.substr(0, q));
        if (!path) return fail(ParseError::MalformedStartLine, "bad percent-encoding in path");
        request_.path = std::move(*path);
        if (q != std::string_view::npos) {
            request_.query = std::string(origin.substr(q + 1));
            auto params = parse_query(request_.query);
            if (!params) return fail(ParseError::MalformedStartLine, "bad percent-encoding in query");
            request_.query_params = std::move(*params);
        }
        return ParseError::None;
    }

    bool read_until_close() const override { return false; }

    bool accepts_layered_codings() const override { return false; }

    ParseError on_unchunked_transfer_coding() override {
        return fail(ParseError::UnsupportedTransferEncoding, std::string(headers_.get("Transfer-Encoding")));
    }

private:
    HttpRequest& request_;
};

class ResponseDecoder final : public MessageDecoder {
public:
    ResponseDecoder(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits, HttpResponse& response,
                    bool head_request)
        : MessageDecoder(stream, buffer, limits), response_(response), head_request_(head_request) {}

    void finish() {
        response_.headers = std::move(headers_);
        response_.framing = framing_;
        response_.body = std::move(body_);
        response_.trailers = std::move(trailers_);
    }

protected:
    ParseError on_start_line(std::string_view line) override {
        // HTTP-version SP 3DIGIT [SP reason-phrase]
        std::size_t sp1 = line.find(' ');
        if (sp1 == std::string_view::npos) return fail(ParseError::MalformedStartLine, "bad status line");
        if (!parse_version(line.substr(0, sp1), response_.version))
            return fail(ParseError::MalformedStartLine, "bad HTTP version");
        if (response_.version.major != 1) return fail(ParseError::UnsupportedVersion, std::string(line.substr(0, sp1)));
        std::string_view rest = line.substr(sp1 + 1);
        std::string_view code = rest.substr(0, 3);
        std::size_t status = 0;
        if (code.size() != 3 || !parse_decimal(code, status) || status < 100)
            return fail(ParseError::MalformedStartLine, "bad status code");
        if (rest.size() > 3 && rest[3] != ' ') return fail(ParseError::MalformedStartLine, "bad status line");
        response_.status_code = static_cast<int>(status);
        response_.status_phrase = rest.size() > 4 ? std::string(rest.substr(4)) : std::string();
        return ParseError::None;
    }

    bool body_forbidden() const override { return head_request_ || status_forbids_body(response_.status_code); }

    bool read_until_close() const override { return true; }

    bool accepts_layered_codings() const override { return true; }

    ParseError on_unchunked_transfer_coding() override {
        until_close_ = true;
        return ParseError::None;
    }

private:
    HttpResponse& response_;
    bool head_request_;
};

std::string head_of(const HttpResponse& response) {
    std::string out;
    out.reserve(128);
    out += "HTTP/";
    out += std::to_string(response.version.major);
    out += '.';
    out += std::to_string(response.version.minor);
    out += ' ';
    out += std::to_string(response.status_code);
    out += ' ';
    out += response.status_phrase.empty() ? reason_phrase(response.status_code) : std::string_view(response.status_phrase);
    out += "\r\n";
    for (const auto& [k, v] : response.headers) {
        out += k;
        out += ": ";
        out += v;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

std::string request_target_of(const HttpRequest& request) {
    if (!request.target.empty()) return request.target;
    // request.path is decoded; re-encode each segment.
    std::string target;
    std::string_view path = request.path.empty() ? std::string_view("/") : std::string_view(request.path);
    std::size_t start = path.front() == '/' ? 1 : 0;
    target += '/';
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        target += percent_encode(path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
        if (slash == std::string_view::npos) break;
        target += '/';
        start = slash + 1;
    }
    if (!request.query.empty()) {
        target += '?';
        target += request.query;
    } else if (!request.query_params.empty()) {
        target += '?';
        bool first = true;
        for (const auto& [k, v] : request.query_params) {
            if (!first) target += '&';
            first = false;
            target += percent_encode(k);
            target += '=';
            target += percent_encode(v);
        }
    }
    return target;
}

std::string head_of(const HttpRequest& request) {
    std::string out;
    out.reserve(128);
    out += to_string(request.method);
    out += ' ';
    out += request_target_of(request);
    out += " HTTP/";
    out += std::to_string(request.version.major);
    out += '.';
    out += std::to_string(request.version.minor);
    out += "\r\n";
    for (const auto& [k, v] : request.headers) {
        out += k;
        out += ": ";
        out += v;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

std::string chunk_header(std::size_t n) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n, 16);
    (void)ec;
    std::string out(buf, ptr);
    out += "\r\n";
    return out;
}

std::error_code write_chunk(ByteStream& stream, std::string_view data) {
    if (data.empty()) return {};
    std::string frame = chunk_header(data.size());
    frame.append(data);
    frame += "\r\n";
    IoResult r = write_all(stream, frame);
    return r.ok() ? std::error_code{} : to_error_code(r);
}

std::error_code write_last_chunk(ByteStream& stream, const HttpHeaders& trailers) {
    std::string out = "0\r\n";
    for (const auto& [k, v] : trailers) {
        out += k;
        out += ": ";
        out += v;
        out += "\r\n";
    }
    out += "\r\n";
    IoResult r = write_all(stream, out);
    return r.ok() ? std::error_code{} : to_error_code(r);
}

// Writes head + body with the framing declared by \a headers.
std::error_code write_message(ByteStream& stream, std::string head, const HttpHeaders& headers, const std::string& body,
                              const BodyProducer& producer, const HttpHeaders& trailers, bool include_body) {
    if (!include_body) {
        IoResult r = write_all(stream, head);
        return r.ok() ? std::error_code{} : to_error_code(r);
    }
    const bool chunked = headers.has_token("Transfer-Encoding", "chunked");
    if (!chunked && !producer) {
        // Small bodies go out in the same write as the head.
        if (body.size() <= kChunkSize) {
            head += body;
            IoResult r = write_all(stream, head);
            return r.ok() ? std::error_code{} : to_error_code(r);
        }
        IoResult r = write_all(stream, head);
        if (!r.ok()) return to_error_code(r);
        r = write_all(stream, body);
        return r.ok() ? std::error_code{} : to_error_code(r);
    }

    IoResult r = write_all(stream, head);
    if (!r.ok()) return to_error_code(r);

    if (producer) {
        char buf[kChunkSize];
        for (;;) {
            std::size_t n = producer(buf, sizeof(buf));
            if (n == 0) break;
            std::string_view piece(buf, (std::min)(n, sizeof(buf)));
            if (chunked) {
                if (auto ec = write_chunk(stream, piece)) return ec;
            } else {
                r = write_all(stream, piece);
                if (!r.ok()) return to_error_code(r);
            }
        }
    } else {
        std::string_view rest = body;
        while (!rest.empty()) {
            std::size_t n = (std::min)(rest.size(), kChunkSize);
            if (auto ec = write_chunk(stream, rest.substr(0, n))) return ec;
            rest.remove_prefix(n);
        }
    }
    if (chunked) return write_last_chunk(stream, trailers);
    return {};
}

template <typename Message>
bool frame_body(Message& message, bool frame_empty) {
    const bool has_cl = message.headers.contains("Content-Length");
    const bool chunked = message.headers.has_token("Transfer-Encoding", "chunked");
    if (has_cl && chunked) return false;
    if (has_cl || chunked) return true;
    if (message.producer) {
        message.headers.add("Transfer-Encoding", "chunked");
    } else if (frame_empty || !message.body.empty()) {
        message.headers.add("Content-Length", std::to_string(message.body.size()));
    }
    return true;
}

// Requests carry no producer; adapt them to the same framing rule.
struct RequestFramingView {
    HttpHeaders& headers;
    const std::string& body;
    BodyProducer producer;
};

}  // namespace

std::string_view to_string(ParseError error) {
    switch (error) {
        case ParseError::None: return "none";
        case ParseError::MalformedStartLine: return "malformed start line";
        case ParseError::UnsupportedMethod: return "unsupported method";
        case ParseError::UnsupportedVersion: return "unsupported HTTP version";
        case ParseError::InvalidHeader: return "invalid header";
        case ParseError::HeadersTooLarge: return "headers too large";
        case ParseError::InvalidContentLength: return "invalid Content-Length";
        case ParseError::ConflictingFraming: return "conflicting framing";
        case ParseError::UnsupportedTransferEncoding: return "unsupported Transfer-Encoding";
        case ParseError::InvalidChunk: return "invalid chunk";
        case ParseError::BodyTooLarge: return "body too large";
        case ParseError::ConnectionClosed: return "connection closed";
        case ParseError::Timeout: return "timeout";
        case ParseError::TransportError: return "transport error";
    }
    return "unknown";
}

int status_for(ParseError error) {
    switch (error) {
        case ParseError::None: return 200;
        case ParseError::MalformedStartLine:
        case ParseError::InvalidHeader:
        case ParseError::InvalidContentLength:
        case ParseError::ConflictingFraming:
        case ParseError::InvalidChunk:
            return 400;
        case ParseError::UnsupportedMethod:
        case ParseError::UnsupportedTransferEncoding:
            return 501;
        case ParseError::UnsupportedVersion: return 505;
        case ParseError::HeadersTooLarge: return 431;
        case ParseError::BodyTooLarge: return 413;
        case ParseError::Timeout: return 408;
        case ParseError::ConnectionClosed:
        case ParseError::TransportError:
            return 0;
    }
    return 400;
}

// -----------------------------------------------------------------------------
// ReadBuffer
// -----------------------------------------------------------------------------
void ReadBuffer::consume(std::size_t n) {
    start_ += (std::min)(n, size());
    if (start_ == buf_.size()) clear();
}

void ReadBuffer::clear() {
    buf_.clear();
    start_ = 0;
}

IoResult ReadBuffer::fill(ByteStream& stream) {
    if (start_ > 0 && start_ >= buf_.size() / 2) {
        buf_.erase(0, start_);
        start_ = 0;
    }
    const std::size_t old_size = buf_.size();
    buf_.resize(old_size + read_chunk_);
    IoResult r = stream.read(buf_.data() + old_size, read_chunk_);
    buf_.resize(old_size + (r.ok() ? r.bytes : 0));
    if (r.ok() && r.bytes == 0) r.status = IoStatus::Eof;
    return r;
}

// -----------------------------------------------------------------------------
// Decode / encode
// -----------------------------------------------------------------------------
HttpParseResult decode_request(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits) {
    HttpParseResult result;
    RequestDecoder decoder(stream, buffer, limits, result.request);
    result.error = decoder.run();
    result.bytes_received = decoder.bytes_received();
    result.detail = decoder.detail();
    result.ok = result.error == ParseError::None;
    if (result.ok) decoder.finish();
    return result;
}

HttpResponseParseResult decode_response(ByteStream& stream, ReadBuffer& buffer, const CodecLimits& limits,
                                        bool head_request) {
    HttpResponseParseResult result;
    ResponseDecoder decoder(stream, buffer, limits, result.response, head_request);
    result.error = decoder.run();
    result.detail = decoder.detail();
    result.ok = result.error == ParseError::None;
    if (result.ok) decoder.finish();
    return result;
}

std::error_code encode_response(const HttpResponse& response, ByteStream& stream, bool include_body) {
    return write_message(stream, head_of(response), response.headers, response.body, response.producer,
                         response.trailers, include_body && !status_forbids_body(response.status_code));
}

std::error_code encode_request(const HttpRequest& request, ByteStream& stream) {
    return write_message(stream, head_of(request), request.headers, request.body, nullptr, request.trailers, true);
}

bool frame_response(HttpResponse& response) {
    if (status_forbids_body(response.status_code)) {
        response.body.clear();
        response.producer = nullptr;
        return !(response.headers.contains("Content-Length") &&
                 response.headers.has_token("Transfer-Encoding", "chunked"));
    }
    return frame_body(response, true);
}

bool frame_request(HttpRequest& request) {
    RequestFramingView view{request.headers, request.body, nullptr};
    return frame_body(view, false);
}

std::string to_string(const HttpResponse& response) {
    MemoryStream out;
    (void)encode_response(response, out);
    return out.take_output();
}

std::string to_string(const HttpRequest& request) {
    MemoryStream out;
    (void)encode_request(request, out);
    return out.take_output();
}

HttpParseResult parse_http_request(std::string_view data, const CodecLimits& limits) {
    MemoryStream in{std::string(data)};
    ReadBuffer buffer;
    return decode_request(in, buffer, limits);
}

}  // namespace ferry
