#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry {

/// HTTP/1.1 request method.
enum class HttpMethod : std::uint8_t {
    Get,
    Post,
    Head,
    Put,
    Delete,
    Options,
    Patch,
    Connect,
    Trace,
};

/// Method tokens are case-sensitive; anything unknown yields nullopt.
std::optional<HttpMethod> parse_http_method(std::string_view token);
std::string_view to_string(HttpMethod method);

struct HttpVersion {
    int major{1};
    int minor{1};

    bool operator==(const HttpVersion&) const = default;
};

bool iequal(std::string_view a, std::string_view b);

/// Ordered header list. Lookup is case-insensitive, insertion order is kept for
/// serialization, and duplicate names are all retained.
class HttpHeaders {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<Field> fields) : fields_(fields) {}

    void add(std::string name, std::string value);
    /// Replaces every field named \a name by a single one (appended if absent).
    void set(std::string_view name, std::string value);
    std::size_t erase(std::string_view name);

    /// First value for \a name, or an empty view.
    std::string_view get(std::string_view name) const;
    std::vector<std::string_view> get_all(std::string_view name) const;
    bool contains(std::string_view name) const;
    std::size_t count(std::string_view name) const;

    /// True if any \a name field holds \a token in its comma-separated list (case-insensitive).
    bool has_token(std::string_view name, std::string_view token) const;

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }
    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }

    bool operator==(const HttpHeaders&) const = default;

private:
    std::vector<Field> fields_;
};

using Params = std::vector<std::pair<std::string, std::string>>;

enum class BodyFraming : std::uint8_t {
    None,
    ContentLength,
    Chunked,
};

/// Parsed HTTP/1.1 request (request line + headers + fully read body).
struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string target;  // request-target exactly as received
    std::string path;    // percent-decoded path
    std::string query;   // raw query string (without '?')
    Params query_params; // decoded query pairs, in order
    HttpVersion version;
    HttpHeaders headers;
    BodyFraming framing{BodyFraming::None};
    std::string body;
    HttpHeaders trailers;  // trailer fields of a chunked body
    Params path_params;    // bound by the router

    std::string_view header(std::string_view name) const { return headers.get(name); }
    std::string_view path_param(std::string_view name) const;
    std::string_view query_param(std::string_view name) const;
    /// Path portion of the target, still percent-encoded.
    std::string_view raw_path() const;
    /// Persistent-connection semantics of this request (HTTP/1.1 default on, 1.0 opt-in).
    bool keep_alive() const;
};

/// Streaming body source: fills \a buf with up to \a len bytes, returns 0 at the end.
using BodyProducer = std::function<std::size_t(char* buf, std::size_t len)>;

/// HTTP/1.1 response (status line + headers + body).
struct HttpResponse {
    int status_code{200};
    std::string status_phrase;  // empty: canonical phrase for status_code
    HttpVersion version;
    HttpHeaders headers;
    BodyFraming framing{BodyFraming::None};  // set by decode_response
    std::string body;
    BodyProducer producer;  // when set, streamed instead of body
    HttpHeaders trailers;

    std::string_view header(std::string_view name) const { return headers.get(name); }
};

/// Canonical reason phrase, "Unknown" for unmapped codes.
std::string_view reason_phrase(int status_code);

inline bool is_informational(int status) { return status >= 100 && status < 200; }
inline bool is_success(int status) { return status >= 200 && status < 300; }
inline bool is_client_error(int status) { return status >= 400 && status < 500; }
inline bool is_server_error(int status) { return status >= 500 && status < 600; }
/// 1xx, 204 and 304 responses never carry a body.
inline bool status_forbids_body(int status) { return is_informational(status) || status == 204 || status == 304; }

HttpResponse make_http_response(int status_code, std::string body = {}, std::string_view content_type = {});

/// Convenience: 200 OK with body and Content-Type.
HttpResponse make_http_ok(std::string body, std::string_view content_type = "text/plain");

/// Plain-text error response carrying the reason phrase as its body.
HttpResponse make_http_error(int status_code);

}  // namespace ferry
