#include "ferry/http_message.hpp"
#include <algorithm>
#include <cctype>

namespace ferry {

namespace {

std::string_view trim_ows(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string_view find_param(const Params& params, std::string_view name) {
    for (const auto& [k, v] : params) {
        if (k == name) return v;
    }
    return {};
}

}  // namespace

bool iequal(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::optional<HttpMethod> parse_http_method(std::string_view token) {
    if (token == "GET") return HttpMethod::Get;
    if (token == "POST") return HttpMethod::Post;
    if (token == "HEAD") return HttpMethod::Head;
    if (token == "PUT") return HttpMethod::Put;
    if (token == "DELETE") return HttpMethod::Delete;
    if (token == "OPTIONS") return HttpMethod::Options;
    if (token == "PATCH") return HttpMethod::Patch;
    if (token == "CONNECT") return HttpMethod::Connect;
    if (token == "TRACE") return HttpMethod::Trace;
    return std::nullopt;
}

std::string_view to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Head: return "HEAD";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Delete: return "DELETE";
        case HttpMethod::Options: return "OPTIONS";
        case HttpMethod::Patch: return "PATCH";
        case HttpMethod::Connect: return "CONNECT";
        case HttpMethod::Trace: return "TRACE";
    }
    return "GET";
}

// -----------------------------------------------------------------------------
// HttpHeaders
// -----------------------------------------------------------------------------
void HttpHeaders::add(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
}

void HttpHeaders::set(std::string_view name, std::string value) {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return iequal(f.first, name); });
    if (it == fields_.end()) {
        fields_.emplace_back(std::string(name), std::move(value));
        return;
    }
    it->second = std::move(value);
    auto rest = std::remove_if(std::next(it), fields_.end(), [name](const Field& f) { return iequal(f.first, name); });
    fields_.erase(rest, fields_.end());
}

std::size_t HttpHeaders::erase(std::string_view name) {
    return std::erase_if(fields_, [name](const Field& f) { return iequal(f.first, name); });
}

std::string_view HttpHeaders::get(std::string_view name) const {
    for (const auto& [k, v] : fields_) {
        if (iequal(k, name)) return v;
    }
    return {};
}

std::vector<std::string_view> HttpHeaders::get_all(std::string_view name) const {
    std::vector<std::string_view> out;
    for (const auto& [k, v] : fields_) {
        if (iequal(k, name)) out.emplace_back(v);
    }
    return out;
}

bool HttpHeaders::contains(std::string_view name) const {
    return std::ranges::any_of(fields_, [name](const Field& f) { return iequal(f.first, name); });
}

std::size_t HttpHeaders::count(std::string_view name) const {
    return static_cast<std::size_t>(
        std::ranges::count_if(fields_, [name](const Field& f) { return iequal(f.first, name); }));
}

bool HttpHeaders::has_token(std::string_view name, std::string_view token) const {
    for (const auto& [k, v] : fields_) {
        if (!iequal(k, name)) continue;
        std::string_view rest = v;
        while (!rest.empty()) {
            std::size_t comma = rest.find(',');
            std::string_view item = trim_ows(rest.substr(0, comma));
            if (iequal(item, token)) return true;
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
    }
    return false;
}

// -----------------------------------------------------------------------------
// HttpRequest
// -----------------------------------------------------------------------------
std::string_view HttpRequest::path_param(std::string_view name) const { return find_param(path_params, name); }

std::string_view HttpRequest::query_param(std::string_view name) const { return find_param(query_params, name); }

std::string_view HttpRequest::raw_path() const {
    std::string_view t = target;
    if (!t.empty() && t.front() != '/') {
        // absolute-form
        std::size_t scheme_end = t.find("://");
        if (scheme_end != std::string_view::npos) {
            std::size_t start = t.find_first_of("/?", scheme_end + 3);
            t = start == std::string_view::npos ? std::string_view() : t.substr(start);
        }
    }
    t = t.substr(0, t.find('?'));
    return t.empty() ? std::string_view("/") : t;
}

bool HttpRequest::keep_alive() const {
    if (headers.has_token("Connection", "close")) return false;
    if (version.major == 1 && version.minor >= 1) return true;
    return headers.has_token("Connection", "keep-alive");
}

// -----------------------------------------------------------------------------
// Responses
// -----------------------------------------------------------------------------
std::string_view reason_phrase(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

HttpResponse make_http_response(int status_code, std::string body, std::string_view content_type) {
    HttpResponse resp;
    resp.status_code = status_code;
    if (!content_type.empty()) resp.headers.add("Content-Type", std::string(content_type));
    resp.body = std::move(body);
    return resp;
}

HttpResponse make_http_ok(std::string body, std::string_view content_type) {
    return make_http_response(200, std::move(body), content_type);
}

HttpResponse make_http_error(int status_code) {
    return make_http_response(status_code, std::string(reason_phrase(status_code)), "text/plain");
}

}  // namespace ferry
