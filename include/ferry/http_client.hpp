#pragma once

#include "ferry/http_codec.hpp"
#include "ferry/http_message.hpp"
#include "ferry/tls_socket.hpp"
#include "ferry/url.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace ferry {

struct HttpClientOptions {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{10000};
    /// Verify the server certificate against the system trust store (https only).
    bool verify_peer{true};
    CodecLimits limits;
    std::string user_agent{"ferry/0.1"};
};

struct HttpClientResult {
    bool ok{false};
    HttpResponse response;
    std::string error;
};

/// One-shot HTTP/1.1 client: one connection per request, closed afterwards.
/// Not thread-safe (the TLS context is created on first https use).
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {}) : options_(std::move(options)) {}

    /// Sends \a request to \a url. An empty request target is taken from the URL; Host,
    /// Accept, User-Agent and Connection: close are added unless already set.
    HttpClientResult send(const Url& url, HttpRequest request);

    HttpClientResult fetch(std::string_view url, HttpMethod method = HttpMethod::Get, std::string body = {},
                           HttpHeaders headers = {});

private:
    HttpClientOptions options_;
    TlsContext tls_;
};

}  // namespace ferry
