#include "ferry/http_client.hpp"
#include "ferry/log.hpp"
#include "ferry/tcp_socket.hpp"
#include <memory>

namespace ferry {

namespace {

HttpClientResult failure(std::string error) {
    HttpClientResult result;
    result.error = std::move(error);
    return result;
}

std::string host_header(const Url& url) {
    std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    const std::uint16_t default_port = url.is_tls() ? 443 : 80;
    if (url.port != default_port) host += ":" + std::to_string(url.port);
    return host;
}

}  // namespace

HttpClientResult HttpClient::send(const Url& url, HttpRequest request) {
    if (request.target.empty()) request.target = url.target;
    if (!request.headers.contains("Host")) request.headers.add("Host", host_header(url));
    if (!request.headers.contains("Accept")) request.headers.add("Accept", "*/*");
    if (!request.headers.contains("User-Agent")) request.headers.add("User-Agent", options_.user_agent);
    if (!request.headers.contains("Connection")) request.headers.add("Connection", "close");
    if (!frame_request(request)) return failure("request declares both Content-Length and chunked");

    std::error_code ec;
    TcpSocket socket = connect_tcp(url.host, url.port, options_.connect_timeout, ec);
    if (ec || !socket.is_open()) {
        return failure("connect to " + url.host + ":" + std::to_string(url.port) + " failed: " + ec.message());
    }
    socket.set_read_timeout(options_.read_timeout);
    socket.set_write_timeout(options_.read_timeout);

    std::unique_ptr<ByteStream> stream;
    if (url.is_tls()) {
        if (!tls_) {
            tls_ = make_tls_client_context(options_.verify_peer);
            if (!tls_) return failure("TLS context: " + tls_error_string());
        }
        TlsSocket tls = wrap_tls(std::move(socket), tls_, TlsRole::Client, url.host, ec);
        if (ec) return failure("TLS setup: " + ec.message());
        stream = std::make_unique<TlsSocket>(std::move(tls));
    } else {
        stream = std::make_unique<TcpSocket>(std::move(socket));
    }
    if (auto hs = stream->handshake()) return failure("TLS handshake: " + hs.message());

    log_debug("http_client") << to_string(request.method) << ' ' << url.host << ':' << url.port << request.target;
    if (auto wr = encode_request(request, *stream)) return failure("write failed: " + wr.message());

    ReadBuffer buffer;
    HttpResponseParseResult parsed =
        decode_response(*stream, buffer, options_.limits, request.method == HttpMethod::Head);
    stream->shutdown();
    if (!parsed.ok) {
        std::string error = "bad response: " + std::string(to_string(parsed.error));
        if (!parsed.detail.empty()) error += " (" + parsed.detail + ")";
        return failure(std::move(error));
    }
    HttpClientResult result;
    result.ok = true;
    result.response = std::move(parsed.response);
    return result;
}

HttpClientResult HttpClient::fetch(std::string_view url, HttpMethod method, std::string body, HttpHeaders headers) {
    auto parsed = parse_url(url);
    if (!parsed) return failure("invalid URL: " + std::string(url));
    HttpRequest request;
    request.method = method;
    request.headers = std::move(headers);
    request.body = std::move(body);
    return send(*parsed, std::move(request));
}

}  // namespace ferry
