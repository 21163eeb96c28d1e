// Functional tests for ferry: a real HttpServer on loopback driven by raw sockets and
// by HttpClient, plain and TLS. Exit 0 iff all pass.

#include "ferry/http_client.hpp"
#include "ferry/http_codec.hpp"
#include "ferry/http_server.hpp"
#include "ferry/log.hpp"
#include "ferry/router.hpp"
#include "ferry/tcp_socket.hpp"
#include "ferry/tls_socket.hpp"
#include "test_harness.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <unistd.h>

using namespace ferry;
using namespace std::chrono_literals;

namespace {

// Holds /slow requests until released.
struct SlowGate {
    std::atomic<int> entered{0};
    std::atomic<bool> released{false};
};

std::shared_ptr<const Router> test_routes(std::shared_ptr<SlowGate> gate = std::make_shared<SlowGate>()) {
    auto router = std::make_shared<Router>();
    router->get("/users/{id:[0-9]+}", [](const HttpRequest& req) {
        return make_http_response(200, std::string(req.path_param("id")));
    });
    router->post("/echo", [](const HttpRequest& req) { return make_http_response(200, req.body); });
    router->get("/boom", [](const HttpRequest&) -> HttpResponse { throw std::runtime_error("handler failed"); });
    router->get("/stream", [](const HttpRequest&) {
        auto left = std::make_shared<int>(3);
        HttpResponse resp = make_http_response(200, {}, "text/plain");
        resp.producer = [left](char* buf, std::size_t len) -> std::size_t {
            if (*left == 0 || len < 5) return 0;
            --*left;
            std::memcpy(buf, "part;", 5);
            return 5;
        };
        return resp;
    });
    router->get("/slow", [gate](const HttpRequest&) {
        gate->entered.fetch_add(1);
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!gate->released.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        return make_http_ok("slow");
    });
    return router;
}

HttpServerOptions local_options() {
    HttpServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.connection.read_timeout = 2000ms;
    return options;
}

// Runs an HttpServer on its own thread for the lifetime of the object.
class TestServer {
public:
    explicit TestServer(HttpServerOptions options = local_options(), std::shared_ptr<const Router> router = test_routes())
        : server_(std::move(options), std::move(router)), thread_([this] { serve(); }) {}

    ~TestServer() { stop(); }

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    std::uint16_t port() const { return server_.port(); }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    bool stopped() const { return finished_.load(); }
    const std::string& failure() const { return failure_; }

private:
    void serve() {
        try {
            server_.run();
        } catch (const std::exception& e) {
            failure_ = e.what();
        }
        finished_.store(true);
    }

    HttpServer server_;
    std::string failure_;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

TcpSocket connect_local(std::uint16_t port) {
    std::error_code ec;
    TcpSocket socket = connect_tcp("127.0.0.1", port, 2000ms, ec);
    ASSERT_MSG(!ec && socket.is_open(), "connect failed: " + ec.message());
    socket.set_read_timeout(3000ms);
    return socket;
}

void send_raw(ByteStream& stream, std::string_view data) { ASSERT(write_all(stream, data).ok()); }

// Reads until \a n bytes arrived; fails on timeout or early close.
std::string read_exactly(ByteStream& stream, std::size_t n) {
    std::string out;
    char buf[1024];
    while (out.size() < n) {
        IoResult r = stream.read(buf, (std::min)(sizeof(buf), n - out.size()));
        ASSERT_MSG(r.ok(), "read ended after " + std::to_string(out.size()) + " bytes");
        out.append(buf, r.bytes);
    }
    return out;
}

// Reads until the peer closes; fails if it never does.
std::string read_until_close(ByteStream& stream) {
    std::string out;
    char buf[1024];
    for (;;) {
        IoResult r = stream.read(buf, sizeof(buf));
        if (r.ok()) {
            out.append(buf, r.bytes);
            continue;
        }
        ASSERT_MSG(r.status != IoStatus::Timeout, "peer did not close");
        return out;
    }
}

HttpResponse read_response(ByteStream& stream, ReadBuffer& buffer) {
    HttpResponseParseResult parsed = decode_response(stream, buffer);
    ASSERT_MSG(parsed.ok, "bad response: " + std::string(to_string(parsed.error)) + " " + parsed.detail);
    return std::move(parsed.response);
}

std::string url_of(const TestServer& server, std::string_view path, bool tls = false) {
    return std::string(tls ? "https" : "http") + "://127.0.0.1:" + std::to_string(server.port()) + std::string(path);
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

// Self-signed RSA certificate for CN=localhost, written as PEM files into a fresh directory.
class EphemeralCert {
public:
    EphemeralCert() {
        dir_ = std::filesystem::temp_directory_path() / ("ferry_tls_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);

        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr),
                                                                         &EVP_PKEY_CTX_free);
        ASSERT(kctx != nullptr);
        EVP_PKEY* raw_key = nullptr;
        ASSERT(EVP_PKEY_keygen_init(kctx.get()) == 1);
        ASSERT(EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) == 1);
        ASSERT(EVP_PKEY_keygen(kctx.get(), &raw_key) == 1);
        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw_key, &EVP_PKEY_free);

        std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
        ASSERT(cert != nullptr);
        X509_set_version(cert.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
        X509_set_pubkey(cert.get(), key.get());
        X509_NAME* name = X509_get_subject_name(cert.get());
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("ferry test"), -1,
                                   -1, 0);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1,
                                   -1, 0);
        X509_set_issuer_name(cert.get(), name);
        ASSERT(X509_sign(cert.get(), key.get(), EVP_sha256()) > 0);

        cert_file_ = (dir_ / "cert.pem").string();
        key_file_ = (dir_ / "key.pem").string();
        write_pem(cert_file_, [&](BIO* bio) { return PEM_write_bio_X509(bio, cert.get()); });
        write_pem(key_file_, [&](BIO* bio) {
            return PEM_write_bio_PrivateKey(bio, key.get(), nullptr, nullptr, 0, nullptr, nullptr);
        });
    }

    ~EphemeralCert() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    EphemeralCert(const EphemeralCert&) = delete;
    EphemeralCert& operator=(const EphemeralCert&) = delete;

    const std::string& cert_file() const { return cert_file_; }
    const std::string& key_file() const { return key_file_; }

private:
    template <typename Writer>
    static void write_pem(const std::string& path, Writer writer) {
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
        ASSERT(bio != nullptr);
        ASSERT(writer(bio.get()) == 1);
        char* data = nullptr;
        long len = BIO_get_mem_data(bio.get(), &data);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(data, len);
        ASSERT(out.good());
    }

    std::filesystem::path dir_;
    std::string cert_file_;
    std::string key_file_;
};

// --- Plaintext exchanges ---

void test_exact_response_bytes_and_keep_alive() {
    TestServer server;
    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "GET /users/42 HTTP/1.1\r\nHost: x\r\n\r\n");
    const std::string expected = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n42";
    ASSERT_EQ(read_exactly(socket, expected.size()), expected);

    // Same connection, now asking to close.
    send_raw(socket, "GET /users/7 HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(read_until_close(socket), "HTTP/1.1 200 OK\r\nContent-Length: 1\r\nConnection: close\r\n\r\n7");
}

void test_pipelined_requests() {
    TestServer server;
    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "GET /users/1 HTTP/1.1\r\n\r\nPOST /echo HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc"
                     "GET /users/2 HTTP/1.1\r\nConnection: close\r\n\r\n");
    ReadBuffer buffer;
    ASSERT_EQ(read_response(socket, buffer).body, "1");
    ASSERT_EQ(read_response(socket, buffer).body, "abc");
    HttpResponse last = read_response(socket, buffer);
    ASSERT_EQ(last.body, "2");
    ASSERT(last.headers.has_token("Connection", "close"));
}

void test_error_statuses() {
    TestServer server;
    HttpClient client;

    auto missing = client.fetch(url_of(server, "/nowhere"));
    ASSERT_MSG(missing.ok, missing.error);
    ASSERT_EQ(missing.response.status_code, 404);

    auto non_numeric = client.fetch(url_of(server, "/users/abc"));
    ASSERT_EQ(non_numeric.response.status_code, 404);

    auto wrong_method = client.fetch(url_of(server, "/echo"), HttpMethod::Put, "x");
    ASSERT_EQ(wrong_method.response.status_code, 405);
    ASSERT_EQ(wrong_method.response.header("Allow"), "POST");

    auto boom = client.fetch(url_of(server, "/boom"));
    ASSERT_EQ(boom.response.status_code, 500);

    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "GET /users/1 HTTP/1.1\r\nno colon here\r\n\r\n");
    std::string reply = read_until_close(socket);
    ASSERT(reply.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
    ASSERT(reply.find("Connection: close\r\n") != std::string::npos);
}

void test_chunked_upload_and_streamed_response() {
    TestServer server;
    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "POST /echo HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                     "4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\nX-Trailer: t\r\n\r\n");
    ReadBuffer buffer;
    HttpResponse echoed = read_response(socket, buffer);
    ASSERT_EQ(echoed.status_code, 200);
    ASSERT_EQ(echoed.body, "Wikipedia");

    HttpClient client;
    auto streamed = client.fetch(url_of(server, "/stream"));
    ASSERT_MSG(streamed.ok, streamed.error);
    ASSERT(streamed.response.framing == BodyFraming::Chunked);
    ASSERT_EQ(streamed.response.body, "part;part;part;");
}

void test_head_request() {
    TestServer server;
    HttpClient client;
    auto head = client.fetch(url_of(server, "/users/12345"), HttpMethod::Head);
    ASSERT_MSG(head.ok, head.error);
    ASSERT_EQ(head.response.status_code, 200);
    ASSERT_EQ(head.response.header("Content-Length"), "5");
    ASSERT(head.response.body.empty());
}

void test_client_round_trip() {
    TestServer server;
    HttpClient client;
    HttpHeaders headers{{"Content-Type", "application/json"}};
    auto result = client.fetch(url_of(server, "/echo"), HttpMethod::Post, R"({"k":1})", headers);
    ASSERT_MSG(result.ok, result.error);
    ASSERT_EQ(result.response.status_code, 200);
    ASSERT_EQ(result.response.body, R"({"k":1})");
    ASSERT(result.response.headers.has_token("Connection", "close"));

    auto refused = HttpClient().fetch("http://127.0.0.1:1/");
    ASSERT(!refused.ok);
    ASSERT(!refused.error.empty());
    ASSERT(!HttpClient().fetch("not a url").ok);
}

// --- Admission and shutdown ---

void test_saturated_pool_answers_503() {
    auto gate = std::make_shared<SlowGate>();
    HttpServerOptions options = local_options();
    options.pool.workers = 1;
    options.pool.queue_capacity = 1;
    options.pool.submit_timeout = 50ms;
    TestServer server(options, test_routes(gate));

    TcpSocket busy = connect_local(server.port());
    send_raw(busy, "GET /slow HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT(wait_until([&] { return gate->entered.load() == 1; }));

    TcpSocket queued = connect_local(server.port());
    send_raw(queued, "GET /users/5 HTTP/1.1\r\nConnection: close\r\n\r\n");
    std::this_thread::sleep_for(100ms);

    TcpSocket rejected = connect_local(server.port());
    send_raw(rejected, "GET /users/6 HTTP/1.1\r\n\r\n");
    std::string reply = read_until_close(rejected);
    ASSERT(reply.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0) == 0);
    ASSERT(reply.find("Connection: close\r\n") != std::string::npos);

    gate->released.store(true);
    ReadBuffer busy_buffer;
    ASSERT_EQ(read_response(busy, busy_buffer).body, "slow");
    ReadBuffer queued_buffer;
    ASSERT_EQ(read_response(queued, queued_buffer).body, "5");
}

void test_drop_policy_closes_without_reply() {
    auto gate = std::make_shared<SlowGate>();
    HttpServerOptions options = local_options();
    options.pool.workers = 1;
    options.pool.queue_capacity = 1;
    options.pool.submit_timeout = 20ms;
    options.overload = OverloadPolicy::Drop;
    TestServer server(options, test_routes(gate));

    TcpSocket busy = connect_local(server.port());
    send_raw(busy, "GET /slow HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT(wait_until([&] { return gate->entered.load() == 1; }));
    TcpSocket queued = connect_local(server.port());
    std::this_thread::sleep_for(100ms);

    TcpSocket dropped = connect_local(server.port());
    ASSERT(read_until_close(dropped).empty());
    gate->released.store(true);
}

void test_stop_closes_idle_keep_alive() {
    TestServer server;
    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "GET /users/3 HTTP/1.1\r\n\r\n");
    ReadBuffer buffer;
    ASSERT_EQ(read_response(socket, buffer).body, "3");

    auto before = std::chrono::steady_clock::now();
    server.stop();
    ASSERT(server.stopped());
    ASSERT(server.failure().empty());
    ASSERT(std::chrono::steady_clock::now() - before < 1500ms);
    ASSERT(read_until_close(socket).empty());
}

void test_server_setup_errors() {
    bool threw = false;
    try {
        HttpServer server(local_options(), nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT(threw);

    HttpServerOptions only_cert = local_options();
    only_cert.cert_file = "cert.pem";
    threw = false;
    try {
        HttpServer server(only_cert, test_routes());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    HttpServerOptions missing_files = local_options();
    missing_files.cert_file = "/nonexistent/ferry/cert.pem";
    missing_files.key_file = "/nonexistent/ferry/key.pem";
    threw = false;
    try {
        HttpServer server(missing_files, test_routes());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    TestServer first;
    HttpServerOptions taken = local_options();
    taken.port = first.port();
    threw = false;
    try {
        HttpServer server(taken, test_routes());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);
}

// --- TLS ---

void test_tls_round_trip() {
    EphemeralCert cert;
    HttpServerOptions options = local_options();
    options.cert_file = cert.cert_file();
    options.key_file = cert.key_file();
    TestServer server(options);

    HttpClientOptions client_options;
    client_options.verify_peer = false;
    HttpClient client(client_options);
    auto result = client.fetch(url_of(server, "/users/77", true));
    ASSERT_MSG(result.ok, result.error);
    ASSERT_EQ(result.response.status_code, 200);
    ASSERT_EQ(result.response.body, "77");

    auto echoed = client.fetch(url_of(server, "/echo", true), HttpMethod::Post, "over tls");
    ASSERT_MSG(echoed.ok, echoed.error);
    ASSERT_EQ(echoed.response.body, "over tls");

    // Raw session: ALPN settles on http/1.1 and keep-alive works over TLS.
    TlsContext ctx = make_tls_client_context(false);
    ASSERT(static_cast<bool>(ctx));
    std::error_code ec;
    TlsSocket tls = wrap_tls(connect_local(server.port()), ctx, TlsRole::Client, "localhost", ec);
    ASSERT_MSG(!ec, ec.message());
    ASSERT_MSG(!tls.handshake(), "client handshake failed");
    ASSERT_EQ(tls.alpn_protocol(), "http/1.1");
    ReadBuffer buffer;
    send_raw(tls, "GET /users/1 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(read_response(tls, buffer).body, "1");
    send_raw(tls, "GET /users/2 HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(read_response(tls, buffer).body, "2");
    tls.shutdown();
}

void test_tls_rejects_plaintext_client() {
    EphemeralCert cert;
    HttpServerOptions options = local_options();
    options.cert_file = cert.cert_file();
    options.key_file = cert.key_file();
    TestServer server(options);

    TcpSocket socket = connect_local(server.port());
    send_raw(socket, "GET /users/1 HTTP/1.1\r\n\r\n");
    std::string reply = read_until_close(socket);
    ASSERT(reply.find("HTTP/1.1 200") == std::string::npos);

    HttpClientOptions verifying;
    verifying.verify_peer = true;
    auto untrusted = HttpClient(verifying).fetch(url_of(server, "/users/1", true));
    ASSERT(!untrusted.ok);
}

}  // namespace

int main() {
    std::cout << "ferry functional tests\n";
    set_log_level(LogLevel::Off);
    RUN_TEST("exact response bytes and keep-alive", test_exact_response_bytes_and_keep_alive());
    RUN_TEST("pipelined requests", test_pipelined_requests());
    RUN_TEST("error statuses", test_error_statuses());
    RUN_TEST("chunked upload and streamed response", test_chunked_upload_and_streamed_response());
    RUN_TEST("HEAD request", test_head_request());
    RUN_TEST("client round trip", test_client_round_trip());
    RUN_TEST("saturated pool answers 503", test_saturated_pool_answers_503());
    RUN_TEST("drop policy closes without reply", test_drop_policy_closes_without_reply());
    RUN_TEST("stop closes idle keep-alive", test_stop_closes_idle_keep_alive());
    RUN_TEST("server setup errors", test_server_setup_errors());
    RUN_TEST("TLS round trip", test_tls_round_trip());
    RUN_TEST("TLS rejects plaintext client", test_tls_rejects_plaintext_client());
    std::cout << "All tests passed.\n";
    return 0;
}
