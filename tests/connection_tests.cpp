// Connection supervisor tests over in-memory streams: keep-alive, pipelining, error
// responses, HEAD, request caps and shutdown. Exit 0 iff all pass.

#include "ferry/byte_stream.hpp"
#include "ferry/connection.hpp"
#include "ferry/log.hpp"
#include "ferry/router.hpp"
#include "test_harness.hpp"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace ferry;
using namespace std::chrono_literals;

namespace {

// Lets the test keep the MemoryStream while the supervisor owns the ByteStream.
class BorrowedStream final : public ByteStream {
public:
    explicit BorrowedStream(MemoryStream& inner, bool fail_handshake = false)
        : inner_(inner), fail_handshake_(fail_handshake) {}

    IoResult read(void* buf, std::size_t len) override { return inner_.read(buf, len); }
    IoResult write(const void* buf, std::size_t len) override { return inner_.write(buf, len); }
    std::error_code handshake() override {
        if (fail_handshake_) return std::make_error_code(std::errc::protocol_error);
        return {};
    }
    void set_read_timeout(std::chrono::milliseconds) override {}
    void shutdown() override { inner_.shutdown(); }

private:
    MemoryStream& inner_;
    bool fail_handshake_;
};

std::shared_ptr<const Router> test_routes() {
    auto router = std::make_shared<Router>();
    router->get("/users/:id", [](const HttpRequest& req) {
        return make_http_response(200, std::string(req.path_param("id")));
    });
    router->post("/echo", [](const HttpRequest& req) { return make_http_response(200, req.body); });
    router->get("/boom", [](const HttpRequest&) -> HttpResponse { throw std::runtime_error("handler failed"); });
    router->get("/s", [](const HttpRequest&) {
        HttpResponse resp = make_http_response(200);
        resp.producer = [](char*, std::size_t) -> std::size_t { throw std::runtime_error("producer failed"); };
        return resp;
    });
    router->get("/both", [](const HttpRequest&) {
        HttpResponse resp = make_http_response(200, "x");
        resp.headers.add("Content-Length", "1");
        resp.headers.add("Transfer-Encoding", "chunked");
        return resp;
    });
    return router;
}

struct Outcome {
    std::string output;
    std::size_t served{0};
    bool shut_down{false};
};

Outcome serve(std::string input, ConnectionOptions options = {}, const std::atomic<bool>* stopping = nullptr,
              bool fail_handshake = false) {
    MemoryStream memory(std::move(input));
    ConnectionSupervisor supervisor(std::make_unique<BorrowedStream>(memory, fail_handshake), test_routes(), options,
                                    stopping, "test");
    supervisor.run();
    ASSERT(supervisor.state() == ConnectionState::Closed);
    return {memory.output(), supervisor.requests_served(), memory.is_shut_down()};
}

std::size_t count_of(const std::string& haystack, std::string_view needle) {
    std::size_t n = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

void test_end_to_end_bytes() {
    auto out = serve("GET /users/42 HTTP/1.1\r\nHost: x\r\n\r\n");
    ASSERT_EQ(out.output, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n42");
    ASSERT_EQ(out.served, 1u);
    ASSERT(out.shut_down);
}

void test_pipelined_keep_alive() {
    auto out = serve("GET /users/1 HTTP/1.1\r\n\r\n"
                     "POST /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"
                     "GET /users/2 HTTP/1.1\r\nConnection: close\r\n\r\n"
                     "GET /users/3 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(out.served, 3u);
    ASSERT_EQ(out.output,
              "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\n1"
              "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello"
              "HTTP/1.1 200 OK\r\nContent-Length: 1\r\nConnection: close\r\n\r\n2");
}

void test_routing_errors_keep_connection() {
    auto out = serve("GET /nowhere HTTP/1.1\r\n\r\n"
                     "DELETE /echo HTTP/1.1\r\n\r\n"
                     "GET /boom HTTP/1.1\r\n\r\n"
                     "GET /users/9 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(out.served, 4u);
    ASSERT(out.output.find("HTTP/1.1 404 Not Found\r\n") == 0);
    ASSERT(out.output.find("HTTP/1.1 405 Method Not Allowed\r\n") != std::string::npos);
    ASSERT(out.output.find("Allow: POST\r\n") != std::string::npos);
    ASSERT(out.output.find("HTTP/1.1 500 Internal Server Error\r\n") != std::string::npos);
    ASSERT(out.output.find("\r\n\r\n9") != std::string::npos);
    ASSERT_EQ(count_of(out.output, "Connection: close"), 0u);
}

void test_malformed_request_closes() {
    auto out = serve("GET /users/1 HTTP/1.1\r\nBad Header\r\n\r\nGET /users/2 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(out.served, 0u);
    ASSERT(out.output.find("HTTP/1.1 400 Bad Request\r\n") == 0);
    ASSERT(out.output.find("Connection: close\r\n") != std::string::npos);
    ASSERT_EQ(count_of(out.output, "HTTP/1.1 "), 1u);
}

void test_parse_error_statuses() {
    ASSERT(serve("BREW / HTTP/1.1\r\n\r\n").output.find("HTTP/1.1 501 ") == 0);
    ASSERT(serve("GET / HTTP/3.0\r\n\r\n").output.find("HTTP/1.1 505 ") == 0);
    ConnectionOptions small;
    small.limits.max_body_bytes = 3;
    ASSERT(serve("POST /echo HTTP/1.1\r\nContent-Length: 10\r\n\r\n0123456789", small).output.find("HTTP/1.1 413 ") ==
           0);
    small.limits.max_header_bytes = 16;
    ASSERT(serve("GET / HTTP/1.1\r\nX-Long: 0123456789abcdef\r\n\r\n", small).output.find("HTTP/1.1 431 ") == 0);
}

void test_truncated_request_gets_no_response() {
    auto out = serve("POST /echo HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
    ASSERT(out.output.empty());
    ASSERT(out.shut_down);
}

void test_head_has_no_body() {
    auto out = serve("HEAD /users/abc HTTP/1.1\r\n\r\n");
    ASSERT_EQ(out.output, "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\n");
}

void test_chunked_upload() {
    auto out = serve("POST /echo HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
    ASSERT_EQ(out.output, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nabcde");
}

void test_keep_alive_request_cap() {
    ConnectionOptions options;
    options.max_keep_alive_requests = 2;
    auto out = serve("GET /users/1 HTTP/1.1\r\n\r\nGET /users/2 HTTP/1.1\r\n\r\nGET /users/3 HTTP/1.1\r\n\r\n", options);
    ASSERT_EQ(out.served, 2u);
    ASSERT_EQ(count_of(out.output, "HTTP/1.1 200"), 2u);
    ASSERT(out.output.find("Connection: close\r\n\r\n2") != std::string::npos);
}

void test_http10_closes_unless_keep_alive() {
    auto closed = serve("GET /users/1 HTTP/1.0\r\n\r\nGET /users/2 HTTP/1.0\r\n\r\n");
    ASSERT_EQ(closed.served, 1u);
    ASSERT(closed.output.find("Connection: close") != std::string::npos);

    auto kept = serve("GET /users/1 HTTP/1.0\r\nConnection: keep-alive\r\n\r\nGET /users/2 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(kept.served, 2u);
    ASSERT(kept.output.find("Connection: keep-alive\r\n") != std::string::npos);
}

void test_conflicting_handler_framing_becomes_500() {
    auto out = serve("GET /both HTTP/1.1\r\n\r\n");
    ASSERT(out.output.find("HTTP/1.1 500 ") == 0);
    ASSERT_EQ(count_of(out.output, "Transfer-Encoding"), 0u);
}

void test_throwing_body_producer_closes() {
    auto out = serve("GET /s HTTP/1.1\r\n\r\nGET /users/2 HTTP/1.1\r\n\r\n");
    ASSERT_EQ(out.served, 1u);
    ASSERT(out.output.find("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n") == 0);
    ASSERT_EQ(count_of(out.output, "0\r\n\r\n"), 0u);
    ASSERT_EQ(count_of(out.output, "HTTP/1.1 "), 1u);
    ASSERT(out.shut_down);
}

void test_handshake_failure_closes_silently() {
    auto out = serve("GET /users/1 HTTP/1.1\r\n\r\n", {}, nullptr, true);
    ASSERT(out.output.empty());
    ASSERT_EQ(out.served, 0u);
    ASSERT(out.shut_down);
}

void test_stopping_closes_idle_connection() {
    std::atomic<bool> stopping{true};
    auto out = serve("GET /users/1 HTTP/1.1\r\n\r\n", {}, &stopping);
    ASSERT(out.output.empty());
    ASSERT_EQ(out.served, 0u);
}

void test_access_log_line_per_exchange() {
    auto path = std::filesystem::temp_directory_path() / ("ferry_access_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);
    ASSERT(set_log_file(path.string()));
    set_log_level(LogLevel::Info);
    serve("GET /users/5 HTTP/1.1\r\n\r\nGET /nowhere?x=1 HTTP/1.1\r\n\r\n");
    ConnectionOptions quiet;
    quiet.access_log = false;
    serve("GET /users/6 HTTP/1.1\r\n\r\n", quiet);
    set_log_level(LogLevel::Off);

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    const std::string log = text.str();
    ASSERT(log.find("[INFO] access: test GET /users/5 200 OK\n") != std::string::npos);
    ASSERT(log.find("[INFO] access: test GET /nowhere?x=1 404 Not Found\n") != std::string::npos);
    ASSERT(log.find("/users/6") == std::string::npos);
    ASSERT_EQ(count_of(log, "access: "), 2u);
    std::filesystem::remove(path);
}

void test_state_names() {
    ASSERT_EQ(to_string(ConnectionState::Handshaking), "handshaking");
    ASSERT_EQ(to_string(ConnectionState::Dispatched), "dispatched");
    ASSERT_EQ(to_string(ConnectionState::Closed), "closed");
}

}  // namespace

int main() {
    std::cout << "ferry connection tests\n";
    set_log_level(LogLevel::Off);
    RUN_TEST("end-to-end exact bytes", test_end_to_end_bytes());
    RUN_TEST("pipelined keep-alive", test_pipelined_keep_alive());
    RUN_TEST("routing errors keep the connection", test_routing_errors_keep_connection());
    RUN_TEST("malformed request closes", test_malformed_request_closes());
    RUN_TEST("parse error statuses", test_parse_error_statuses());
    RUN_TEST("truncated request gets no response", test_truncated_request_gets_no_response());
    RUN_TEST("HEAD has no body", test_head_has_no_body());
    RUN_TEST("chunked upload", test_chunked_upload());
    RUN_TEST("keep-alive request cap", test_keep_alive_request_cap());
    RUN_TEST("HTTP/1.0 keep-alive", test_http10_closes_unless_keep_alive());
    RUN_TEST("conflicting handler framing", test_conflicting_handler_framing_becomes_500());
    RUN_TEST("throwing body producer closes", test_throwing_body_producer_closes());
    RUN_TEST("handshake failure", test_handshake_failure_closes_silently());
    RUN_TEST("stopping closes idle connection", test_stopping_closes_idle_connection());
    RUN_TEST("access log line per exchange", test_access_log_line_per_exchange());
    RUN_TEST("state names", test_state_names());
    std::cout << "All tests passed.\n";
    return 0;
}
