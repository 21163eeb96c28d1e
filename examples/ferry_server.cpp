// ferry_server: HTTP/1.1 (optionally HTTPS) server with a small demo route table.
//   ./ferry_server -p 8080
//   ./ferry_server -p 8443 --cert cert.pem --key key.pem
//   ./ferry_server -d ./public --auth-file users.txt
// Routes: GET /, GET /hello[?name=...], GET|DELETE /users/:id, POST /echo. With -d, every
// other path is served from the directory.

#include "ferry/basic_auth.hpp"
#include "ferry/config.hpp"
#include "ferry/file_handler.hpp"
#include "ferry/http_server.hpp"
#include "ferry/log.hpp"
#include "ferry/router.hpp"
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

using namespace ferry;

namespace {

constexpr std::string_view index_html =
    "<!DOCTYPE html>\n"
    "<html><head><title>ferry</title></head>\n"
    "<body><h1>ferry</h1>\n"
    "<ul>\n"
    "<li><a href=\"/hello\">/hello</a></li>\n"
    "<li><a href=\"/users/42\">/users/:id</a></li>\n"
    "<li>POST /echo</li>\n"
    "</ul></body>\n"
    "</html>";

std::atomic<HttpServer*> g_server{nullptr};

void on_signal(int) {
    if (HttpServer* server = g_server.load()) server->stop();
}

/// Points the signal handler at a server for the guard's lifetime.
class SignalTarget {
public:
    explicit SignalTarget(HttpServer& server) { g_server.store(&server); }
    ~SignalTarget() { g_server.store(nullptr); }

    SignalTarget(const SignalTarget&) = delete;
    SignalTarget& operator=(const SignalTarget&) = delete;
};

std::shared_ptr<const Router> demo_routes(const ServerConfig& config) {
    auto router = std::make_shared<Router>();
    if (config.root_dir.empty()) {
        router->get("/", [](const HttpRequest&) {
            return make_http_ok(std::string(index_html), "text/html; charset=utf-8");
        });
    }
    router->get("/hello", [](const HttpRequest& req) {
        std::string_view name = req.query_param("name");
        return make_http_ok("Hello, " + std::string(name.empty() ? "world" : name) + "!\n");
    });
    router->add("/users/{id:[0-9]+}", make_method_set({HttpMethod::Get, HttpMethod::Delete}), [](const HttpRequest& req) {
        if (req.method == HttpMethod::Delete) return make_http_response(204);
        return make_http_ok("{\"id\":" + std::string(req.path_param("id")) + "}\n", "application/json");
    });
    router->post("/echo", [](const HttpRequest& req) {
        std::string_view type = req.header("Content-Type");
        return make_http_ok(req.body, type.empty() ? "application/octet-stream" : type);
    });
    if (!config.root_dir.empty()) {
        FileHandler files(config.root_dir);
        HttpHandler handler = files;
        if (!config.auth_file.empty()) {
            BasicAuth auth = BasicAuth::from_file(config.auth_file);
            log_info("ferry_server") << auth.size() << " users loaded from " << config.auth_file;
            handler = auth.protect(std::move(handler));
        }
        router->add("/*", files.methods(), std::move(handler));
        log_info("ferry_server") << "serving files from " << files.root().string();
    }
    return router;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    auto parsed = parse_server_args(args);
    if (!parsed.ok) {
        std::cerr << "ferry_server: " << parsed.error << "\n" << server_usage(argv[0]);
        return 2;
    }
    if (parsed.config.show_help) {
        std::cout << server_usage(argv[0]);
        return 0;
    }

    set_log_level(parsed.config.log_level);
    if (!parsed.config.log_file.empty() && !set_log_file(parsed.config.log_file)) {
        std::cerr << "ferry_server: cannot open log file " << parsed.config.log_file << "\n";
        return 1;
    }

    try {
        HttpServer server(parsed.config.server, demo_routes(parsed.config));
        SignalTarget target(server);
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        server.run();
    } catch (const std::exception& e) {
        log_error("ferry_server") << e.what();
        return 1;
    }
    return 0;
}
