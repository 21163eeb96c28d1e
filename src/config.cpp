#include "ferry/config.hpp"
#include <charconv>
#include <optional>

namespace ferry {

namespace {

template <typename T>
bool parse_number(std::string_view s, T& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool parse_millis(std::string_view s, std::chrono::milliseconds& out) {
    long long ms = 0;
    if (!parse_number(s, ms) || ms < 0) return false;
    out = std::chrono::milliseconds(ms);
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

/// Walks an argument list; value() consumes the argument after the current option.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string_view>& args) : args_(args) {}

    bool done() const { return index_ >= args_.size(); }
    std::string_view next() { return args_[index_++]; }
    std::optional<std::string_view> value() {
        if (done()) return std::nullopt;
        return args_[index_++];
    }

private:
    const std::vector<std::string_view>& args_;
    std::size_t index_{0};
};

template <typename Config>
ArgsResult<Config> args_error(std::string message) {
    ArgsResult<Config> result;
    result.error = std::move(message);
    return result;
}

std::string missing_value(std::string_view option) { return "missing or invalid value for " + std::string(option); }

}  // namespace

ArgsResult<ServerConfig> parse_server_args(const std::vector<std::string_view>& args) {
    ArgsResult<ServerConfig> result;
    ServerConfig& conf = result.config;
    HttpServerOptions& opts = conf.server;
    ArgCursor cursor(args);

    while (!cursor.done()) {
        std::string_view arg = cursor.next();
        if (arg == "-h" || arg == "--help") {
            conf.show_help = true;
            continue;
        }
        if (arg == "--no-access-log") {
            opts.connection.access_log = false;
            continue;
        }
        auto value = cursor.value();
        if (!value) return args_error<ServerConfig>(missing_value(arg));
        bool valid = true;
        if (arg == "-a" || arg == "--address") {
            opts.host = std::string(*value);
        } else if (arg == "-p" || arg == "--port") {
            valid = parse_number(*value, opts.port);
        } else if (arg == "-n" || arg == "--workers") {
            valid = parse_number(*value, opts.pool.workers) && opts.pool.workers > 0;
        } else if (arg == "-q" || arg == "--queue") {
            valid = parse_number(*value, opts.pool.queue_capacity) && opts.pool.queue_capacity > 0;
        } else if (arg == "--submit-timeout") {
            valid = parse_millis(*value, opts.pool.submit_timeout);
        } else if (arg == "-t" || arg == "--read-timeout") {
            valid = parse_millis(*value, opts.connection.read_timeout);
        } else if (arg == "--max-header-bytes") {
            valid = parse_number(*value, opts.connection.limits.max_header_bytes) &&
                    opts.connection.limits.max_header_bytes > 0;
        } else if (arg == "--max-line") {
            valid = parse_number(*value, opts.connection.limits.max_start_line) &&
                    opts.connection.limits.max_start_line > 0;
        } else if (arg == "--max-body-bytes") {
            valid = parse_number(*value, opts.connection.limits.max_body_bytes);
        } else if (arg == "-r" || arg == "--keep-alive-requests") {
            valid = parse_number(*value, opts.connection.max_keep_alive_requests);
        } else if (arg == "--cert") {
            opts.cert_file = std::string(*value);
        } else if (arg == "--key") {
            opts.key_file = std::string(*value);
        } else if (arg == "--overload") {
            if (*value == "503") {
                opts.overload = OverloadPolicy::ServiceUnavailable;
            } else if (*value == "drop") {
                opts.overload = OverloadPolicy::Drop;
            } else {
                valid = false;
            }
        } else if (arg == "--log-level") {
            auto level = parse_log_level(*value);
            valid = level.has_value();
            if (level) conf.log_level = *level;
        } else if (arg == "-l" || arg == "--log") {
            conf.log_file = std::string(*value);
        } else if (arg == "-d" || arg == "--dir") {
            conf.root_dir = std::string(*value);
        } else if (arg == "--auth-file") {
            conf.auth_file = std::string(*value);
        } else {
            return args_error<ServerConfig>("unknown argument: " + std::string(arg));
        }
        if (!valid) return args_error<ServerConfig>(missing_value(arg));
    }

    if (opts.cert_file.empty() != opts.key_file.empty()) {
        return args_error<ServerConfig>("--cert and --key must be given together");
    }
    if (!conf.auth_file.empty() && conf.root_dir.empty()) {
        return args_error<ServerConfig>("--auth-file needs --dir");
    }
    result.ok = true;
    return result;
}

ArgsResult<ClientConfig> parse_client_args(const std::vector<std::string_view>& args) {
    ArgsResult<ClientConfig> result;
    ClientConfig& conf = result.config;
    ArgCursor cursor(args);
    bool method_set = false;

    while (!cursor.done()) {
        std::string_view arg = cursor.next();
        if (arg == "-h" || arg == "--help") {
            conf.show_help = true;
            continue;
        }
        if (arg == "-k" || arg == "--insecure") {
            conf.client.verify_peer = false;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            conf.log_level = LogLevel::Debug;
            continue;
        }
        if (arg.empty() || arg.front() != '-') {
            if (!conf.url.empty()) return args_error<ClientConfig>("more than one URL given");
            conf.url = std::string(arg);
            continue;
        }
        auto value = cursor.value();
        if (!value) return args_error<ClientConfig>(missing_value(arg));
        if (arg == "-X" || arg == "--request") {
            auto method = parse_http_method(*value);
            if (!method) return args_error<ClientConfig>("unsupported method: " + std::string(*value));
            conf.method = *method;
            method_set = true;
        } else if (arg == "-H" || arg == "--header") {
            std::size_t colon = value->find(':');
            std::string_view name = colon == std::string_view::npos ? std::string_view() : trim(value->substr(0, colon));
            if (name.empty()) return args_error<ClientConfig>("header must look like 'Name: value'");
            conf.headers.add(std::string(name), std::string(trim(value->substr(colon + 1))));
        } else if (arg == "-d" || arg == "--data") {
            conf.body = std::string(*value);
            conf.has_body = true;
        } else if (arg == "-t" || arg == "--timeout") {
            if (!parse_millis(*value, conf.client.read_timeout)) return args_error<ClientConfig>(missing_value(arg));
            conf.client.connect_timeout = conf.client.read_timeout;
        } else {
            return args_error<ClientConfig>("unknown argument: " + std::string(arg));
        }
    }

    if (conf.has_body && !method_set) conf.method = HttpMethod::Post;
    if (conf.url.empty() && !conf.show_help) return args_error<ClientConfig>("no URL given");
    result.ok = true;
    return result;
}

std::string server_usage(std::string_view program) {
    std::string out = "Usage: " + std::string(program) + " [options]\n";
    out +=
        "  -a, --address <ipv4>          bind address (default 0.0.0.0)\n"
        "  -p, --port <n>                listen port (default 8080)\n"
        "  -n, --workers <n>             worker threads (default 4)\n"
        "  -q, --queue <n>               pending connection queue (default 64)\n"
        "      --submit-timeout <ms>     wait for a queue slot before rejecting (default 100)\n"
        "  -t, --read-timeout <ms>       idle and read timeout (default 5000)\n"
        "      --max-header-bytes <n>    header section limit (default 65536)\n"
        "      --max-line <n>            request line limit (default 8192)\n"
        "      --max-body-bytes <n>      body limit (default 8388608)\n"
        "  -r, --keep-alive-requests <n> requests per connection, 0 = unlimited (default 0)\n"
        "      --cert <pem> --key <pem>  serve HTTPS\n"
        "      --overload <503|drop>     reply 503 or drop when saturated (default 503)\n"
        "      --log-level <level>       debug, info, warn, error or off (default info)\n"
        "  -l, --log <file>              append log to file\n"
        "      --no-access-log           no per-request access log lines\n"
        "  -d, --dir <path>              serve files from path (GET, HEAD, POST, DELETE)\n"
        "      --auth-file <file>        require Basic auth for files; 'user password' per line\n"
        "  -h, --help                    show this help\n";
    return out;
}

std::string client_usage(std::string_view program) {
    std::string out = "Usage: " + std::string(program) + " [options] <url>\n";
    out +=
        "  -X, --request <method>     request method (default GET, POST with -d)\n"
        "  -H, --header 'Name: value' add a request header (repeatable)\n"
        "  -d, --data <body>          request body\n"
        "  -k, --insecure             skip TLS certificate verification\n"
        "  -t, --timeout <ms>         connect and read timeout (default 10000)\n"
        "  -v, --verbose              debug logging\n"
        "  -h, --help                 show this help\n";
    return out;
}

}  // namespace ferry
