#pragma once

#include "ferry/http_client.hpp"
#include "ferry/http_message.hpp"
#include "ferry/http_server.hpp"
#include "ferry/log.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

/// Command line of ferry_server.
struct ServerConfig {
    HttpServerOptions server;
    LogLevel log_level{LogLevel::Info};
    std::string log_file;
    /// Directory served as files; empty serves only the built-in routes.
    std::string root_dir;
    /// "user password" lines guarding the served files.
    std::string auth_file;
    bool show_help{false};
};

/// Command line of ferry_client.
struct ClientConfig {
    HttpMethod method{HttpMethod::Get};
    HttpHeaders headers;
    std::string body;
    bool has_body{false};
    HttpClientOptions client;
    std::string url;
    LogLevel log_level{LogLevel::Warn};
    bool show_help{false};
};

/// Result of argument parsing: either a config or a message for the user.
template <typename Config>
struct ArgsResult {
    bool ok{false};
    Config config;
    std::string error;
};

/// \a args excludes the program name.
ArgsResult<ServerConfig> parse_server_args(const std::vector<std::string_view>& args);
ArgsResult<ClientConfig> parse_client_args(const std::vector<std::string_view>& args);

std::string server_usage(std::string_view program);
std::string client_usage(std::string_view program);

}  // namespace ferry
