// ferry_client: minimal HTTP/1.1 client.
//   ./ferry_client http://localhost:8080/hello
//   ./ferry_client -k -X POST -H 'Content-Type: text/plain' -d hi https://localhost:8443/echo

#include "ferry/config.hpp"
#include "ferry/http_client.hpp"
#include "ferry/log.hpp"
#include <csignal>
#include <iostream>
#include <string_view>
#include <vector>

using namespace ferry;

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);
    auto parsed = parse_client_args(args);
    if (!parsed.ok) {
        std::cerr << "ferry_client: " << parsed.error << "\n" << client_usage(argv[0]);
        return 2;
    }
    ClientConfig& conf = parsed.config;
    if (conf.show_help) {
        std::cout << client_usage(argv[0]);
        return 0;
    }
    set_log_level(conf.log_level);
    std::signal(SIGPIPE, SIG_IGN);

    HttpClient client(conf.client);
    HttpClientResult result = client.fetch(conf.url, conf.method, std::move(conf.body), std::move(conf.headers));
    if (!result.ok) {
        std::cerr << "ferry_client: " << result.error << "\n";
        return 1;
    }
    const HttpResponse& resp = result.response;
    std::cout << "HTTP/" << resp.version.major << '.' << resp.version.minor << ' ' << resp.status_code << ' '
              << (resp.status_phrase.empty() ? reason_phrase(resp.status_code) : std::string_view(resp.status_phrase))
              << "\n";
    std::cout << resp.body;
    if (!resp.body.empty() && resp.body.back() != '\n') std::cout << "\n";
    return 0;
}
