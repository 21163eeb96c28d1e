#include "ferry/basic_auth.hpp"
#include "ferry/log.hpp"
#include "ferry/url.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ferry {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // namespace

std::optional<std::string> base64_decode(std::string_view text) {
    if (text.empty()) return std::string();
    if (text.size() % 4 != 0) return std::nullopt;
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text[text.size() - 2] == '=') {
        if (padding == 0) return std::nullopt;
        ++padding;
    }
    if (!std::ranges::all_of(text.substr(0, text.size() - padding), is_base64_char)) return std::nullopt;

    // EVP_DecodeBlock emits 3 bytes per quantum, padding included.
    std::string out(text.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) return std::nullopt;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

BasicAuth BasicAuth::from_file(const std::string& path, std::string realm) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open auth file " + path);
    BasicAuth auth(std::move(realm));
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::istringstream fields(line);
        std::string user;
        std::string password;
        if (!(fields >> user) || user.front() == '#') continue;
        if (!(fields >> password)) throw std::runtime_error(path + ":" + std::to_string(line_no) + ": missing password");
        auth.add_user(std::move(user), std::move(password));
    }
    if (in.bad()) throw std::runtime_error("cannot read auth file " + path);
    return auth;
}

void BasicAuth::add_user(std::string user, std::string password) { users_[std::move(user)] = std::move(password); }

void BasicAuth::require_user(std::string user) { required_.push_back(std::move(user)); }

bool BasicAuth::check(std::string_view authorization) const {
    authorization = trim(authorization);
    std::size_t sp = authorization.find(' ');
    if (sp == std::string_view::npos || !iequal(authorization.substr(0, sp), "Basic")) return false;
    auto decoded = base64_decode(trim(authorization.substr(sp + 1)));
    if (!decoded) return false;
    std::size_t colon = decoded->find(':');
    if (colon == std::string::npos) return false;
    auto user = percent_decode(std::string_view(*decoded).substr(0, colon));
    auto password = percent_decode(std::string_view(*decoded).substr(colon + 1));
    if (!user || !password) return false;

    if (!required_.empty() && std::ranges::find(required_, *user) == required_.end()) return false;
    auto it = users_.find(*user);
    if (it == users_.end() || it->second.size() != password->size()) return false;
    return CRYPTO_memcmp(it->second.data(), password->data(), password->size()) == 0;
}

HttpHandler BasicAuth::protect(HttpHandler handler) const {
    auto auth = std::make_shared<const BasicAuth>(*this);
    return [auth, handler = std::move(handler)](const HttpRequest& request) {
        std::string_view credentials = request.header("Authorization");
        if (!credentials.empty() && auth->check(credentials)) return handler(request);
        log_debug("auth") << (credentials.empty() ? "no" : "rejected") << " credentials for " << request.target;
        HttpResponse resp = make_http_error(401);
        resp.headers.add("WWW-Authenticate", "Basic realm=\"" + auth->realm() + "\"");
        return resp;
    };
}

}  // namespace ferry
