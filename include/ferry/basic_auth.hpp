#pragma once

#include "ferry/router.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ferry {

/// Decodes padded standard base64; nullopt on malformed input.
std::optional<std::string> base64_decode(std::string_view text);

/// HTTP Basic authentication against a fixed user table.
class BasicAuth {
public:
    explicit BasicAuth(std::string realm = "ferry") : realm_(std::move(realm)) {}

    /// Reads one "user password" pair per line; blank lines and lines starting with '#'
    /// are skipped. Throws std::runtime_error if the file cannot be read or a line has
    /// no password.
    static BasicAuth from_file(const std::string& path, std::string realm = "ferry");

    void add_user(std::string user, std::string password);

    /// Restricts access to the listed users. With none listed, every known user passes.
    void require_user(std::string user);

    /// True if \a authorization ("Basic <base64 user:password>") names an accepted user
    /// with the right password. User and password are percent-decoded.
    bool check(std::string_view authorization) const;

    /// Runs \a handler only for authorized requests; others get 401 with a
    /// WWW-Authenticate challenge.
    HttpHandler protect(HttpHandler handler) const;

    std::size_t size() const { return users_.size(); }
    const std::string& realm() const { return realm_; }

private:
    std::string realm_;
    std::unordered_map<std::string, std::string> users_;
    std::vector<std::string> required_;
};

}  // namespace ferry
