#pragma once

#include "ferry/http_message.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

/// Decodes %XX escapes. With \a plus_as_space (query strings) '+' becomes ' '.
/// Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space = false);

/// Encodes everything outside the RFC 3986 unreserved set.
std::string percent_encode(std::string_view in);

/// Splits a raw path ("/a/b%2Fc") into decoded segments ({"a", "b/c"}). The leading
/// slash is skipped; a trailing slash yields a final empty segment.
std::optional<std::vector<std::string>> split_path_segments(std::string_view raw_path);

/// Splits "k=v&k2=v2" into decoded pairs; a key without '=' maps to "".
std::optional<Params> parse_query(std::string_view query);

/// Absolute http(s) URL as consumed by the client.
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    std::uint16_t port{80};
    std::string target{"/"};  // path + optional query, still encoded

    bool is_tls() const { return scheme == "https"; }
};

std::optional<Url> parse_url(std::string_view url);

}  // namespace ferry
