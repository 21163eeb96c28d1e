#include "ferry/url.hpp"
#include <charconv>

namespace ferry {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
           c == '.' || c == '_' || c == '~';
}

}  // namespace

std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string percent_encode(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        auto uc = static_cast<unsigned char>(c);
        if (is_unreserved(uc)) {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[uc >> 4]);
            out.push_back(kHex[uc & 0x0F]);
        }
    }
    return out;
}

std::optional<std::vector<std::string>> split_path_segments(std::string_view raw_path) {
    std::vector<std::string> segments;
    if (!raw_path.empty() && raw_path.front() == '/') raw_path.remove_prefix(1);
    if (raw_path.empty()) return segments;
    for (;;) {
        std::size_t slash = raw_path.find('/');
        auto decoded = percent_decode(raw_path.substr(0, slash));
        if (!decoded) return std::nullopt;
        segments.push_back(std::move(*decoded));
        if (slash == std::string_view::npos) break;
        raw_path.remove_prefix(slash + 1);
    }
    return segments;
}

std::optional<Params> parse_query(std::string_view query) {
    Params params;
    while (!query.empty()) {
        std::size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            auto key = percent_decode(pair.substr(0, eq), true);
            auto value = eq == std::string_view::npos ? std::optional<std::string>(std::string())
                                                      : percent_decode(pair.substr(eq + 1), true);
            if (!key || !value) return std::nullopt;
            params.emplace_back(std::move(*key), std::move(*value));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return params;
}

std::optional<Url> parse_url(std::string_view url) {
    Url out;
    std::size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;
    std::string_view scheme = url.substr(0, scheme_end);
    if (iequal(scheme, "http")) {
        out.scheme = "http";
        out.port = 80;
    } else if (iequal(scheme, "https")) {
        out.scheme = "https";
        out.port = 443;
    } else {
        return std::nullopt;
    }
    std::string_view rest = url.substr(scheme_end + 3);
    std::size_t target_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, target_start);
    if (target_start != std::string_view::npos) {
        std::string_view target = rest.substr(target_start);
        out.target = target.front() == '?' ? "/" + std::string(target) : std::string(target);
    }
    std::size_t hash = out.target.find('#');
    if (hash != std::string::npos) out.target.erase(hash);

    std::string_view host = authority;
    if (!authority.empty() && authority.front() == '[') {
        std::size_t close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        authority.remove_prefix(close + 1);
        if (!authority.empty() && authority.front() != ':') return std::nullopt;
    } else {
        std::size_t colon = authority.find(':');
        host = authority.substr(0, colon);
        authority = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
    }
    if (!authority.empty()) {
        std::string_view port = authority.substr(1);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 || value > 65535)
            return std::nullopt;
        out.port = static_cast<std::uint16_t>(value);
    }
    if (host.empty()) return std::nullopt;
    out.host = std::string(host);
    return out;
}

}  // namespace ferry
