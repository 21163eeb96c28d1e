#include "ferry/router.hpp"
#include "ferry/url.hpp"
#include <algorithm>
#include <stdexcept>

namespace ferry {

namespace {

constexpr HttpMethod kAllMethods[] = {
    HttpMethod::Get,     HttpMethod::Head,    HttpMethod::Post,  HttpMethod::Put,   HttpMethod::Delete,
    HttpMethod::Options, HttpMethod::Patch,   HttpMethod::Connect, HttpMethod::Trace,
};

bool is_name(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    });
}

std::regex compile_regex(std::string_view expression, std::string_view pattern) {
    try {
        return std::regex(expression.begin(), expression.end(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("route '" + std::string(pattern) + "': bad regex: " + e.what());
    }
}

[[noreturn]] void bad_pattern(std::string_view pattern, std::string_view why) {
    throw std::invalid_argument("route '" + std::string(pattern) + "': " + std::string(why));
}

bool accepts(MethodSet methods, HttpMethod method) {
    if (methods == 0) return true;
    if (methods & method_bit(method)) return true;
    return method == HttpMethod::Head && (methods & method_bit(HttpMethod::Get));
}

}  // namespace

MethodSet make_method_set(std::initializer_list<HttpMethod> methods) {
    MethodSet set = 0;
    for (HttpMethod m : methods) set |= method_bit(m);
    return set;
}

std::vector<HttpMethod> methods_of(MethodSet set) {
    std::vector<HttpMethod> out;
    for (HttpMethod m : kAllMethods) {
        if (set & method_bit(m)) out.push_back(m);
    }
    return out;
}

std::string format_allow(const std::vector<HttpMethod>& methods) {
    std::string out;
    for (HttpMethod m : methods) {
        if (!out.empty()) out += ", ";
        out += to_string(m);
    }
    return out;
}

// -----------------------------------------------------------------------------
// RoutePattern
// -----------------------------------------------------------------------------
RoutePattern RoutePattern::compile(std::string_view pattern) {
    if (pattern.empty() || pattern.front() != '/') bad_pattern(pattern, "must start with '/'");
    RoutePattern out;
    out.text_ = std::string(pattern);

    std::string_view rest = pattern.substr(1);
    if (rest.empty()) return out;

    for (;;) {
        std::size_t slash = rest.find('/');
        std::string_view seg = rest.substr(0, slash);
        const bool last = slash == std::string_view::npos;
        Segment s;
        if (seg.empty()) {
            if (!last) bad_pattern(pattern, "empty segment");
            // trailing slash: matches a path that also ends with '/'
        } else if (seg.front() == ':') {
            s.kind = SegmentKind::Capture;
            s.text = std::string(seg.substr(1));
            if (!is_name(s.text)) bad_pattern(pattern, "bad parameter name");
        } else if (seg.front() == '{') {
            if (seg.back() != '}') bad_pattern(pattern, "unterminated '{'");
            std::string_view inner = seg.substr(1, seg.size() - 2);
            std::size_t colon = inner.find(':');
            s.text = std::string(inner.substr(0, colon));
            if (!is_name(s.text)) bad_pattern(pattern, "bad parameter name");
            if (colon == std::string_view::npos) {
                s.kind = SegmentKind::Capture;
            } else {
                s.kind = SegmentKind::Constrained;
                std::string_view expr = inner.substr(colon + 1);
                if (expr.empty()) bad_pattern(pattern, "empty constraint");
                s.constraint = compile_regex(expr, pattern);
            }
        } else if (seg.front() == '*') {
            if (!last) bad_pattern(pattern, "wildcard must be the last segment");
            s.kind = SegmentKind::Wildcard;
            s.text = std::string(seg.substr(1));
            if (!s.text.empty() && !is_name(s.text)) bad_pattern(pattern, "bad wildcard name");
        } else {
            if (seg.find_first_of("{}*") != std::string_view::npos) bad_pattern(pattern, "stray special character");
            auto decoded = percent_decode(seg);
            if (!decoded) bad_pattern(pattern, "bad percent-encoding");
            s.text = std::move(*decoded);
        }
        if (s.kind != SegmentKind::Literal && !s.text.empty()) {
            bool duplicate = std::ranges::any_of(out.segments_, [&s](const Segment& other) {
                return other.kind != SegmentKind::Literal && other.text == s.text;
            });
            if (duplicate) bad_pattern(pattern, "duplicate parameter name");
        }
        out.segments_.push_back(std::move(s));
        if (last) break;
        rest.remove_prefix(slash + 1);
    }
    return out;
}

RoutePattern RoutePattern::regex(std::string_view expression, std::vector<std::string> group_names) {
    RoutePattern out;
    out.text_ = std::string(expression);
    out.whole_ = compile_regex(expression, expression);
    out.group_names_ = std::move(group_names);
    return out;
}

bool RoutePattern::match(const std::vector<std::string>& segments, const std::string& decoded_path,
                         Params& params) const {
    Params bound;
    if (whole_) {
        std::smatch m;
        if (!std::regex_match(decoded_path, m, *whole_)) return false;
        for (std::size_t i = 1; i < m.size(); ++i) {
            std::string name = i <= group_names_.size() ? group_names_[i - 1] : std::to_string(i);
            bound.emplace_back(std::move(name), m[i].str());
        }
        params = std::move(bound);
        return true;
    }

    std::size_t i = 0;
    for (const Segment& s : segments_) {
        if (s.kind == SegmentKind::Wildcard) {
            std::string tail;
            for (std::size_t j = i; j < segments.size(); ++j) {
                if (j > i) tail += '/';
                tail += segments[j];
            }
            if (!s.text.empty()) bound.emplace_back(s.text, std::move(tail));
            params = std::move(bound);
            return true;
        }
        if (i >= segments.size()) return false;
        const std::string& seg = segments[i++];
        switch (s.kind) {
            case SegmentKind::Literal:
                if (seg != s.text) return false;
                break;
            case SegmentKind::Capture:
                if (seg.empty()) return false;
                bound.emplace_back(s.text, seg);
                break;
            case SegmentKind::Constrained:
                if (!std::regex_match(seg, *s.constraint)) return false;
                bound.emplace_back(s.text, seg);
                break;
            case SegmentKind::Wildcard:
                break;
        }
    }
    if (i != segments.size()) return false;
    params = std::move(bound);
    return true;
}

// -----------------------------------------------------------------------------
// Router
// -----------------------------------------------------------------------------
Router& Router::add(std::string_view pattern, MethodSet methods, HttpHandler handler) {
    return add(RoutePattern::compile(pattern), methods, std::move(handler));
}

Router& Router::add(RoutePattern pattern, MethodSet methods, HttpHandler handler) {
    if (!handler) throw std::invalid_argument("route '" + pattern.text() + "': empty handler");
    routes_.push_back(Route{std::move(pattern), methods, std::move(handler)});
    return *this;
}

RouteMatch Router::resolve(HttpMethod method, std::string_view raw_path) const {
    RouteMatch result;
    auto segments = split_path_segments(raw_path);
    auto decoded = percent_decode(raw_path);
    if (!segments || !decoded) return result;

    MethodSet allowed = 0;
    bool path_matched = false;
    for (const Route& route : routes_) {
        Params params;
        if (!route.pattern.match(*segments, *decoded, params)) continue;
        if (accepts(route.methods, method)) {
            result.status = RouteStatus::Matched;
            result.handler = &route.handler;
            result.params = std::move(params);
            return result;
        }
        path_matched = true;
        allowed |= route.methods;
        if (route.methods & method_bit(HttpMethod::Get)) allowed |= method_bit(HttpMethod::Head);
    }
    if (path_matched) {
        result.status = RouteStatus::MethodNotAllowed;
        result.allowed = methods_of(allowed);
    }
    return result;
}

}  // namespace ferry
