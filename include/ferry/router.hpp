#pragma once

#include "ferry/http_message.hpp"
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

/// Handler invoked for a matched request. Exceptions escaping it become 500 responses.
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Bitmap of accepted methods; 0 accepts any method.
using MethodSet = std::uint16_t;

constexpr MethodSet method_bit(HttpMethod method) {
    return static_cast<MethodSet>(1U << static_cast<unsigned>(method));
}

MethodSet make_method_set(std::initializer_list<HttpMethod> methods);

/// Methods of \a set, GET and HEAD first.
std::vector<HttpMethod> methods_of(MethodSet set);

/// "GET, HEAD, POST" for the Allow header.
std::string format_allow(const std::vector<HttpMethod>& methods);

/// Compiled path pattern.
///
/// Segment syntax: literal text, `:name` or `{name}` (one non-empty segment),
/// `{name:regex}` (one segment matching regex), and a terminal `*` or `*name`
/// (the rest of the path, possibly empty). Captures see percent-decoded segments.
class RoutePattern {
public:
    /// Throws std::invalid_argument on a malformed pattern.
    static RoutePattern compile(std::string_view pattern);

    /// Whole-path regular expression matched against the decoded path. Group i binds
    /// to names[i - 1], or to its number if no name is given.
    static RoutePattern regex(std::string_view expression, std::vector<std::string> group_names = {});

    bool match(const std::vector<std::string>& segments, const std::string& decoded_path, Params& params) const;

    const std::string& text() const { return text_; }

private:
    enum class SegmentKind : std::uint8_t {
        Literal,
        Capture,
        Constrained,
        Wildcard,
    };

    struct Segment {
        SegmentKind kind{SegmentKind::Literal};
        std::string text;  // literal text or capture name
        std::optional<std::regex> constraint;
    };

    RoutePattern() = default;

    std::string text_;
    std::vector<Segment> segments_;
    std::optional<std::regex> whole_;
    std::vector<std::string> group_names_;
};

enum class RouteStatus : std::uint8_t {
    Matched,
    NoMatch,
    MethodNotAllowed,
};

struct RouteMatch {
    RouteStatus status{RouteStatus::NoMatch};
    const HttpHandler* handler{nullptr};
    Params params;
    /// Union of methods accepted for the path (MethodNotAllowed only).
    std::vector<HttpMethod> allowed;
};

/// Ordered route table. Built before the server starts, then shared read-only.
class Router {
public:
    Router& add(std::string_view pattern, MethodSet methods, HttpHandler handler);
    Router& add(RoutePattern pattern, MethodSet methods, HttpHandler handler);

    Router& get(std::string_view pattern, HttpHandler handler) {
        return add(pattern, method_bit(HttpMethod::Get), std::move(handler));
    }
    Router& post(std::string_view pattern, HttpHandler handler) {
        return add(pattern, method_bit(HttpMethod::Post), std::move(handler));
    }
    Router& put(std::string_view pattern, HttpHandler handler) {
        return add(pattern, method_bit(HttpMethod::Put), std::move(handler));
    }
    Router& del(std::string_view pattern, HttpHandler handler) {
        return add(pattern, method_bit(HttpMethod::Delete), std::move(handler));
    }
    Router& any(std::string_view pattern, HttpHandler handler) { return add(pattern, 0, std::move(handler)); }

    /// First route (registration order) matching the path and accepting the method.
    /// HEAD is accepted by routes that accept GET.
    RouteMatch resolve(HttpMethod method, std::string_view raw_path) const;

    std::size_t size() const { return routes_.size(); }

private:
    struct Route {
        RoutePattern pattern;
        MethodSet methods;
        HttpHandler handler;
    };

    std::vector<Route> routes_;
};

}  // namespace ferry
