// Router tests: pattern compilation, matching precedence, method handling. Exit 0 iff all pass.

#include "ferry/router.hpp"
#include "test_harness.hpp"

#include <stdexcept>
#include <string>

using namespace ferry;

namespace {

HttpHandler reply(std::string tag) {
    return [tag](const HttpRequest&) { return make_http_ok(tag); };
}

std::string call(const RouteMatch& m) {
    HttpRequest req;
    return (*m.handler)(req).body;
}

std::string param(const RouteMatch& m, std::string_view name) {
    for (const auto& [k, v] : m.params) {
        if (k == name) return v;
    }
    return "<unbound>";
}

bool throws_invalid(std::string_view pattern) {
    try {
        Router r;
        r.get(pattern, reply("x"));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_literal_routes() {
    Router r;
    r.get("/", reply("root")).get("/a/b", reply("ab")).get("/a/", reply("a-slash"));
    auto root = r.resolve(HttpMethod::Get, "/");
    ASSERT(root.status == RouteStatus::Matched);
    ASSERT_EQ(call(root), "root");
    ASSERT_EQ(call(r.resolve(HttpMethod::Get, "/a/b")), "ab");
    ASSERT_EQ(call(r.resolve(HttpMethod::Get, "/a/")), "a-slash");
    ASSERT(r.resolve(HttpMethod::Get, "/a").status == RouteStatus::NoMatch);
    ASSERT(r.resolve(HttpMethod::Get, "/a/b/c").status == RouteStatus::NoMatch);
    ASSERT(r.resolve(HttpMethod::Get, "/A/b").status == RouteStatus::NoMatch);
    ASSERT_EQ(r.size(), 3u);
}

void test_captures() {
    Router r;
    r.get("/users/:id", reply("user"));
    r.get("/orgs/{org}/repos/{repo}", reply("repo"));
    auto user = r.resolve(HttpMethod::Get, "/users/42");
    ASSERT(user.status == RouteStatus::Matched);
    ASSERT_EQ(param(user, "id"), "42");
    auto repo = r.resolve(HttpMethod::Get, "/orgs/acme/repos/ferry");
    ASSERT_EQ(param(repo, "org"), "acme");
    ASSERT_EQ(param(repo, "repo"), "ferry");
    ASSERT(r.resolve(HttpMethod::Get, "/users/").status == RouteStatus::NoMatch);
    ASSERT(r.resolve(HttpMethod::Get, "/users").status == RouteStatus::NoMatch);
}

void test_percent_decoded_captures() {
    Router r;
    r.get("/files/:name", reply("file"));
    auto m = r.resolve(HttpMethod::Get, "/files/a%2Fb%20c");
    ASSERT(m.status == RouteStatus::Matched);
    ASSERT_EQ(param(m, "name"), "a/b c");
    ASSERT(r.resolve(HttpMethod::Get, "/files/%zz").status == RouteStatus::NoMatch);
}

void test_registration_order_wins() {
    Router r;
    r.get("/users/me", reply("me"));
    r.get("/users/:id", reply("by-id"));
    ASSERT_EQ(call(r.resolve(HttpMethod::Get, "/users/me")), "me");
    ASSERT_EQ(call(r.resolve(HttpMethod::Get, "/users/7")), "by-id");

    Router reversed;
    reversed.get("/users/:id", reply("by-id"));
    reversed.get("/users/me", reply("me"));
    ASSERT_EQ(call(reversed.resolve(HttpMethod::Get, "/users/me")), "by-id");
}

void test_method_not_allowed() {
    Router r;
    r.get("/items", reply("list"));
    r.post("/items", reply("create"));
    r.del("/items/:id", reply("delete"));
    ASSERT_EQ(call(r.resolve(HttpMethod::Post, "/items")), "create");

    auto m = r.resolve(HttpMethod::Put, "/items");
    ASSERT(m.status == RouteStatus::MethodNotAllowed);
    ASSERT(m.handler == nullptr);
    ASSERT_EQ(format_allow(m.allowed), "GET, HEAD, POST");

    auto d = r.resolve(HttpMethod::Get, "/items/3");
    ASSERT(d.status == RouteStatus::MethodNotAllowed);
    ASSERT_EQ(format_allow(d.allowed), "DELETE");
}

void test_head_uses_get_routes() {
    Router r;
    r.get("/page", reply("page"));
    auto m = r.resolve(HttpMethod::Head, "/page");
    ASSERT(m.status == RouteStatus::Matched);
    ASSERT_EQ(call(m), "page");
}

void test_any_method_and_sets() {
    Router r;
    r.add("/multi", make_method_set({HttpMethod::Put, HttpMethod::Patch}), reply("multi"));
    r.any("/any", reply("any"));
    r.put("/put", reply("put"));
    ASSERT(r.resolve(HttpMethod::Patch, "/multi").status == RouteStatus::Matched);
    ASSERT(r.resolve(HttpMethod::Get, "/multi").status == RouteStatus::MethodNotAllowed);
    ASSERT(r.resolve(HttpMethod::Options, "/any").status == RouteStatus::Matched);
    ASSERT(r.resolve(HttpMethod::Trace, "/any").status == RouteStatus::Matched);
    ASSERT_EQ(call(r.resolve(HttpMethod::Put, "/put")), "put");
    ASSERT_EQ(format_allow(r.resolve(HttpMethod::Post, "/put").allowed), "PUT");
}

void test_wildcard() {
    Router r;
    r.get("/static/*path", reply("static"));
    r.get("/anything/*", reply("anything"));
    auto deep = r.resolve(HttpMethod::Get, "/static/css/site.css");
    ASSERT(deep.status == RouteStatus::Matched);
    ASSERT_EQ(param(deep, "path"), "css/site.css");
    auto empty = r.resolve(HttpMethod::Get, "/static");
    ASSERT(empty.status == RouteStatus::Matched);
    ASSERT_EQ(param(empty, "path"), "");
    auto unnamed = r.resolve(HttpMethod::Get, "/anything/x/y");
    ASSERT(unnamed.status == RouteStatus::Matched);
    ASSERT(unnamed.params.empty());
}

void test_constrained_capture() {
    Router r;
    r.get("/users/{id:[0-9]+}", reply("numeric"));
    r.get("/users/{name}", reply("named"));
    auto num = r.resolve(HttpMethod::Get, "/users/123");
    ASSERT_EQ(call(num), "numeric");
    ASSERT_EQ(param(num, "id"), "123");
    auto named = r.resolve(HttpMethod::Get, "/users/bob");
    ASSERT_EQ(call(named), "named");
    ASSERT_EQ(param(named, "name"), "bob");
}

void test_regex_route() {
    Router r;
    r.add(RoutePattern::regex("/archive/([0-9]{4})/([0-9]{2})", {"year", "month"}), method_bit(HttpMethod::Get),
          reply("archive"));
    r.add(RoutePattern::regex("/v([0-9]+)/.*"), 0, reply("versioned"));
    auto m = r.resolve(HttpMethod::Get, "/archive/2024/05");
    ASSERT(m.status == RouteStatus::Matched);
    ASSERT_EQ(param(m, "year"), "2024");
    ASSERT_EQ(param(m, "month"), "05");
    ASSERT(r.resolve(HttpMethod::Get, "/archive/24/05").status == RouteStatus::NoMatch);
    auto v = r.resolve(HttpMethod::Delete, "/v2/things");
    ASSERT(v.status == RouteStatus::Matched);
    ASSERT_EQ(param(v, "1"), "2");
}

void test_invalid_patterns() {
    ASSERT(throws_invalid(""));
    ASSERT(throws_invalid("users"));
    ASSERT(throws_invalid("/a//b"));
    ASSERT(throws_invalid("/users/:"));
    ASSERT(throws_invalid("/users/{id"));
    ASSERT(throws_invalid("/users/{id:}"));
    ASSERT(throws_invalid("/users/{id:[0-9}"));
    ASSERT(throws_invalid("/*rest/more"));
    ASSERT(throws_invalid("/a/:id/b/:id"));
    ASSERT(throws_invalid("/a*b"));
    ASSERT(!throws_invalid("/a/:id/b/{other:[a-z]+}/*tail"));

    bool threw = false;
    try {
        RoutePattern::regex("([unclosed");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT(threw);
}

}  // namespace

int main() {
    std::cout << "ferry router tests\n";
    RUN_TEST("literal routes", test_literal_routes());
    RUN_TEST("captures", test_captures());
    RUN_TEST("percent-decoded captures", test_percent_decoded_captures());
    RUN_TEST("registration order wins", test_registration_order_wins());
    RUN_TEST("method not allowed", test_method_not_allowed());
    RUN_TEST("HEAD uses GET routes", test_head_uses_get_routes());
    RUN_TEST("any method and method sets", test_any_method_and_sets());
    RUN_TEST("wildcard", test_wildcard());
    RUN_TEST("constrained capture", test_constrained_capture());
    RUN_TEST("regex route", test_regex_route());
    RUN_TEST("invalid patterns", test_invalid_patterns());
    std::cout << "All tests passed.\n";
    return 0;
}
