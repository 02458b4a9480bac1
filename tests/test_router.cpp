#include <catch2/catch.hpp>
#include "router.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace hookrelay;

static HttpRequest make_request(const std::string& method, const std::string& path) {
    HttpRequest req;
    req.method = method;
    req.path = path;
    req.remote_addr = "127.0.0.1";
    return req;
}

static std::string header_value(const HttpReply& reply, const std::string& name) {
    for (const auto& h : reply.headers)
        if (h.first == name) return h.second;
    return "";
}

static Router make_router() {
    Router router;
    router.add("GET", "/", [](const HttpRequest&) { return json_reply(200, {{"route", "home"}}); });
    router.add("POST", "/webhook", [](const HttpRequest&) { return json_reply(200, {{"route", "webhook"}}); });
    router.add("*", "/test", [](const HttpRequest& r) { return json_reply(200, {{"route", "test"}, {"method", r.method}}); });
    router.add("GET", "/boom", [](const HttpRequest&) -> HttpReply { throw std::runtime_error("kaboom"); });
    return router;
}

// ── normalize_path ───────────────────────────────────────────────

TEST_CASE("Router::normalize_path: trailing slash and case", "[router]") {
    REQUIRE(Router::normalize_path("/") == "/");
    REQUIRE(Router::normalize_path("") == "/");
    REQUIRE(Router::normalize_path("/webhook/") == "/webhook");
    REQUIRE(Router::normalize_path("/WebHook") == "/webhook");
}

// ── dispatch ─────────────────────────────────────────────────────

TEST_CASE("Router: dispatches by method and path", "[router]") {
    auto router = make_router();
    auto reply = router.dispatch(make_request("POST", "/webhook"));
    REQUIRE(reply.status == 200);
    REQUIRE(nlohmann::json::parse(reply.body)["route"] == "webhook");
}

TEST_CASE("Router: trailing slash and case still match", "[router]") {
    auto router = make_router();
    auto reply = router.dispatch(make_request("POST", "/Webhook/"));
    REQUIRE(reply.status == 200);
    REQUIRE(nlohmann::json::parse(reply.body)["route"] == "webhook");
}

TEST_CASE("Router: wildcard method route accepts GET and POST", "[router]") {
    auto router = make_router();
    auto get = router.dispatch(make_request("GET", "/test"));
    auto post = router.dispatch(make_request("POST", "/test"));
    REQUIRE(get.status == 200);
    REQUIRE(post.status == 200);
    REQUIRE(nlohmann::json::parse(post.body)["method"] == "POST");
}

TEST_CASE("Router: HEAD is served by GET routes only", "[router]") {
    auto router = make_router();
    auto home = router.dispatch(make_request("HEAD", "/"));
    REQUIRE(home.status == 200);
    REQUIRE(nlohmann::json::parse(home.body)["route"] == "home");
    REQUIRE(router.dispatch(make_request("HEAD", "/webhook")).status == 404);
}

TEST_CASE("Router: unknown path returns fixed 404 body", "[router]") {
    auto router = make_router();
    auto reply = router.dispatch(make_request("GET", "/nope"));
    REQUIRE(reply.status == 404);
    auto j = nlohmann::json::parse(reply.body);
    REQUIRE(j["error"] == "Endpoint not found");
    REQUIRE(j["message"] == "Available endpoints: /, /webhook, /test, /status");
}

TEST_CASE("Router: known path with wrong method returns 404", "[router]") {
    auto router = make_router();
    REQUIRE(router.dispatch(make_request("GET", "/webhook")).status == 404);
    REQUIRE(router.dispatch(make_request("DELETE", "/")).status == 404);
}

TEST_CASE("Router: throwing handler returns generic 500", "[router]") {
    auto router = make_router();
    auto reply = router.dispatch(make_request("GET", "/boom"));
    REQUIRE(reply.status == 500);
    auto j = nlohmann::json::parse(reply.body);
    REQUIRE(j["error"] == "Internal server error");
    REQUIRE(j["message"] == "Something went wrong on the server");
}

// ── CORS ─────────────────────────────────────────────────────────

TEST_CASE("Router: every reply allows any origin", "[router]") {
    auto router = make_router();
    REQUIRE(header_value(router.dispatch(make_request("GET", "/")), "Access-Control-Allow-Origin") == "*");
    REQUIRE(header_value(router.dispatch(make_request("GET", "/nope")), "Access-Control-Allow-Origin") == "*");
    REQUIRE(header_value(router.dispatch(make_request("GET", "/boom")), "Access-Control-Allow-Origin") == "*");
}

TEST_CASE("Router: OPTIONS preflight returns 204 with CORS headers", "[router]") {
    auto router = make_router();
    auto req = make_request("OPTIONS", "/webhook");
    req.headers["access-control-request-headers"] = "content-type,x-custom";
    auto reply = router.dispatch(req);
    REQUIRE(reply.status == 204);
    REQUIRE(reply.body.empty());
    REQUIRE(header_value(reply, "Access-Control-Allow-Methods") == "GET,HEAD,PUT,PATCH,POST,DELETE");
    REQUIRE(header_value(reply, "Access-Control-Allow-Headers") == "content-type,x-custom");
    REQUIRE(header_value(reply, "Access-Control-Allow-Origin") == "*");
}

TEST_CASE("Router: OPTIONS preflight on unknown path still answers", "[router]") {
    auto router = make_router();
    auto reply = router.dispatch(make_request("OPTIONS", "/anything"));
    REQUIRE(reply.status == 204);
    REQUIRE(header_value(reply, "Access-Control-Allow-Headers") == "Content-Type");
}

// ── json_reply ───────────────────────────────────────────────────

TEST_CASE("json_reply: sets status and JSON content type", "[router]") {
    auto reply = json_reply(201, {{"a", 1}});
    REQUIRE(reply.status == 201);
    REQUIRE(reply.content_type.find("application/json") == 0);
    REQUIRE(reply.body == R"({"a":1})");
}

TEST_CASE("dump_json: invalid UTF-8 does not throw", "[router]") {
    nlohmann::json j = {{"raw", std::string("\xff\xfe", 2)}};
    REQUIRE_NOTHROW(dump_json(j));
}
