#include "router.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace hookrelay {

static const char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpReply json_reply(int status, const nlohmann::json& body) {
    HttpReply reply;
    reply.status = status;
    reply.content_type = "application/json; charset=utf-8";
    reply.body = dump_json(body);
    return reply;
}

HttpReply not_found_reply() {
    return json_reply(404, {
        {"error", "Endpoint not found"},
        {"message", "Available endpoints: /, /webhook, /test, /status"}
    });
}

HttpReply internal_error_reply() {
    return json_reply(500, {
        {"error", "Internal server error"},
        {"message", "Something went wrong on the server"}
    });
}

std::string Router::normalize_path(const std::string& path) {
    std::string p = to_lower(path);
    if (p.empty()) return "/";
    if (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

void Router::add(const std::string& method, const std::string& path, RouteHandler handler) {
    routes_.push_back({method, normalize_path(path), std::move(handler)});
}

const Router::Route* Router::match(const std::string& method, const std::string& path) const {
    for (const auto& r : routes_) {
        if (r.path != path) continue;
        if (r.method == "*" || r.method == method) return &r;
        if (method == "HEAD" && r.method == "GET") return &r;
    }
    return nullptr;
}

HttpReply Router::dispatch(const HttpRequest& req) const {
    std::cerr << "[" << timestamp_now() << "] " << req.method << " " << req.path
              << " - IP: " << req.remote_addr << "\n";

    HttpReply reply;
    if (req.method == "OPTIONS") {
        reply.status = 204;
        reply.content_type.clear();
        reply.headers.emplace_back("Access-Control-Allow-Methods", kAllowedMethods);
        std::string requested = req.header("access-control-request-headers");
        reply.headers.emplace_back("Access-Control-Allow-Headers",
                                   requested.empty() ? "Content-Type" : requested);
        reply.headers.emplace_back("Vary", "Access-Control-Request-Headers");
    } else if (const Route* route = match(req.method, normalize_path(req.path))) {
        try {
            reply = route->handler(req);
        } catch (const std::exception& e) {
            std::cerr << "[router] Server error on " << req.method << " " << req.path
                      << ": " << e.what() << "\n";
            reply = internal_error_reply();
        }
    } else {
        reply = not_found_reply();
    }

    reply.headers.emplace_back("Access-Control-Allow-Origin", "*");
    return reply;
}

} // namespace hookrelay
