#pragma once
#include "server/http_server.hpp"

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookrelay {

// Method + path dispatch table in front of the route handlers. Also owns the
// cross-cutting concerns every response shares: request logging, CORS
// headers, OPTIONS preflight, the 404 fallback and the 500 fallback for
// handlers that throw.
class Router {
public:
    using RouteHandler = std::function<HttpReply(const HttpRequest&)>;

    // method "*" matches any method
    void add(const std::string& method, const std::string& path, RouteHandler handler);

    HttpReply dispatch(const HttpRequest& req) const;

    // Lowercase, strip one trailing slash (except for "/").
    static std::string normalize_path(const std::string& path);

private:
    struct Route {
        std::string method;
        std::string path;
        RouteHandler handler;
    };

    const Route* match(const std::string& method, const std::string& path) const;

    std::vector<Route> routes_;
};

// Serialize `body` as the JSON reply. Invalid UTF-8 in strings is replaced
// rather than raising.
HttpReply json_reply(int status, const nlohmann::json& body);

// Dump with the same invalid-UTF-8 policy as json_reply.
std::string dump_json(const nlohmann::json& j, int indent = -1);

HttpReply not_found_reply();
HttpReply internal_error_reply();

} // namespace hookrelay
