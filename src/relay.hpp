#pragma once
#include "config.hpp"
#include "http.hpp"
#include "router.hpp"
#include "server/http_server.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hookrelay {

// Identity tag stamped into every forwarded payload as "server_type".
constexpr const char* kRelayIdentity = "cpp";

constexpr const char* kEmptyWebhookMessage = "Empty webhook received";

// Result of one forward attempt to the local server. error is empty on
// success and serialises as null.
struct DeliveryOutcome {
    bool success = false;
    std::optional<std::string> error;
    std::string target_url;

    nlohmann::json to_json() const;
};

// Receives signal webhooks, stamps them with receipt metadata and forwards
// them to the local server. Delivery failures are reported in the reply
// body; only processing errors before delivery turn into HTTP 500.
class WebhookRelay {
public:
    WebhookRelay(const Config& config, HttpClient& http);

    // GET /
    HttpReply handle_home(const HttpRequest& req) const;
    // POST /webhook
    HttpReply handle_webhook(const HttpRequest& req) const;
    // any /test
    HttpReply handle_test(const HttpRequest& req) const;
    // GET /status
    HttpReply handle_status(const HttpRequest& req) const;

    // Register the four routes above on `router`. The relay must outlive it.
    void install(Router& router) const;

    // Forward an enriched payload to <internal endpoint>/internal-webhook.
    DeliveryOutcome deliver(const nlohmann::json& enriched, uint64_t now_ms) const;

    // x-forwarded-for verbatim when non-empty, else the connection's peer address.
    static std::string client_ip(const HttpRequest& req);

    static std::string user_agent(const HttpRequest& req);

    // Decode the request body according to its Content-Type. Returns null for
    // an empty body. Throws nlohmann::json::parse_error on malformed JSON.
    static nlohmann::json decode_body(const HttpRequest& req);

    // Placeholder substitution for absent/empty bodies; throws
    // std::runtime_error for anything that is not a JSON object.
    static nlohmann::json normalize_payload(nlohmann::json payload);

    // Add heroku_received_at, heroku_timestamp, client_ip and server_type.
    static nlohmann::json enrich(nlohmann::json payload,
                                 const std::string& client_ip,
                                 uint64_t now_ms);

    // Base URL with the first ":8081" replaced by ":3000". Plain string
    // substitution: a URL without ":8081" comes back unchanged.
    static std::string internal_endpoint(const std::string& base_url);

    static nlohmann::json test_payload(uint64_t now_ms);

private:
    const Config& config_;
    HttpClient& http_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace hookrelay
