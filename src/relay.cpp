#include "relay.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace hookrelay {

nlohmann::json DeliveryOutcome::to_json() const {
    return {
        {"success", success},
        {"error", error ? nlohmann::json(*error) : nlohmann::json(nullptr)},
        {"target_url", target_url}
    };
}

WebhookRelay::WebhookRelay(const Config& config, HttpClient& http)
    : config_(config)
    , http_(http)
    , started_(std::chrono::steady_clock::now())
{}

void WebhookRelay::install(Router& router) const {
    router.add("GET",  "/",        [this](const HttpRequest& r) { return handle_home(r); });
    router.add("POST", "/webhook", [this](const HttpRequest& r) { return handle_webhook(r); });
    router.add("*",    "/test",    [this](const HttpRequest& r) { return handle_test(r); });
    router.add("GET",  "/status",  [this](const HttpRequest& r) { return handle_status(r); });
}

// ── Request inspection ────────────────────────────────────────

std::string WebhookRelay::client_ip(const HttpRequest& req) {
    std::string forwarded = req.header("x-forwarded-for");
    return forwarded.empty() ? req.remote_addr : forwarded;
}

std::string WebhookRelay::user_agent(const HttpRequest& req) {
    std::string ua = req.header("user-agent");
    return ua.empty() ? "Unknown" : ua;
}

nlohmann::json WebhookRelay::decode_body(const HttpRequest& req) {
    if (trim(req.body).empty()) return nullptr;

    std::string content_type = to_lower(req.header("content-type"));
    if (content_type.find("application/json") != std::string::npos)
        return nlohmann::json::parse(req.body);

    if (content_type.find("application/x-www-form-urlencoded") != std::string::npos) {
        nlohmann::json form = nlohmann::json::object();
        for (const auto& [key, value] : parse_form_urlencoded(req.body))
            form[key] = value;
        return form;
    }

    // TradingView sends alert text as text/plain; it may or may not be JSON.
    if (nlohmann::json::accept(req.body))
        return nlohmann::json::parse(req.body);
    return {{"message", req.body}};
}

nlohmann::json WebhookRelay::normalize_payload(nlohmann::json payload) {
    if (payload.is_null() ||
        ((payload.is_object() || payload.is_array()) && payload.empty()))
        return {{"message", kEmptyWebhookMessage}};
    if (!payload.is_object())
        throw std::runtime_error(std::string("webhook payload must be a JSON object, got ") +
                                 payload.type_name());
    return payload;
}

nlohmann::json WebhookRelay::enrich(nlohmann::json payload,
                                    const std::string& client_ip,
                                    uint64_t now_ms) {
    payload["heroku_received_at"] = now_ms;
    payload["heroku_timestamp"]   = format_iso8601(now_ms);
    payload["client_ip"]          = client_ip;
    payload["server_type"]        = kRelayIdentity;
    return payload;
}

std::string WebhookRelay::internal_endpoint(const std::string& base_url) {
    return replace_first(base_url, ":8081", ":3000");
}

nlohmann::json WebhookRelay::test_payload(uint64_t now_ms) {
    return {
        {"symbol", "BTCUSDT"},
        {"action", "buy"},
        {"price", 45000},
        {"strategy", "test_strategy"},
        {"timestamp", now_ms},
        {"test", true},
        {"source", "relay_test"}
    };
}

// ── Delivery ──────────────────────────────────────────────────

DeliveryOutcome WebhookRelay::deliver(const nlohmann::json& enriched, uint64_t now_ms) const {
    DeliveryOutcome outcome;
    outcome.target_url = config_.local_server_url;

    std::string url = internal_endpoint(config_.local_server_url) + "/internal-webhook";
    nlohmann::json envelope = {
        {"type", "webhook_signal"},
        {"data", enriched},
        {"source", "heroku"},
        {"received_at", now_ms}
    };

    auto resp = http_.post(url, dump_json(envelope),
                           {{"Content-Type", "application/json"}},
                           config_.forward_timeout);

    if (resp.status_code == 200) {
        outcome.success = true;
        std::cerr << "[relay] Delivered to local server: " << resp.status_code << "\n";
    } else if (resp.status_code != 0) {
        outcome.error = "local server responded with status " + std::to_string(resp.status_code);
        std::cerr << "[relay] Warning: " << *outcome.error << "\n";
    } else {
        outcome.error = "local server connection failed: " + resp.error;
        std::cerr << "[relay] Error: " << *outcome.error << "\n";
    }
    return outcome;
}

// ── Handlers ──────────────────────────────────────────────────

HttpReply WebhookRelay::handle_home(const HttpRequest& /*req*/) const {
    return json_reply(200, {
        {"status", "Webhook relay running"},
        {"timestamp", timestamp_now()},
        {"local_server", config_.local_server_url},
        {"message", "Ready to receive TradingView webhooks"}
    });
}

HttpReply WebhookRelay::handle_webhook(const HttpRequest& req) const {
    try {
        std::string ip = client_ip(req);
        std::cerr << "[relay] Webhook received - IP: " << ip
                  << ", User-Agent: " << user_agent(req) << "\n";

        nlohmann::json payload = normalize_payload(decode_body(req));
        uint64_t received_at = epoch_millis();
        payload = enrich(std::move(payload), ip, received_at);
        std::cerr << "[relay] Webhook data: " << dump_json(payload, 2) << "\n";

        DeliveryOutcome outcome = deliver(payload, epoch_millis());

        return json_reply(200, {
            {"success", true},
            {"message", "webhook received"},
            {"timestamp", epoch_millis()},
            {"data_received", payload},
            {"local_delivery", outcome.to_json()}
        });
    } catch (const std::exception& e) {
        std::cerr << "[relay] Error processing webhook: " << e.what() << "\n";
        return json_reply(500, {
            {"success", false},
            {"error", e.what()},
            {"message", "error processing webhook"}
        });
    }
}

HttpReply WebhookRelay::handle_test(const HttpRequest& /*req*/) const {
    nlohmann::json data = test_payload(epoch_millis());
    std::string url = config_.local_server_url + "/webhook";

    auto resp = http_.post(url, dump_json(data),
                           {{"Content-Type", "application/json"}},
                           config_.forward_timeout);

    if (resp.ok()) {
        std::cerr << "[relay] Test webhook sent to " << url << ": " << resp.status_code << "\n";
        return json_reply(200, {
            {"success", true},
            {"message", "test webhook sent"},
            {"test_data", data},
            {"local_response", resp.status_code}
        });
    }

    std::string error = resp.status_code != 0
        ? "request failed with status code " + std::to_string(resp.status_code)
        : resp.error;
    std::cerr << "[relay] Test webhook to " << url << " failed: " << error << "\n";
    return json_reply(200, {
        {"success", false},
        {"error", error},
        {"message", "test webhook failed"},
        {"test_data", data}
    });
}

HttpReply WebhookRelay::handle_status(const HttpRequest& /*req*/) const {
    std::chrono::duration<double> uptime = std::chrono::steady_clock::now() - started_;
    return json_reply(200, {
        {"server", "hookrelay"},
        {"status", "running"},
        {"local_server_url", config_.local_server_url},
        {"endpoints", {
            {"webhook", "/webhook (POST)"},
            {"test", "/test (POST/GET)"},
            {"status", "/status (GET)"}
        }},
        {"timestamp", epoch_millis()},
        {"environment", config_.environment},
        {"uptime", uptime.count()}
    });
}

} // namespace hookrelay
