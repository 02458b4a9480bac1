#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace hookrelay {

struct Config {
    std::string local_server_url = "http://localhost:8081";
    std::string listen_host = "0.0.0.0";
    uint16_t port = 5000;
    std::string environment = "production";
    long forward_timeout = 10;   // seconds, total deadline per outbound call
    uint32_t max_body = 102400;  // inbound body limit in bytes

    // Defaults, then the JSON file at `path` (skipped when empty or missing),
    // then environment variables. Throws std::runtime_error on a malformed
    // file or an invalid value.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply the keys present in `j` on top of `cfg`.
    static void apply_json(Config& cfg, const nlohmann::json& j);

    // Apply LOCAL_SERVER_URL, HOST, PORT, RELAY_ENV / DYNO.
    static void apply_env(Config& cfg);

    // "host:port" for HttpServer
    std::string listen_addr() const;
};

// Parse a TCP port (1-65535). Throws std::runtime_error naming `what`.
uint16_t parse_port(const std::string& value, const std::string& what);

} // namespace hookrelay
