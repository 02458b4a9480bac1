#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace hookrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"local_server_url", "http://localhost:8081"},
        {"listen_host", "0.0.0.0"},
        {"port", 5000},
        {"environment", "production"},
        {"forward_timeout", 10},
        {"max_body", 102400}
    };
}

uint16_t parse_port(const std::string& value, const std::string& what) {
    std::string v = trim(value);
    size_t consumed = 0;
    long p = 0;
    try {
        p = std::stol(v, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": '" + value + "'");
    }
    if (consumed != v.size() || p <= 0 || p > 65535)
        throw std::runtime_error("Invalid " + what + ": '" + value + "'");
    return static_cast<uint16_t>(p);
}

void Config::apply_json(Config& cfg, const nlohmann::json& j) {
    if (!j.is_object())
        throw std::runtime_error("config: top-level value must be an object");

    if (j.contains("local_server_url") && j["local_server_url"].is_string())
        cfg.local_server_url = j["local_server_url"].get<std::string>();
    if (j.contains("listen_host") && j["listen_host"].is_string())
        cfg.listen_host = j["listen_host"].get<std::string>();
    if (j.contains("port")) {
        const auto& p = j["port"];
        if (p.is_number_unsigned() && p.get<uint64_t>() > 0 && p.get<uint64_t>() <= 65535)
            cfg.port = p.get<uint16_t>();
        else if (p.is_string())
            cfg.port = parse_port(p.get<std::string>(), "port");
        else
            throw std::runtime_error("config: invalid port " + p.dump());
    }
    if (j.contains("environment") && j["environment"].is_string())
        cfg.environment = j["environment"].get<std::string>();
    if (j.contains("forward_timeout") && j["forward_timeout"].is_number_unsigned())
        cfg.forward_timeout = j["forward_timeout"].get<long>();
    if (j.contains("max_body") && j["max_body"].is_number_unsigned())
        cfg.max_body = j["max_body"].get<uint32_t>();
}

void Config::apply_env(Config& cfg) {
    if (const char* v = std::getenv("LOCAL_SERVER_URL"))
        cfg.local_server_url = v;
    if (const char* v = std::getenv("HOST"))
        cfg.listen_host = v;
    if (const char* v = std::getenv("PORT"))
        cfg.port = parse_port(v, "PORT");

    if (const char* v = std::getenv("RELAY_ENV"))
        cfg.environment = v;
    else if (std::getenv("DYNO"))
        cfg.environment = "heroku";
}

Config Config::load(const std::string& path) {
    Config cfg;
    apply_json(cfg, defaults_json());

    if (!path.empty()) {
        std::string resolved = expand_home(path);
        std::ifstream file(resolved);
        if (file.is_open()) {
            nlohmann::json j;
            try {
                j = nlohmann::json::parse(file);
            } catch (const nlohmann::json::parse_error& e) {
                throw std::runtime_error("config: malformed " + resolved + ": " + e.what());
            }
            apply_json(cfg, j);
            std::cerr << "[config] Loaded " << resolved << "\n";
        } else {
            std::cerr << "[config] " << resolved << " not found, using defaults\n";
        }
    }

    apply_env(cfg);
    return cfg;
}

std::string Config::listen_addr() const {
    return listen_host + ":" + std::to_string(port);
}

} // namespace hookrelay
