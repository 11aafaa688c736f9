#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace convtrack {

struct Config {
    std::string listen = "0.0.0.0:5000";
    std::string database_path = "~/.convtrack/whatsapp_data.db";
    std::string verify_token;   // GET /webhook handshake token
    std::string app_secret;     // HMAC key for X-Hub-Signature-256; no default
    uint32_t max_body = 1048576;
    uint32_t workers = 4;
    uint32_t busy_timeout_ms = 5000;

    // Default config file location
    static std::string default_path();

    // Load from a JSON config file (created with defaults if missing) + env
    // vars. Empty path means default_path().
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from already-parsed JSON; unknown or mistyped keys keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Environment variables always override the config file.
    void apply_env_overrides();

    // database_path with ~ expanded
    std::string resolved_database_path() const;
};

} // namespace convtrack
