#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace convtrack {

std::string Config::default_path() {
    return expand_home("~/.convtrack/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"listen", "0.0.0.0:5000"},
        {"database_path", "~/.convtrack/whatsapp_data.db"},
        {"verify_token", ""},
        {"app_secret", ""},
        {"max_body", 1048576},
        {"workers", 4},
        {"busy_timeout_ms", 5000}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integer that fits in uint32_t; anything else leaves out untouched.
static bool read_u32(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (!j.contains(key) || !j[key].is_number_integer()) return false;
    auto v = j[key].get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("listen") && j["listen"].is_string())
        cfg.listen = j["listen"].get<std::string>();
    if (j.contains("database_path") && j["database_path"].is_string())
        cfg.database_path = j["database_path"].get<std::string>();
    if (j.contains("verify_token") && j["verify_token"].is_string())
        cfg.verify_token = j["verify_token"].get<std::string>();
    if (j.contains("app_secret") && j["app_secret"].is_string())
        cfg.app_secret = j["app_secret"].get<std::string>();
    read_u32(j, "max_body", cfg.max_body);
    read_u32(j, "busy_timeout_ms", cfg.busy_timeout_ms);

    uint32_t workers = 0;
    if (read_u32(j, "workers", workers) && workers > 0)
        cfg.workers = workers;
    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? default_path() : path;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("WHATSAPP_VERIFY_TOKEN"))
        verify_token = v;
    if (const char* v = std::getenv("WHATSAPP_APP_SECRET"))
        app_secret = v;
    if (const char* v = std::getenv("CONVTRACK_LISTEN"))
        listen = v;
    if (const char* v = std::getenv("PORT")) {
        auto colon = listen.rfind(':');
        std::string host = colon == std::string::npos ? "0.0.0.0" : listen.substr(0, colon);
        listen = host + ":" + v;
    }
    if (const char* v = std::getenv("DB_DIR")) {
        std::string dir = v;
        if (!dir.empty() && dir.back() == '/') dir.pop_back();
        database_path = dir + "/whatsapp_data.db";
    }
    if (const char* v = std::getenv("CONVTRACK_DB"))
        database_path = v;
}

std::string Config::resolved_database_path() const {
    return expand_home(database_path);
}

} // namespace convtrack
