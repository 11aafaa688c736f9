#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace convtrack;

static std::string config_test_path() {
    return "/tmp/convtrack_test_config_" + std::to_string(getpid()) + "/config.json";
}

// Clears every override variable for the lifetime of the guard.
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        for (const char* name : {"WHATSAPP_VERIFY_TOKEN", "WHATSAPP_APP_SECRET", "PORT",
                                 "DB_DIR", "CONVTRACK_LISTEN", "CONVTRACK_DB"}) {
            unsetenv(name);
        }
    }
};

struct ConfigFileFixture {
    std::string path = config_test_path();
    EnvGuard env;
    ~ConfigFileFixture() {
        std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    }
};

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.listen == "0.0.0.0:5000");
    REQUIRE(cfg.verify_token.empty());
    REQUIRE(cfg.app_secret.empty());
    REQUIRE(cfg.workers == 4);
    REQUIRE(cfg.busy_timeout_ms == 5000);
    REQUIRE(cfg.max_body == 1048576);
}

TEST_CASE("Config::defaults_json: carries every key", "[config]") {
    auto j = Config::defaults_json();
    for (const char* key : {"listen", "database_path", "verify_token", "app_secret",
                            "max_body", "workers", "busy_timeout_ms"}) {
        REQUIRE(j.contains(key));
    }
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads all keys", "[config]") {
    nlohmann::json j = {
        {"listen", "127.0.0.1:9000"},
        {"database_path", "/var/lib/convtrack/db.sqlite"},
        {"verify_token", "tok"},
        {"app_secret", "sec"},
        {"max_body", 2048},
        {"workers", 8},
        {"busy_timeout_ms", 250}
    };
    auto cfg = Config::from_json(j);
    REQUIRE(cfg.listen == "127.0.0.1:9000");
    REQUIRE(cfg.database_path == "/var/lib/convtrack/db.sqlite");
    REQUIRE(cfg.verify_token == "tok");
    REQUIRE(cfg.app_secret == "sec");
    REQUIRE(cfg.max_body == 2048);
    REQUIRE(cfg.workers == 8);
    REQUIRE(cfg.busy_timeout_ms == 250);
}

TEST_CASE("Config::from_json: mistyped values keep defaults", "[config]") {
    nlohmann::json j = {{"listen", 5}, {"workers", 0}, {"max_body", "big"}};
    auto cfg = Config::from_json(j);
    REQUIRE(cfg.listen == "0.0.0.0:5000");
    REQUIRE(cfg.workers == 4);
    REQUIRE(cfg.max_body == 1048576);
}

// ── Environment overrides ────────────────────────────────────────

TEST_CASE("Config: env vars override secrets", "[config]") {
    EnvGuard env;
    setenv("WHATSAPP_VERIFY_TOKEN", "env-token", 1);
    setenv("WHATSAPP_APP_SECRET", "env-secret", 1);

    Config cfg;
    cfg.verify_token = "file-token";
    cfg.apply_env_overrides();
    REQUIRE(cfg.verify_token == "env-token");
    REQUIRE(cfg.app_secret == "env-secret");
}

TEST_CASE("Config: PORT replaces only the port", "[config]") {
    EnvGuard env;
    setenv("PORT", "8081", 1);
    Config cfg;
    cfg.listen = "127.0.0.1:5000";
    cfg.apply_env_overrides();
    REQUIRE(cfg.listen == "127.0.0.1:8081");
}

TEST_CASE("Config: DB_DIR places the database file", "[config]") {
    EnvGuard env;
    setenv("DB_DIR", "/app/db_data/", 1);
    Config cfg;
    cfg.apply_env_overrides();
    REQUIRE(cfg.database_path == "/app/db_data/whatsapp_data.db");
}

TEST_CASE("Config: CONVTRACK_DB wins over DB_DIR", "[config]") {
    EnvGuard env;
    setenv("DB_DIR", "/app/db_data", 1);
    setenv("CONVTRACK_DB", "/tmp/other.db", 1);
    Config cfg;
    cfg.apply_env_overrides();
    REQUIRE(cfg.database_path == "/tmp/other.db");
}

TEST_CASE("Config: resolved_database_path expands home", "[config]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    Config cfg;
    cfg.database_path = "~/x.db";
    REQUIRE(cfg.resolved_database_path() == std::string(home) + "/x.db");
}

// ── load ─────────────────────────────────────────────────────────

TEST_CASE("Config::load: creates default file when missing", "[config]") {
    ConfigFileFixture f;
    auto cfg = Config::load(f.path);
    REQUIRE(cfg.listen == "0.0.0.0:5000");
    REQUIRE(std::filesystem::exists(f.path));
}

TEST_CASE("Config::load: merges missing keys into existing file", "[config]") {
    ConfigFileFixture f;
    std::filesystem::create_directories(std::filesystem::path(f.path).parent_path());
    {
        std::ofstream out(f.path);
        out << R"({"verify_token": "from-file", "workers": 2})";
    }

    auto cfg = Config::load(f.path);
    REQUIRE(cfg.verify_token == "from-file");
    REQUIRE(cfg.workers == 2);
    REQUIRE(cfg.busy_timeout_ms == 5000);

    std::ifstream in(f.path);
    auto written = nlohmann::json::parse(in);
    REQUIRE(written["verify_token"] == "from-file");
    REQUIRE(written.contains("busy_timeout_ms"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigFileFixture f;
    std::filesystem::create_directories(std::filesystem::path(f.path).parent_path());
    {
        std::ofstream out(f.path);
        out << "{ not json";
    }
    auto cfg = Config::load(f.path);
    REQUIRE(cfg.listen == "0.0.0.0:5000");
    REQUIRE(cfg.app_secret.empty());
}

TEST_CASE("Config::load: env overrides file values", "[config]") {
    ConfigFileFixture f;
    std::filesystem::create_directories(std::filesystem::path(f.path).parent_path());
    {
        std::ofstream out(f.path);
        out << R"({"app_secret": "file-secret"})";
    }
    setenv("WHATSAPP_APP_SECRET", "env-secret", 1);
    auto cfg = Config::load(f.path);
    REQUIRE(cfg.app_secret == "env-secret");
}
