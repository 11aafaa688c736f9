#include "config.hpp"
#include "api.hpp"
#include "lifecycle.hpp"
#include "server/http_server.hpp"
#include "store/conversation_store.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: convtrack [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.convtrack/config.json)\n"
              << "  --listen HOST:PORT   Address to serve on (default: 0.0.0.0:5000)\n"
              << "  --db PATH            SQLite database file\n"
              << "  --count              Print conversation counters and exit\n"
              << "  --recalculate        Recompute counters from conversations and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  WHATSAPP_VERIFY_TOKEN  Token expected by the GET /webhook handshake\n"
              << "  WHATSAPP_APP_SECRET    App secret used to verify X-Hub-Signature-256\n"
              << "  PORT                   Port to serve on (keeps the configured host)\n"
              << "  DB_DIR                 Directory holding whatsapp_data.db\n"
              << "  CONVTRACK_LISTEN       Full HOST:PORT override\n"
              << "  CONVTRACK_DB           Database file override\n";
}

static int run_server(const convtrack::Config& config,
                      convtrack::ConversationStore& store,
                      convtrack::LifecycleEngine& engine) {
    if (config.app_secret.empty()) {
        std::cerr << "[server] Warning: app secret not configured; "
                     "every POST /webhook will be refused with 500\n";
    }
    if (config.verify_token.empty()) {
        std::cerr << "[server] Warning: verify token not configured; "
                     "the webhook handshake will be refused\n";
    }

    convtrack::ConversationApi api({config.verify_token, config.app_secret}, store, engine);
    convtrack::HttpServer server(config.listen, config.max_body, config.workers,
        [&api](const convtrack::HttpRequest& req) { return api.handle(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[server] Listening on " << config.listen << " with "
              << config.workers << " workers, database " << store.path() << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string listen;
    std::string db_path;
    bool show_count = false;
    bool recalculate = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--count") == 0) {
            show_count = true;
        } else if (std::strcmp(argv[i], "--recalculate") == 0) {
            recalculate = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = convtrack::Config::load(config_path);

    // Override config with CLI args
    if (!listen.empty()) config.listen = listen;
    if (!db_path.empty()) config.database_path = db_path;

    convtrack::ConversationStore store(config.resolved_database_path(),
                                       static_cast<int>(config.busy_timeout_ms));
    convtrack::LifecycleEngine engine(store);

    if (recalculate) {
        auto counters = engine.recalculate();
        std::cout << convtrack::counters_to_json(counters).dump(2) << "\n";
        return 0;
    }
    if (show_count) {
        std::cout << convtrack::counters_to_json(store.read_counters()).dump(2) << "\n";
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    return run_server(config, store, engine);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
