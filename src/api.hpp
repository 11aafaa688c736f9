#pragma once
#include "conversation.hpp"
#include "server/http_server.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace convtrack {

class ConversationStore;
class LifecycleEngine;

struct ApiConfig {
    std::string verify_token;
    std::string app_secret;
};

// {new_conversation_count, open_conversation_count, closed_conversation_count}
nlohmann::json counters_to_json(const Counters& counters);

// HTTP surface of the service:
//   GET  /webhook                 platform verification handshake
//   POST /webhook                 signed notifications -> lifecycle transitions
//   GET  /count                   counters
//   GET  /status                  all conversations, newest first
//   POST /close/{sender_id}       administrative close
//   POST /recalculate-counters    counter repair
//   GET  /health                  liveness
// Thread-safe: all state lives in the store.
class ConversationApi {
public:
    using Clock = std::function<int64_t()>;

    ConversationApi(ApiConfig config, ConversationStore& store, LifecycleEngine& engine);
    ConversationApi(ApiConfig config, ConversationStore& store, LifecycleEngine& engine,
                    Clock clock);

    HttpResponse handle(const HttpRequest& req) const;

private:
    HttpResponse handle_verify(const HttpRequest& req) const;
    HttpResponse handle_notification(const HttpRequest& req) const;
    HttpResponse handle_count() const;
    HttpResponse handle_status() const;
    HttpResponse handle_close(const std::string& sender_id) const;
    HttpResponse handle_recalculate() const;

    ApiConfig config_;
    ConversationStore& store_;
    LifecycleEngine& engine_;
    Clock clock_;
};

} // namespace convtrack
