#include "api.hpp"
#include "lifecycle.hpp"
#include "payload.hpp"
#include "signature.hpp"
#include "store/conversation_store.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

namespace convtrack {

static constexpr const char* kClosePrefix = "/close/";

static HttpResponse json_response(int status, const nlohmann::json& body) {
    return {status, "application/json", body.dump()};
}

static HttpResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

nlohmann::json counters_to_json(const Counters& c) {
    return {
        {"new_conversation_count", c.new_conversation_count},
        {"open_conversation_count", c.open_conversation_count},
        {"closed_conversation_count", c.closed_conversation_count}
    };
}

ConversationApi::ConversationApi(ApiConfig config, ConversationStore& store,
                                 LifecycleEngine& engine)
    : ConversationApi(std::move(config), store, engine, epoch_seconds)
{}

ConversationApi::ConversationApi(ApiConfig config, ConversationStore& store,
                                 LifecycleEngine& engine, Clock clock)
    : config_(std::move(config)), store_(store), engine_(engine), clock_(std::move(clock))
{}

HttpResponse ConversationApi::handle(const HttpRequest& req) const {
    const std::string& path = req.path;

    if (path == "/webhook") {
        if (req.method == "GET")  return handle_verify(req);
        if (req.method == "POST") return handle_notification(req);
        return {405, "text/plain", "Method Not Allowed"};
    }
    if (path == "/count") {
        if (req.method == "GET") return handle_count();
        return {405, "text/plain", "Method Not Allowed"};
    }
    if (path == "/status") {
        if (req.method == "GET") return handle_status();
        return {405, "text/plain", "Method Not Allowed"};
    }
    if (path == "/recalculate-counters") {
        if (req.method == "POST") return handle_recalculate();
        return {405, "text/plain", "Method Not Allowed"};
    }
    if (path.compare(0, 7, kClosePrefix) == 0) {
        if (req.method == "POST") return handle_close(url_decode(path.substr(7)));
        return {405, "text/plain", "Method Not Allowed"};
    }
    if (path == "/health") {
        if (req.method == "GET") return json_response(200, {{"status", "ok"}});
        return {405, "text/plain", "Method Not Allowed"};
    }
    return {404, "text/plain", "Not Found"};
}

// Meta webhook verification handshake
HttpResponse ConversationApi::handle_verify(const HttpRequest& req) const {
    if (req.query_param("hub.mode") == "subscribe" &&
        !config_.verify_token.empty() &&
        req.query_param("hub.verify_token") == config_.verify_token) {
        std::cerr << "[webhook] Verification handshake succeeded\n";
        return {200, "text/plain", req.query_param("hub.challenge")};
    }
    std::cerr << "[webhook] Verification handshake rejected\n";
    return {403, "text/plain", "Forbidden"};
}

// Past the signature check this always answers 200; failures are reported in
// the body so the platform does not redeliver.
HttpResponse ConversationApi::handle_notification(const HttpRequest& req) const {
    auto check = verify_signature(req.body, req.header("x-hub-signature-256"),
                                  config_.app_secret);
    if (check == SignatureResult::SecretNotConfigured) {
        std::cerr << "[webhook] App secret not configured, refusing notification\n";
        return error_response(500, "server misconfigured: app secret not set");
    }
    if (is_unauthorized(check)) {
        std::cerr << "[webhook] Signature rejected: " << signature_result_name(check) << "\n";
        return {403, "text/plain", "Forbidden"};
    }

    std::vector<InboundEvent> events;
    try {
        events = decode_webhook_payload(req.body, clock_());
    } catch (const MalformedPayload& e) {
        std::cerr << "[webhook] " << e.what() << "\n";
        return json_response(200, {{"success", false}});
    }

    bool success = true;
    for (const auto& ev : events) {
        try {
            engine_.apply(ev);
        } catch (const std::exception& e) {
            success = false;
            std::cerr << "[webhook] Failed to process message from " << ev.sender_id
                      << ": " << e.what() << "\n";
        }
    }
    return json_response(200, {{"success", success}});
}

HttpResponse ConversationApi::handle_count() const {
    try {
        return json_response(200, counters_to_json(store_.read_counters()));
    } catch (const StorageError& e) {
        return error_response(500, e.what());
    }
}

HttpResponse ConversationApi::handle_status() const {
    std::vector<Conversation> rows;
    try {
        rows = store_.list();
    } catch (const StorageError& e) {
        return error_response(500, e.what());
    }

    // ordered_json keeps the newest-first order of the rows
    nlohmann::ordered_json body = nlohmann::ordered_json::object();
    for (const auto& c : rows) {
        nlohmann::ordered_json item;
        item["status"] = status_to_string(c.status);
        item["creation_timestamp"] = c.creation_timestamp;
        if (c.closed_timestamp) item["closed_timestamp"] = *c.closed_timestamp;
        else                    item["closed_timestamp"] = nullptr;
        if (c.contact_name) item["contact_name"] = *c.contact_name;
        else                item["contact_name"] = nullptr;
        item["last_message_timestamp"] = c.last_message_timestamp;
        body[c.sender_id] = std::move(item);
    }
    return {200, "application/json", body.dump()};
}

HttpResponse ConversationApi::handle_close(const std::string& sender_id) const {
    if (sender_id.empty()) {
        return json_response(404, {{"status", close_result_to_string(CloseResult::NotFound)}});
    }
    try {
        CloseResult result = engine_.close(sender_id, clock_());
        int status = result == CloseResult::NotFound ? 404 : 200;
        return json_response(status, {{"status", close_result_to_string(result)}});
    } catch (const StorageError& e) {
        return error_response(500, e.what());
    }
}

HttpResponse ConversationApi::handle_recalculate() const {
    try {
        Counters c = engine_.recalculate();
        return json_response(200, {
            {"success", true},
            {"open_conversation_count", c.open_conversation_count},
            {"closed_conversation_count", c.closed_conversation_count},
            {"new_conversation_count", c.new_conversation_count}
        });
    } catch (const StorageError& e) {
        return error_response(500, e.what());
    }
}

} // namespace convtrack
