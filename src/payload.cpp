#include "payload.hpp"
#include "util.hpp"

#include <iostream>
#include <limits>

namespace convtrack {

static constexpr const char* kBusinessAccountObject = "whatsapp_business_account";

static const nlohmann::json* find_member(const nlohmann::json& parent, const std::string& key) {
    if (!parent.is_object()) return nullptr;
    auto it = parent.find(key);
    if (it == parent.end()) return nullptr;
    return &*it;
}

const nlohmann::json* find_object(const nlohmann::json& parent, const std::string& key) {
    const auto* v = find_member(parent, key);
    return (v && v->is_object()) ? v : nullptr;
}

const nlohmann::json* find_array(const nlohmann::json& parent, const std::string& key) {
    const auto* v = find_member(parent, key);
    return (v && v->is_array()) ? v : nullptr;
}

std::optional<std::string> find_string(const nlohmann::json& parent, const std::string& key) {
    const auto* v = find_member(parent, key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

std::optional<int64_t> find_timestamp(const nlohmann::json& parent, const std::string& key) {
    const auto* v = find_member(parent, key);
    if (!v) return std::nullopt;
    if (v->is_number_unsigned()) {
        auto n = v->get<uint64_t>();
        if (n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(n);
    }
    if (v->is_number_integer()) {
        auto n = v->get<int64_t>();
        if (n < 0) return std::nullopt;
        return n;
    }
    if (v->is_string()) {
        int64_t n = 0;
        if (parse_int64(trim(v->get<std::string>()), n)) return n;
    }
    return std::nullopt;
}

const nlohmann::json* first_object(const nlohmann::json& parent, const std::string& key) {
    const auto* arr = find_array(parent, key);
    if (!arr || arr->empty()) return nullptr;
    const auto& first = arr->front();
    return first.is_object() ? &first : nullptr;
}

// Candidate display name for every message in a value block: the first
// contact's profile name, tagged with its wa_id for the mismatch check.
struct ContactHint {
    std::optional<std::string> wa_id;
    std::optional<std::string> name;
};

static ContactHint contact_hint(const nlohmann::json& value) {
    ContactHint hint;
    const auto* contact = first_object(value, "contacts");
    if (!contact) return hint;
    hint.wa_id = find_string(*contact, "wa_id");
    if (const auto* profile = find_object(*contact, "profile")) {
        hint.name = find_string(*profile, "name");
    }
    return hint;
}

static void decode_value(const nlohmann::json& value, int64_t now,
                         std::vector<InboundEvent>& out) {
    const auto* messages = find_array(value, "messages");
    if (!messages) return;

    ContactHint hint = contact_hint(value);

    for (const auto& msg : *messages) {
        auto from = find_string(msg, "from");
        auto type = find_string(msg, "type");
        if (!from || !type || from->empty()) continue;

        if (hint.wa_id && *hint.wa_id != *from) {
            std::cerr << "[payload] Contact wa_id " << *hint.wa_id
                      << " does not match message sender " << *from << "\n";
        }

        InboundEvent ev;
        ev.sender_id = *from;
        ev.message_timestamp = find_timestamp(msg, "timestamp").value_or(now);
        ev.contact_name = hint.name;
        out.push_back(std::move(ev));
    }
}

std::vector<InboundEvent> decode_webhook_payload(const std::string& body, int64_t now) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedPayload(std::string("webhook body is not valid JSON: ") + e.what());
    }

    std::vector<InboundEvent> events;
    if (!j.is_object()) return events;

    if (auto object = find_string(j, "object")) {
        if (*object != kBusinessAccountObject) {
            std::cerr << "[payload] Ignoring notification for object type " << *object << "\n";
            return events;
        }
    }

    const auto* entries = find_array(j, "entry");
    if (!entries) return events;

    for (const auto& entry : *entries) {
        const auto* changes = find_array(entry, "changes");
        if (!changes) continue;
        for (const auto& change : *changes) {
            const auto* value = find_object(change, "value");
            if (!value) continue;
            decode_value(*value, now, events);
        }
    }
    return events;
}

std::vector<InboundEvent> decode_webhook_payload(const std::string& body) {
    return decode_webhook_payload(body, epoch_seconds());
}

} // namespace convtrack
