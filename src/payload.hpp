#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace convtrack {

// One inbound message reduced to what the lifecycle needs.
struct InboundEvent {
    std::string sender_id;
    int64_t message_timestamp = 0;
    std::optional<std::string> contact_name;
};

// Thrown when the webhook body is not JSON at all.
class MalformedPayload : public std::runtime_error {
public:
    explicit MalformedPayload(const std::string& what) : std::runtime_error(what) {}
};

// ── Total accessors ──────────────────────────────────────────────
// Each returns nullptr / nullopt when the key is missing, the parent is not
// an object, or the value has the wrong type. None of them throw.

const nlohmann::json* find_object(const nlohmann::json& parent, const std::string& key);
const nlohmann::json* find_array(const nlohmann::json& parent, const std::string& key);
std::optional<std::string> find_string(const nlohmann::json& parent, const std::string& key);

// Accepts a decimal string ("1700000000", as the platform sends it) or a
// non-negative integer.
std::optional<int64_t> find_timestamp(const nlohmann::json& parent, const std::string& key);

// First element of an array field, if it is an object.
const nlohmann::json* first_object(const nlohmann::json& parent, const std::string& key);

// Decode a WhatsApp Business webhook body into events, in payload order.
// Messages without a timestamp get `now`. Throws MalformedPayload only if the
// body is not valid JSON; missing or mistyped branches yield no events.
std::vector<InboundEvent> decode_webhook_payload(const std::string& body, int64_t now);
std::vector<InboundEvent> decode_webhook_payload(const std::string& body);

} // namespace convtrack
