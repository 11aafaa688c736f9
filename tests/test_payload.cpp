#include <catch2/catch.hpp>
#include "payload.hpp"
#include <nlohmann/json.hpp>

using namespace convtrack;

static constexpr int64_t kNow = 1700000999;

static const char* kValidPayload = R"({
    "object": "whatsapp_business_account",
    "entry": [{
        "id": "102290129340398",
        "changes": [{
            "field": "messages",
            "value": {
                "messaging_product": "whatsapp",
                "contacts": [{"profile": {"name": "Maria"}, "wa_id": "5511999"}],
                "messages": [{
                    "from": "5511999",
                    "id": "wamid.HBgN",
                    "timestamp": "1700000000",
                    "type": "text",
                    "text": {"body": "Oi"}
                }]
            }
        }]
    }]
})";

// ── Accessors ────────────────────────────────────────────────────

TEST_CASE("find_array: returns nullptr for missing or mistyped keys", "[payload]") {
    auto j = nlohmann::json::parse(R"({"a": [1], "b": {"x": 1}, "c": "s"})");
    REQUIRE(find_array(j, "a") != nullptr);
    REQUIRE(find_array(j, "b") == nullptr);
    REQUIRE(find_array(j, "missing") == nullptr);
    REQUIRE(find_array(nlohmann::json::array(), "a") == nullptr);
}

TEST_CASE("find_object / find_string: total on any input", "[payload]") {
    auto j = nlohmann::json::parse(R"({"o": {"k": "v"}, "n": 3})");
    REQUIRE(find_object(j, "o") != nullptr);
    REQUIRE(find_object(j, "n") == nullptr);
    REQUIRE(find_string(*find_object(j, "o"), "k").value_or("") == "v");
    REQUIRE_FALSE(find_string(j, "n").has_value());
    REQUIRE_FALSE(find_string(nlohmann::json("scalar"), "k").has_value());
}

TEST_CASE("find_timestamp: string and integer forms", "[payload]") {
    auto j = nlohmann::json::parse(
        R"({"s": "1700000000", "i": 1700000001, "neg": -5, "bad": "12ab", "f": 1.5})");
    REQUIRE(find_timestamp(j, "s").value_or(0) == 1700000000);
    REQUIRE(find_timestamp(j, "i").value_or(0) == 1700000001);
    REQUIRE_FALSE(find_timestamp(j, "neg").has_value());
    REQUIRE_FALSE(find_timestamp(j, "bad").has_value());
    REQUIRE_FALSE(find_timestamp(j, "f").has_value());
    REQUIRE_FALSE(find_timestamp(j, "missing").has_value());
}

TEST_CASE("find_timestamp: unsigned values beyond int64 are unparsable", "[payload]") {
    auto j = nlohmann::json::parse(
        R"({"max": 9223372036854775807, "over": 9223372036854775808, "u64": 18446744073709551615})");
    REQUIRE(find_timestamp(j, "max").value_or(0) == 9223372036854775807LL);
    REQUIRE_FALSE(find_timestamp(j, "over").has_value());
    REQUIRE_FALSE(find_timestamp(j, "u64").has_value());
}

TEST_CASE("decode_webhook_payload: oversized timestamp falls back to invocation time", "[payload]") {
    const char* body = R"({
        "object": "whatsapp_business_account",
        "entry": [{"changes": [{"value": {"messages": [
            {"from": "big", "type": "text", "timestamp": 18446744073709551615}
        ]}}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].message_timestamp == kNow);
}

TEST_CASE("decode_webhook_payload: sender ids keep embedded NUL characters", "[payload]") {
    const char* body = R"({
        "object": "whatsapp_business_account",
        "entry": [{"changes": [{"value": {"messages": [
            {"from": "5511\u0000AAA", "type": "text", "timestamp": "10"},
            {"from": "\u0000x", "type": "text", "timestamp": "11"}
        ]}}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].sender_id == std::string("5511\0AAA", 8));
    REQUIRE(events[1].sender_id == std::string("\0x", 2));
}

TEST_CASE("first_object: empty array yields nullptr", "[payload]") {
    auto j = nlohmann::json::parse(R"({"a": [], "b": [1], "c": [{"x": 1}]})");
    REQUIRE(first_object(j, "a") == nullptr);
    REQUIRE(first_object(j, "b") == nullptr);
    REQUIRE(first_object(j, "c") != nullptr);
}

// ── decode_webhook_payload ───────────────────────────────────────

TEST_CASE("decode_webhook_payload: valid message with contact", "[payload]") {
    auto events = decode_webhook_payload(kValidPayload, kNow);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].sender_id == "5511999");
    REQUIRE(events[0].message_timestamp == 1700000000);
    REQUIRE(events[0].contact_name.value_or("") == "Maria");
}

TEST_CASE("decode_webhook_payload: invalid JSON throws MalformedPayload", "[payload]") {
    REQUIRE_THROWS_AS(decode_webhook_payload("not json", kNow), MalformedPayload);
    REQUIRE_THROWS_AS(decode_webhook_payload("", kNow), MalformedPayload);
}

TEST_CASE("decode_webhook_payload: missing branches yield no events", "[payload]") {
    REQUIRE(decode_webhook_payload("{}", kNow).empty());
    REQUIRE(decode_webhook_payload("[]", kNow).empty());
    REQUIRE(decode_webhook_payload(R"({"entry": {}})", kNow).empty());
    REQUIRE(decode_webhook_payload(R"({"entry": [{}]})", kNow).empty());
    REQUIRE(decode_webhook_payload(R"({"entry": [{"changes": [{}]}]})", kNow).empty());
    REQUIRE(decode_webhook_payload(
        R"({"entry": [{"changes": [{"value": "x"}]}]})", kNow).empty());
    REQUIRE(decode_webhook_payload(
        R"({"entry": [{"changes": [{"value": {"statuses": []}}]}]})", kNow).empty());
}

TEST_CASE("decode_webhook_payload: other object types are ignored", "[payload]") {
    const char* body = R"({
        "object": "page",
        "entry": [{"changes": [{"value": {"messages": [
            {"from": "1", "type": "text", "timestamp": "5"}
        ]}}]}]
    })";
    REQUIRE(decode_webhook_payload(body, kNow).empty());
}

TEST_CASE("decode_webhook_payload: messages need both from and type", "[payload]") {
    const char* body = R"({
        "object": "whatsapp_business_account",
        "entry": [{"changes": [{"value": {"messages": [
            {"from": "111", "timestamp": "10"},
            {"type": "text", "timestamp": "11"},
            {"from": "222", "type": "image", "timestamp": "12"},
            "garbage"
        ]}}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].sender_id == "222");
    REQUIRE(events[0].message_timestamp == 12);
    REQUIRE_FALSE(events[0].contact_name.has_value());
}

TEST_CASE("decode_webhook_payload: missing timestamp uses invocation time", "[payload]") {
    const char* body = R"({
        "entry": [{"changes": [{"value": {"messages": [
            {"from": "333", "type": "text"},
            {"from": "444", "type": "text", "timestamp": "not-a-number"}
        ]}}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].message_timestamp == kNow);
    REQUIRE(events[1].message_timestamp == kNow);
}

TEST_CASE("decode_webhook_payload: contact mismatch still yields event", "[payload]") {
    const char* body = R"({
        "entry": [{"changes": [{"value": {
            "contacts": [{"profile": {"name": "Ana"}, "wa_id": "999"}],
            "messages": [{"from": "555", "type": "text", "timestamp": "20"}]
        }}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].sender_id == "555");
    REQUIRE(events[0].contact_name.value_or("") == "Ana");
}

TEST_CASE("decode_webhook_payload: preserves order across entries and changes", "[payload]") {
    const char* body = R"({
        "entry": [
            {"changes": [
                {"value": {"messages": [{"from": "a", "type": "text", "timestamp": "1"},
                                        {"from": "b", "type": "text", "timestamp": "2"}]}},
                {"value": {"messages": [{"from": "c", "type": "text", "timestamp": "3"}]}}
            ]},
            {"changes": [
                {"value": {"messages": [{"from": "d", "type": "text", "timestamp": "4"}]}}
            ]}
        ]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 4);
    REQUIRE(events[0].sender_id == "a");
    REQUIRE(events[1].sender_id == "b");
    REQUIRE(events[2].sender_id == "c");
    REQUIRE(events[3].sender_id == "d");
}

TEST_CASE("decode_webhook_payload: contact without profile gives no name", "[payload]") {
    const char* body = R"({
        "entry": [{"changes": [{"value": {
            "contacts": [{"wa_id": "777"}],
            "messages": [{"from": "777", "type": "text", "timestamp": "30"}]
        }}]}]
    })";
    auto events = decode_webhook_payload(body, kNow);
    REQUIRE(events.size() == 1);
    REQUIRE_FALSE(events[0].contact_name.has_value());
}
