#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace convtrack {

enum class ConversationStatus { Open, Closed };

struct Conversation {
    std::string sender_id;
    ConversationStatus status = ConversationStatus::Open;
    int64_t creation_timestamp = 0;
    std::optional<int64_t> closed_timestamp;  // set iff status == Closed
    std::optional<std::string> contact_name;
    int64_t last_message_timestamp = 0;
};

enum class CloseResult { Closed, AlreadyClosed, NotFound };

// Counter names as persisted in the counters table.
inline constexpr const char* kNewConversationCount    = "new_conversation_count";
inline constexpr const char* kOpenConversationCount   = "open_conversation_count";
inline constexpr const char* kClosedConversationCount = "closed_conversation_count";

struct Counters {
    // Mirrors open_conversation_count; recalculation resets it to that value.
    // Live closes without a matching open can drive it negative.
    int64_t new_conversation_count = 0;
    int64_t open_conversation_count = 0;
    int64_t closed_conversation_count = 0;
};

std::string status_to_string(ConversationStatus status);
ConversationStatus status_from_string(const std::string& s);

// "closed", "already_closed", "not_found"
std::string close_result_to_string(CloseResult result);

} // namespace convtrack
