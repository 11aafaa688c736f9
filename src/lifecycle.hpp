#pragma once
#include "conversation.hpp"
#include "payload.hpp"
#include <string>

namespace convtrack {

class ConversationStore;

// What an inbound message did to its sender's conversation.
enum class Transition {
    Created,   // Absent -> Open
    Reopened,  // Closed -> Open
    Touched,   // Open -> Open, counters unchanged
};

const char* transition_name(Transition t);

// Per-sender state machine over the conversation store. Each transition reads
// the current row, decides, and writes the row plus counter deltas inside one
// exclusive store transaction, so concurrent deliveries for the same sender
// cannot both observe Absent. Storage failures propagate as StorageError.
class LifecycleEngine {
public:
    explicit LifecycleEngine(ConversationStore& store) : store_(store) {}

    Transition apply(const InboundEvent& event);

    // Administrative close at `now`.
    CloseResult close(const std::string& sender_id, int64_t now);

    // Repair counter drift from the rows themselves.
    Counters recalculate();

private:
    ConversationStore& store_;
};

} // namespace convtrack
