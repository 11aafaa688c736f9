#include "lifecycle.hpp"
#include "store/conversation_store.hpp"

#include <iostream>

namespace convtrack {

const char* transition_name(Transition t) {
    switch (t) {
        case Transition::Created:  return "created";
        case Transition::Reopened: return "reopened";
        case Transition::Touched:  return "touched";
    }
    return "unknown";
}

Transition LifecycleEngine::apply(const InboundEvent& event) {
    Transition result = Transition::Touched;

    store_.transaction([&](StoreTransaction& tx) {
        auto current = tx.get(event.sender_id);

        if (!current) {
            tx.upsert_open(event.sender_id, event.message_timestamp, event.contact_name);
            tx.increment_counter(kNewConversationCount, 1);
            tx.increment_counter(kOpenConversationCount, 1);
            result = Transition::Created;
        } else if (current->status == ConversationStatus::Closed) {
            tx.upsert_open(event.sender_id, event.message_timestamp, event.contact_name);
            tx.increment_counter(kNewConversationCount, 1);
            tx.increment_counter(kOpenConversationCount, 1);
            tx.increment_counter(kClosedConversationCount, -1);
            result = Transition::Reopened;
        } else {
            tx.touch(event.sender_id, event.message_timestamp, event.contact_name);
            result = Transition::Touched;
        }
    });

    std::cerr << "[lifecycle] " << event.sender_id << ": " << transition_name(result)
              << " at " << event.message_timestamp << "\n";
    return result;
}

CloseResult LifecycleEngine::close(const std::string& sender_id, int64_t now) {
    CloseResult result = CloseResult::NotFound;

    store_.transaction([&](StoreTransaction& tx) {
        result = tx.close(sender_id, now);
        if (result == CloseResult::Closed) {
            tx.increment_counter(kOpenConversationCount, -1);
            tx.increment_counter(kNewConversationCount, -1);
            tx.increment_counter(kClosedConversationCount, 1);
        }
    });

    std::cerr << "[lifecycle] close " << sender_id << ": "
              << close_result_to_string(result) << "\n";
    return result;
}

Counters LifecycleEngine::recalculate() {
    Counters counters = store_.recalculate();
    std::cerr << "[lifecycle] Recalculated counters: open="
              << counters.open_conversation_count
              << " closed=" << counters.closed_conversation_count
              << " new=" << counters.new_conversation_count << "\n";
    return counters;
}

} // namespace convtrack
