#include "conversation.hpp"

namespace convtrack {

std::string status_to_string(ConversationStatus status) {
    switch (status) {
        case ConversationStatus::Open:   return "open";
        case ConversationStatus::Closed: return "closed";
    }
    return "open";
}

ConversationStatus status_from_string(const std::string& s) {
    if (s == "closed") return ConversationStatus::Closed;
    return ConversationStatus::Open;
}

std::string close_result_to_string(CloseResult result) {
    switch (result) {
        case CloseResult::Closed:        return "closed";
        case CloseResult::AlreadyClosed: return "already_closed";
        case CloseResult::NotFound:      return "not_found";
    }
    return "not_found";
}

} // namespace convtrack
