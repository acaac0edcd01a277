/**
 * @file message_types.cpp
 * @brief Message model helpers
 */

#include "sms/relay/core/message_types.h"

namespace sms::relay::core {

std::optional<message_direction> direction_from_code(char code) noexcept {
    switch (code) {
        case 'I':
            return message_direction::inbound;
        case 'O':
            return message_direction::outbound;
        default:
            return std::nullopt;
    }
}

std::optional<message_status> status_from_code(char code) noexcept {
    switch (code) {
        case 'R':
            return message_status::received;
        case 'H':
            return message_status::handled;
        case 'P':
            return message_status::pending;
        case 'S':
            return message_status::sent;
        case 'Q':
            return message_status::queued;
        case 'C':
            return message_status::cancelled;
        default:
            return std::nullopt;
    }
}

bool can_transition(message_status from, message_status to) noexcept {
    switch (from) {
        case message_status::received:
            return to == message_status::handled;
        case message_status::pending:
            return to == message_status::sent || to == message_status::queued ||
                   to == message_status::cancelled;
        case message_status::queued:
            return to == message_status::sent || to == message_status::queued;
        case message_status::sent:
            return to == message_status::sent;
        case message_status::handled:
        case message_status::cancelled:
        default:
            return false;
    }
}

std::string to_string(const connection& conn) {
    return conn.backend + ":" + conn.identity;
}

}  // namespace sms::relay::core
