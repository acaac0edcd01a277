/**
 * @file builtin_handlers.cpp
 * @brief echo, blocklist and default_reply handlers
 */

#include "sms/relay/handlers/blocklist_handler.h"
#include "sms/relay/handlers/default_reply_handler.h"
#include "sms/relay/handlers/echo_handler.h"

namespace sms::relay::handlers {

namespace {

std::string_view trim(std::string_view value) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto start = value.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

}  // namespace

// =============================================================================
// echo
// =============================================================================

echo_handler::echo_handler(const handler::handler_settings& settings) {
    if (auto it = settings.find("prefix"); it != settings.end()) {
        prefix_ = it->second;
    }
}

bool echo_handler::handle(core::incoming_message& message) {
    message.respond(prefix_ + message.text());
    return true;
}

// =============================================================================
// blocklist
// =============================================================================

blocklist_handler::blocklist_handler(const handler::handler_settings& settings) {
    auto it = settings.find("addresses");
    if (it == settings.end()) {
        return;
    }

    std::string_view list = it->second;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto entry = trim(list.substr(0, comma));
        if (!entry.empty()) {
            addresses_.emplace(entry);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
}

bool blocklist_handler::is_blocked(std::string_view identity) const {
    return addresses_.find(identity) != addresses_.end();
}

bool blocklist_handler::filter(core::incoming_message& message) {
    return is_blocked(message.connection().identity);
}

// =============================================================================
// default_reply
// =============================================================================

default_reply_handler::default_reply_handler(
    const handler::handler_settings& settings) {
    if (auto it = settings.find("text"); it != settings.end()) {
        text_ = it->second;
    }
}

bool default_reply_handler::default_phase(core::incoming_message& message) {
    message.respond(text_);
    return true;
}

}  // namespace sms::relay::handlers
