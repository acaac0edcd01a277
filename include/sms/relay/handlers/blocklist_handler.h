#ifndef SMS_RELAY_HANDLERS_BLOCKLIST_HANDLER_H
#define SMS_RELAY_HANDLERS_BLOCKLIST_HANDLER_H

/**
 * @file blocklist_handler.h
 * @brief Vetoes messages from blocked sender addresses
 *
 * Settings:
 *   addresses - comma-separated sender addresses; surrounding whitespace
 *               is ignored
 */

#include "sms/relay/handler/handler_base.h"
#include "sms/relay/handler/handler_registry.h"

#include <set>
#include <string>

namespace sms::relay::handlers {

class blocklist_handler : public handler::message_handler {
public:
    static constexpr std::string_view handler_name = "blocklist";

    blocklist_handler() = default;
    explicit blocklist_handler(const handler::handler_settings& settings);

    [[nodiscard]] std::string_view name() const noexcept override {
        return handler_name;
    }

    bool filter(core::incoming_message& message) override;

    [[nodiscard]] bool is_blocked(std::string_view identity) const;

    [[nodiscard]] const std::set<std::string, std::less<>>& addresses() const noexcept {
        return addresses_;
    }

private:
    std::set<std::string, std::less<>> addresses_;
};

}  // namespace sms::relay::handlers

#endif  // SMS_RELAY_HANDLERS_BLOCKLIST_HANDLER_H
