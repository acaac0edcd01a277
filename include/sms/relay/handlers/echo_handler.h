#ifndef SMS_RELAY_HANDLERS_ECHO_HANDLER_H
#define SMS_RELAY_HANDLERS_ECHO_HANDLER_H

/**
 * @file echo_handler.h
 * @brief Replies to every message with its own text
 *
 * Settings:
 *   prefix - prepended to the echoed text (default: empty)
 */

#include "sms/relay/handler/handler_base.h"
#include "sms/relay/handler/handler_registry.h"

#include <string>

namespace sms::relay::handlers {

class echo_handler : public handler::message_handler {
public:
    static constexpr std::string_view handler_name = "echo";

    echo_handler() = default;
    explicit echo_handler(const handler::handler_settings& settings);

    [[nodiscard]] std::string_view name() const noexcept override {
        return handler_name;
    }

    bool handle(core::incoming_message& message) override;

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

private:
    std::string prefix_;
};

}  // namespace sms::relay::handlers

#endif  // SMS_RELAY_HANDLERS_ECHO_HANDLER_H
