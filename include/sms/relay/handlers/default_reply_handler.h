#ifndef SMS_RELAY_HANDLERS_DEFAULT_REPLY_HANDLER_H
#define SMS_RELAY_HANDLERS_DEFAULT_REPLY_HANDLER_H

/**
 * @file default_reply_handler.h
 * @brief Answers messages that no other handler understood
 *
 * Settings:
 *   text - reply text (default: "Sorry, we did not understand your message.")
 */

#include "sms/relay/handler/handler_base.h"
#include "sms/relay/handler/handler_registry.h"

#include <string>

namespace sms::relay::handlers {

class default_reply_handler : public handler::message_handler {
public:
    static constexpr std::string_view handler_name = "default_reply";
    static constexpr std::string_view default_text =
        "Sorry, we did not understand your message.";

    default_reply_handler() = default;
    explicit default_reply_handler(const handler::handler_settings& settings);

    [[nodiscard]] std::string_view name() const noexcept override {
        return handler_name;
    }

    bool default_phase(core::incoming_message& message) override;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string text_{default_text};
};

}  // namespace sms::relay::handlers

#endif  // SMS_RELAY_HANDLERS_DEFAULT_REPLY_HANDLER_H
