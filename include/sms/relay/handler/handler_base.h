#ifndef SMS_RELAY_HANDLER_HANDLER_BASE_H
#define SMS_RELAY_HANDLER_HANDLER_BASE_H

/**
 * @file handler_base.h
 * @brief Interface implemented by every relay handler application
 *
 * A handler participates in inbound dispatch through five phases
 * (filter, parse, handle, default, cleanup) and in outbound dispatch
 * through the outgoing phase. Every method has a default, so a handler
 * overrides only the phases it cares about.
 *
 * Return value semantics:
 *   - filter:  true vetoes the message; no later phase runs
 *   - handle:  true marks the message handled and stops the phase
 *   - default: runs only for unhandled messages; true stops the phase
 *   - parse / cleanup: return value is ignored
 *   - outgoing: send_decision::cancel stops the message before delivery
 *
 * Methods may throw; the dispatch engine isolates the failure, reports it
 * through on_exception() and carries on with the next handler.
 */

#include "sms/relay/core/envelope.h"

#include <exception>
#include <string_view>

namespace sms::relay::handler {

/**
 * @brief Dispatch phases
 */
enum class handler_phase {
    start,
    filter,
    parse,
    handle,
    default_phase,
    cleanup,
    outgoing
};

[[nodiscard]] constexpr const char* to_string(handler_phase phase) noexcept {
    switch (phase) {
        case handler_phase::start:
            return "start";
        case handler_phase::filter:
            return "filter";
        case handler_phase::parse:
            return "parse";
        case handler_phase::handle:
            return "handle";
        case handler_phase::default_phase:
            return "default";
        case handler_phase::cleanup:
            return "cleanup";
        case handler_phase::outgoing:
            return "outgoing";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of the outgoing phase for one handler
 */
enum class send_decision {
    proceed,
    cancel
};

[[nodiscard]] constexpr const char* to_string(send_decision decision) noexcept {
    return decision == send_decision::cancel ? "cancel" : "proceed";
}

/**
 * @brief Base class for handler applications
 *
 * @example
 * ```cpp
 * class ping_handler : public message_handler {
 * public:
 *     std::string_view name() const noexcept override { return "ping"; }
 *
 *     bool handle(core::incoming_message& msg) override {
 *         if (msg.text() != "ping") return false;
 *         msg.respond("pong");
 *         return true;
 *     }
 * };
 * ```
 */
class message_handler {
public:
    virtual ~message_handler() = default;

    /**
     * @brief Name used in log lines
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Called once when the router starts
     *
     * Throwing aborts router startup.
     */
    virtual void start() {}

    virtual bool filter(core::incoming_message& /*message*/) { return false; }
    virtual bool parse(core::incoming_message& /*message*/) { return false; }
    virtual bool handle(core::incoming_message& /*message*/) { return false; }
    virtual bool default_phase(core::incoming_message& /*message*/) { return false; }
    virtual bool cleanup(core::incoming_message& /*message*/) { return false; }

    virtual send_decision outgoing(core::outgoing_message& /*message*/) {
        return send_decision::proceed;
    }

    /**
     * @brief Notified when one of this handler's methods threw
     */
    virtual void on_exception(handler_phase /*phase*/,
                              const std::exception& /*error*/) {}

protected:
    message_handler() = default;
    message_handler(const message_handler&) = default;
    message_handler& operator=(const message_handler&) = default;
};

}  // namespace sms::relay::handler

#endif  // SMS_RELAY_HANDLER_HANDLER_BASE_H
