#ifndef SMS_RELAY_CORE_ENVELOPE_H
#define SMS_RELAY_CORE_ENVELOPE_H

/**
 * @file envelope.h
 * @brief Transient in-flight message representations
 *
 * incoming_message is created when inbound dispatch starts and discarded
 * when it completes. Handlers read it, annotate it, mark it handled and
 * queue replies on it. Replies are outgoing_message values that the
 * dispatch engine drains in FIFO order after finalization.
 */

#include "sms/relay/core/message_types.h"

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sms::relay::core {

/**
 * @brief Message on its way to a recipient
 *
 * Handlers may rewrite the text or add gateway parameters during the
 * outgoing phase.
 */
struct outgoing_message {
    struct connection connection;
    std::string text;

    /** Inbound message this one answers, if any */
    std::optional<message_id> in_response_to;

    /** Extra parameters passed to the delivery gateway */
    param_map params;
};

/**
 * @brief Envelope passed through the inbound phases
 *
 * @example
 * ```cpp
 * bool handle(incoming_message& msg) override {
 *     if (msg.text() != "ping") return false;
 *     msg.respond("pong");
 *     return true;
 * }
 * ```
 */
class incoming_message {
public:
    /**
     * @brief Build an envelope around a freshly persisted inbound record
     */
    explicit incoming_message(message_record record);

    [[nodiscard]] const core::connection& connection() const noexcept {
        return record_.connection;
    }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    /**
     * @brief Replace the working text (e.g. after normalization in parse)
     *
     * The persisted record keeps the original text.
     */
    void set_text(std::string text) { text_ = std::move(text); }

    [[nodiscard]] std::chrono::system_clock::time_point received_at() const noexcept {
        return record_.timestamp;
    }

    /**
     * @brief Back-reference to the persisted message
     */
    [[nodiscard]] const message_record& record() const noexcept { return record_; }

    /**
     * @brief Update the back-reference after a status write
     */
    void update_record(message_record record) { record_ = std::move(record); }

    [[nodiscard]] bool handled() const noexcept { return handled_; }
    void mark_handled() noexcept { handled_ = true; }

    // =========================================================================
    // Replies
    // =========================================================================

    /**
     * @brief Queue a reply to the sender
     *
     * @param text Reply text
     * @param params Extra gateway parameters
     */
    void respond(std::string text, param_map params = {});

    /**
     * @brief Queue a message to an arbitrary connection
     */
    void respond_to(const core::connection& target, std::string text,
                    param_map params = {});

    [[nodiscard]] const std::deque<outgoing_message>& responses() const noexcept {
        return responses_;
    }

    /**
     * @brief Remove and return the oldest queued reply
     */
    [[nodiscard]] std::optional<outgoing_message> pop_response();

    // =========================================================================
    // Annotations
    // =========================================================================

    /**
     * @brief Attach a value for later phases (e.g. a parsed keyword)
     */
    void annotate(std::string key, std::string value);

    [[nodiscard]] std::optional<std::string> annotation(std::string_view key) const;

    [[nodiscard]] const param_map& annotations() const noexcept {
        return annotations_;
    }

private:
    message_record record_;
    std::string text_;
    bool handled_ = false;
    std::deque<outgoing_message> responses_;
    param_map annotations_;
};

}  // namespace sms::relay::core

#endif  // SMS_RELAY_CORE_ENVELOPE_H
