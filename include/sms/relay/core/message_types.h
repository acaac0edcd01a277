#ifndef SMS_RELAY_CORE_MESSAGE_TYPES_H
#define SMS_RELAY_CORE_MESSAGE_TYPES_H

/**
 * @file message_types.h
 * @brief Persistent message model for the SMS relay
 *
 * Defines the records shared by the store, the dispatch engine and the
 * router:
 *   - message_direction / message_status with their one-character codes
 *   - status transition rules (monotonic lifecycle)
 *   - connection (backend + address) and message_record
 *
 * Status lifecycle:
 *   inbound:  received -> handled
 *   outbound: pending  -> sent | queued | cancelled
 *             queued   -> sent | queued
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sms::relay::core {

/** Identifier of a persisted message */
using message_id = int64_t;

/** Identifier of a persisted connection */
using connection_id = int64_t;

/** Extra gateway parameters supplied by handlers */
using param_map = std::map<std::string, std::string>;

// =============================================================================
// Direction
// =============================================================================

/**
 * @brief Direction of a message relative to the relay
 */
enum class message_direction {
    /** Received from a sender */
    inbound,
    /** Sent to a recipient */
    outbound
};

[[nodiscard]] constexpr const char* to_string(message_direction direction) noexcept {
    switch (direction) {
        case message_direction::inbound:
            return "inbound";
        case message_direction::outbound:
            return "outbound";
        default:
            return "unknown";
    }
}

/**
 * @brief Storage code of a direction ('I' or 'O')
 */
[[nodiscard]] constexpr char to_code(message_direction direction) noexcept {
    return direction == message_direction::inbound ? 'I' : 'O';
}

[[nodiscard]] std::optional<message_direction> direction_from_code(char code) noexcept;

// =============================================================================
// Status
// =============================================================================

/**
 * @brief Lifecycle status of a message
 */
enum class message_status {
    /** Inbound message persisted, dispatch not finished */
    received,
    /** Inbound message fully dispatched (terminal) */
    handled,
    /** Outbound message created, outgoing phase running */
    pending,
    /** Gateway accepted the message (terminal) */
    sent,
    /** Delivery failed or not configured; awaiting retry */
    queued,
    /** A handler stopped the message in the outgoing phase (terminal) */
    cancelled
};

[[nodiscard]] constexpr const char* to_string(message_status status) noexcept {
    switch (status) {
        case message_status::received:
            return "received";
        case message_status::handled:
            return "handled";
        case message_status::pending:
            return "pending";
        case message_status::sent:
            return "sent";
        case message_status::queued:
            return "queued";
        case message_status::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Storage code of a status (R, H, P, S, Q, C)
 */
[[nodiscard]] constexpr char to_code(message_status status) noexcept {
    switch (status) {
        case message_status::received:
            return 'R';
        case message_status::handled:
            return 'H';
        case message_status::pending:
            return 'P';
        case message_status::sent:
            return 'S';
        case message_status::queued:
            return 'Q';
        case message_status::cancelled:
            return 'C';
        default:
            return '?';
    }
}

[[nodiscard]] std::optional<message_status> status_from_code(char code) noexcept;

/**
 * @brief Check whether a status admits no further transition
 */
[[nodiscard]] constexpr bool is_terminal(message_status status) noexcept {
    return status == message_status::handled ||
           status == message_status::sent ||
           status == message_status::cancelled;
}

/**
 * @brief Check whether @p from may move to @p to
 *
 * Sent -> sent is accepted so that repeated delivery receipts are no-ops.
 */
[[nodiscard]] bool can_transition(message_status from, message_status to) noexcept;

// =============================================================================
// Records
// =============================================================================

/**
 * @brief A (backend, address) endpoint
 *
 * (backend, identity) is unique; id is assigned by the connection resolver.
 */
struct connection {
    connection_id id = 0;

    /** Backend (carrier gateway) name */
    std::string backend;

    /** Phone number or other address on that backend */
    std::string identity;

    [[nodiscard]] bool operator==(const connection&) const = default;
};

/**
 * @brief Human-readable "backend:identity" form used in logs
 */
[[nodiscard]] std::string to_string(const connection& conn);

/**
 * @brief Persisted message
 */
struct message_record {
    message_id id = 0;
    struct connection connection;
    std::string text;
    message_direction direction = message_direction::inbound;
    message_status status = message_status::received;
    std::chrono::system_clock::time_point timestamp;

    /** Inbound message this one answers, if any */
    std::optional<message_id> in_response_to;

    /** Gateway parameters sent with every delivery attempt (outbound only) */
    param_map params;
};

/**
 * @brief Fields needed to create a message record
 */
struct new_message {
    struct connection connection;
    std::string text;
    message_direction direction = message_direction::inbound;
    message_status status = message_status::received;
    std::optional<message_id> in_response_to;
    param_map params;
};

}  // namespace sms::relay::core

#endif  // SMS_RELAY_CORE_MESSAGE_TYPES_H
