#ifndef SMS_RELAY_STORAGE_MESSAGE_STORE_H
#define SMS_RELAY_STORAGE_MESSAGE_STORE_H

/**
 * @file message_store.h
 * @brief Persistence interfaces consumed by the dispatch engine and router
 *
 * Two collaborators:
 *   - message_store: create / update / query messages
 *   - connection_resolver: idempotent (backend, address) lookup
 *
 * Implementations must make each create and update atomic per record and
 * must reject status changes that break the message lifecycle.
 */

#include "sms/relay/core/message_types.h"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sms::relay::storage {

// =============================================================================
// Store Error Codes (-910 to -919)
// =============================================================================

/**
 * @brief Message store specific error codes
 *
 * Allocated range: -910 to -919
 */
enum class store_error : int {
    /** Failed to open or initialize database */
    database_error = -910,

    /** Message not found */
    message_not_found = -911,

    /** Connection not found */
    connection_not_found = -912,

    /** Invalid message data */
    invalid_message = -913,

    /** Status change violates the message lifecycle */
    invalid_transition = -914,

    /** Stored row could not be decoded */
    corrupt_record = -915,

    /** Store is not open */
    not_open = -916
};

[[nodiscard]] constexpr int to_error_code(store_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(store_error error) noexcept {
    switch (error) {
        case store_error::database_error:
            return "Database operation failed";
        case store_error::message_not_found:
            return "Message not found";
        case store_error::connection_not_found:
            return "Connection not found";
        case store_error::invalid_message:
            return "Invalid message data";
        case store_error::invalid_transition:
            return "Status transition not allowed";
        case store_error::corrupt_record:
            return "Stored record could not be decoded";
        case store_error::not_open:
            return "Message store is not open";
        default:
            return "Unknown store error";
    }
}

// =============================================================================
// Collaborator Interfaces
// =============================================================================

/**
 * @brief Message persistence
 */
class message_store {
public:
    virtual ~message_store() = default;

    /**
     * @brief Persist a new message
     *
     * Assigns the identifier and timestamp.
     *
     * @param message Fields of the new record
     * @return Created record or error
     */
    [[nodiscard]] virtual std::expected<core::message_record, store_error>
    create_message(const core::new_message& message) = 0;

    /**
     * @brief Change the status of a message
     *
     * @return Updated record, invalid_transition if the lifecycle forbids it
     */
    [[nodiscard]] virtual std::expected<core::message_record, store_error>
    update_status(core::message_id id, core::message_status status) = 0;

    /**
     * @brief Replace the text and gateway parameters of a pending message
     *
     * Records what the outgoing handlers produced, so later delivery
     * attempts send the same request as the first one.
     *
     * @return Updated record, invalid_transition unless the message is a
     *         pending outbound one
     */
    [[nodiscard]] virtual std::expected<core::message_record, store_error>
    update_payload(core::message_id id, const std::string& text,
                   const core::param_map& params) = 0;

    /**
     * @brief Fetch a message by identifier
     */
    [[nodiscard]] virtual std::expected<core::message_record, store_error>
    get_message(core::message_id id) const = 0;

    /**
     * @brief All messages with a status, oldest first
     */
    [[nodiscard]] virtual std::expected<std::vector<core::message_record>, store_error>
    find_by_status(core::message_status status) const = 0;

protected:
    message_store() = default;
    message_store(const message_store&) = default;
    message_store& operator=(const message_store&) = default;
};

/**
 * @brief Endpoint lookup
 */
class connection_resolver {
public:
    virtual ~connection_resolver() = default;

    /**
     * @brief Find the connection for (backend, identity), creating it if new
     */
    [[nodiscard]] virtual std::expected<core::connection, store_error>
    get_or_create(std::string_view backend, std::string_view identity) = 0;

protected:
    connection_resolver() = default;
    connection_resolver(const connection_resolver&) = default;
    connection_resolver& operator=(const connection_resolver&) = default;
};

// =============================================================================
// Store Configuration
// =============================================================================

/**
 * @brief Backing store kind
 */
enum class store_type {
    memory,
    sqlite
};

[[nodiscard]] constexpr const char* to_string(store_type type) noexcept {
    switch (type) {
        case store_type::memory:
            return "memory";
        case store_type::sqlite:
            return "sqlite";
        default:
            return "unknown";
    }
}

/**
 * @brief Store configuration
 */
struct store_config {
    store_type type = store_type::sqlite;

    /** Path to SQLite database file */
    std::string database_path = "sms_relay.db";

    /** Enable WAL mode for better concurrent access */
    bool enable_wal_mode = true;

    /** SQLite busy timeout */
    std::chrono::milliseconds busy_timeout{5000};

    [[nodiscard]] bool is_valid() const noexcept {
        if (type == store_type::sqlite && database_path.empty()) return false;
        return true;
    }
};

/**
 * @brief Both collaborator views of one backing store
 */
struct store_handles {
    std::shared_ptr<message_store> messages;
    std::shared_ptr<connection_resolver> connections;
};

/**
 * @brief Open the store described by @p config
 */
[[nodiscard]] std::expected<store_handles, store_error> open_store(
    const store_config& config);

}  // namespace sms::relay::storage

#endif  // SMS_RELAY_STORAGE_MESSAGE_STORE_H
