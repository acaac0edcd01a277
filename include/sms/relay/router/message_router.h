#ifndef SMS_RELAY_ROUTER_MESSAGE_ROUTER_H
#define SMS_RELAY_ROUTER_MESSAGE_ROUTER_H

/**
 * @file message_router.h
 * @brief Public entry point of the relay
 *
 * The router owns the handler chain and the dispatch engine. It starts
 * lazily on first use: handlers are instantiated from the registry in
 * configured order, started, and the chain is sealed; then the outgoing
 * backlog is loaded from queued messages in the store.
 *
 * Startup is guarded by a mutex with an atomic fast path, so concurrent
 * first calls start the router exactly once. The mutex is never held
 * while messages are dispatched. A failed startup leaves the router
 * stopped; the next call tries again from scratch.
 *
 * @example
 * ```cpp
 * auto registry = std::make_shared<handler::handler_registry>();
 * handler::register_builtin_handlers(*registry);
 *
 * router_config config;
 * config.handler_names = {"blocklist", "echo"};
 *
 * message_router router(config, store, store, registry, delivery);
 * auto message = router.handle_incoming("carrier", "+15551234567", "hello");
 * ```
 */

#include "sms/relay/core/message_types.h"
#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/dispatch/dispatch_engine.h"
#include "sms/relay/handler/handler_registry.h"
#include "sms/relay/storage/message_store.h"

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sms::relay::router {

// =============================================================================
// Router Error Codes (-930 to -939)
// =============================================================================

/**
 * @brief Router specific error codes
 *
 * Allocated range: -930 to -939
 */
enum class router_error : int {
    /** Startup failed for a reason other than the ones below */
    startup_failed = -930,

    /** Configured handler name has no factory */
    unknown_handler = -931,

    /** A handler's start() threw */
    handler_start_failed = -932,

    /** Message store reported a failure */
    store_failed = -933,

    /** Status change not allowed */
    invalid_transition = -934,

    /** Message not found */
    message_not_found = -935,

    /** Empty backend, address or other invalid input */
    invalid_argument = -936
};

[[nodiscard]] constexpr int to_error_code(router_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(router_error error) noexcept {
    switch (error) {
        case router_error::startup_failed:
            return "Router startup failed";
        case router_error::unknown_handler:
            return "Unknown handler name";
        case router_error::handler_start_failed:
            return "Handler failed to start";
        case router_error::store_failed:
            return "Message store operation failed";
        case router_error::invalid_transition:
            return "Status transition not allowed";
        case router_error::message_not_found:
            return "Message not found";
        case router_error::invalid_argument:
            return "Invalid argument";
        default:
            return "Unknown router error";
    }
}

/**
 * @brief Handlers to load at startup
 */
struct router_config {
    /** Handler names in chain order */
    std::vector<std::string> handler_names;

    /** Settings per handler name */
    std::map<std::string, handler::handler_settings> handler_options;
};

/**
 * @brief Result of retry_queued()
 */
struct retry_summary {
    size_t attempted = 0;
    size_t sent = 0;
    size_t still_queued = 0;

    /** Attempts that hit a store error; the rest of the backlog is still tried */
    size_t failed = 0;
};

/**
 * @brief Router counters
 */
struct router_statistics {
    dispatch::dispatch_statistics dispatch_stats;
    size_t backlog_size = 0;
    size_t handler_count = 0;
    bool started = false;
};

class message_router {
public:
    message_router(router_config config,
                   std::shared_ptr<storage::message_store> store,
                   std::shared_ptr<storage::connection_resolver> resolver,
                   std::shared_ptr<handler::handler_registry> registry,
                   std::shared_ptr<delivery::delivery_client> delivery);

    ~message_router();

    message_router(const message_router&) = delete;
    message_router& operator=(const message_router&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start the router if it is not started yet
     *
     * Idempotent and thread-safe.
     */
    [[nodiscard]] std::expected<void, router_error> ensure_started();

    [[nodiscard]] bool is_started() const noexcept;

    // =========================================================================
    // Entry Points
    // =========================================================================

    /**
     * @brief Persist and dispatch a message received from @p sender
     *
     * @return Inbound message, status handled
     */
    [[nodiscard]] std::expected<core::message_record, router_error> handle_incoming(
        std::string_view backend, std::string_view sender, std::string_view text);

    /**
     * @brief As handle_incoming(), also reporting replies and veto
     */
    [[nodiscard]] std::expected<dispatch::inbound_result, router_error>
    process_incoming(std::string_view backend, std::string_view sender,
                     std::string_view text);

    /**
     * @brief Send a message not produced by inbound dispatch
     *
     * A connection without an identifier is resolved (or created) by
     * backend and identity first.
     *
     * @return Outbound message: sent, queued or cancelled
     */
    [[nodiscard]] std::expected<core::message_record, router_error> send_outgoing(
        const core::connection& connection, std::string_view text,
        std::optional<core::message_id> source = std::nullopt,
        core::param_map params = {});

    /**
     * @brief Record that the backend delivered a message
     *
     * Idempotent for messages that are already sent.
     */
    [[nodiscard]] std::expected<core::message_record, router_error> mark_sent(
        core::message_id id);

    // =========================================================================
    // Backlog
    // =========================================================================

    /**
     * @brief Queued outbound messages, oldest first
     */
    [[nodiscard]] std::expected<std::vector<core::message_record>, router_error>
    outgoing_backlog();

    /**
     * @brief Attempt delivery of every backlog message once more
     *
     * A message whose attempt fails is logged and counted in
     * retry_summary::failed; the remaining messages are still attempted.
     */
    [[nodiscard]] std::expected<retry_summary, router_error> retry_queued();

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] router_statistics get_statistics() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace sms::relay::router

#endif  // SMS_RELAY_ROUTER_MESSAGE_ROUTER_H
