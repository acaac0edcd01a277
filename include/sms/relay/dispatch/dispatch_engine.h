#ifndef SMS_RELAY_DISPATCH_DISPATCH_ENGINE_H
#define SMS_RELAY_DISPATCH_DISPATCH_ENGINE_H

/**
 * @file dispatch_engine.h
 * @brief Phased execution of the handler chain
 *
 * Inbound dispatch runs filter, parse, handle, default and cleanup over the
 * chain in registration order:
 *   - filter: the first handler returning true vetoes the message; every
 *     later phase is skipped
 *   - parse, cleanup: every handler runs
 *   - handle: the first handler returning true marks the message handled
 *     and ends the phase
 *   - default: runs only for unhandled messages; the first handler
 *     returning true ends the phase
 *
 * The message is then persisted as handled and each queued reply goes
 * through outbound dispatch, one at a time, oldest first. A reply whose
 * outbound dispatch fails is logged and counted; the rest are still sent.
 *
 * Outbound dispatch persists a pending message, runs the outgoing phase in
 * reverse registration order, and then either cancels the message or hands
 * it to the delivery client (sent on success, queued otherwise). Text and
 * gateway parameters rewritten by outgoing handlers are persisted before
 * the first attempt, so a redelivery sends the same request.
 *
 * A handler method that throws is logged, reported to that handler's
 * on_exception() and treated as "not handled" / "proceed". Store failures
 * are not isolated and surface as dispatch_error.
 *
 * Dispatch runs on the caller's thread. The engine holds no lock while
 * handlers run; concurrent dispatches share only the store, the delivery
 * client and the statistics counters.
 */

#include "sms/relay/core/envelope.h"
#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/handler/handler_chain.h"
#include "sms/relay/storage/message_store.h"

#include <atomic>
#include <expected>
#include <memory>
#include <vector>

namespace sms::relay::dispatch {

// =============================================================================
// Dispatch Error Codes (-940 to -949)
// =============================================================================

/**
 * @brief Dispatch engine specific error codes
 *
 * Allocated range: -940 to -949
 */
enum class dispatch_error : int {
    /** Message store reported a failure */
    store_failed = -940,

    /** Store rejected a status change */
    invalid_transition = -941,

    /** Referenced message does not exist */
    message_not_found = -942,

    /** Inbound envelope is not backed by a received inbound message */
    invalid_message = -943
};

[[nodiscard]] constexpr int to_error_code(dispatch_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(dispatch_error error) noexcept {
    switch (error) {
        case dispatch_error::store_failed:
            return "Message store operation failed";
        case dispatch_error::invalid_transition:
            return "Status transition rejected by store";
        case dispatch_error::message_not_found:
            return "Message not found";
        case dispatch_error::invalid_message:
            return "Invalid inbound message";
        default:
            return "Unknown dispatch error";
    }
}

/**
 * @brief Whether the phase loop continues after a phase
 */
enum class phase_control {
    proceed,
    abort
};

/**
 * @brief Outcome of inbound dispatch
 */
struct inbound_result {
    /** Inbound message after finalization (status handled) */
    core::message_record message;

    /** Outbound messages produced from the replies, in send order */
    std::vector<core::message_record> replies;

    /** A filter handler vetoed the message */
    bool vetoed = false;

    /** Handler exceptions isolated during this dispatch */
    size_t handler_faults = 0;

    /** Replies dropped because they could not be persisted */
    size_t failed_replies = 0;
};

/**
 * @brief Dispatch counters
 */
struct dispatch_statistics {
    size_t inbound_messages = 0;
    size_t vetoed_messages = 0;
    size_t handler_faults = 0;
    size_t outbound_messages = 0;
    size_t sent_messages = 0;
    size_t queued_messages = 0;
    size_t cancelled_messages = 0;
};

class dispatch_engine {
public:
    /**
     * @param chain Sealed handler chain; must outlive the engine
     * @param store Message persistence
     * @param delivery Gateway transport
     */
    dispatch_engine(const handler::handler_chain& chain,
                    std::shared_ptr<storage::message_store> store,
                    std::shared_ptr<delivery::delivery_client> delivery);

    dispatch_engine(const dispatch_engine&) = delete;
    dispatch_engine& operator=(const dispatch_engine&) = delete;

    /**
     * @brief Run the inbound phases and send the resulting replies
     *
     * @param message Envelope around a persisted received inbound message
     */
    [[nodiscard]] std::expected<inbound_result, dispatch_error> run_inbound(
        core::incoming_message& message);

    /**
     * @brief Persist, run the outgoing phase and deliver one message
     *
     * The source message, if any, is @p reply.in_response_to.
     *
     * @return Final record: sent, queued or cancelled
     */
    [[nodiscard]] std::expected<core::message_record, dispatch_error> run_outbound(
        core::outgoing_message reply);

    /**
     * @brief Deliver a queued message again without re-running handlers
     *
     * Sends the persisted text and gateway parameters.
     *
     * @return Final record: sent or still queued
     */
    [[nodiscard]] std::expected<core::message_record, dispatch_error> redeliver(
        const core::message_record& message);

    [[nodiscard]] dispatch_statistics get_statistics() const noexcept;

    void reset_statistics() noexcept;

private:
    struct counters {
        std::atomic<size_t> inbound_messages{0};
        std::atomic<size_t> vetoed_messages{0};
        std::atomic<size_t> handler_faults{0};
        std::atomic<size_t> outbound_messages{0};
        std::atomic<size_t> sent_messages{0};
        std::atomic<size_t> queued_messages{0};
        std::atomic<size_t> cancelled_messages{0};
    };

    phase_control run_phase(handler::handler_phase phase,
                            core::incoming_message& message,
                            size_t& faults);

    std::expected<core::message_record, dispatch_error> deliver(
        const core::message_record& record);

    const handler::handler_chain& chain_;
    std::shared_ptr<storage::message_store> store_;
    std::shared_ptr<delivery::delivery_client> delivery_;
    counters stats_;
};

/**
 * @brief Map a store error to the dispatch error reported to callers
 */
[[nodiscard]] dispatch_error from_store_error(storage::store_error error) noexcept;

}  // namespace sms::relay::dispatch

#endif  // SMS_RELAY_DISPATCH_DISPATCH_ENGINE_H
