/**
 * @file dispatch_engine.cpp
 * @brief Dispatch engine implementation
 */

#include "sms/relay/dispatch/dispatch_engine.h"

#include "sms/relay/integration/logger_adapter.h"

#include <optional>
#include <string>

namespace sms::relay::dispatch {

namespace {

using handler::handler_phase;
using handler::message_handler;
using handler::send_decision;

std::string log_prefix(core::message_id id, handler_phase phase,
                       std::string_view handler_name) {
    std::string line = "[Dispatch] msg_id=" + std::to_string(id) +
                       " phase=" + to_string(phase);
    if (!handler_name.empty()) {
        line += " handler=";
        line += handler_name;
    }
    return line;
}

void notify_exception(message_handler& handler, handler_phase phase,
                      core::message_id id, const std::exception& error) {
    try {
        handler.on_exception(phase, error);
    } catch (const std::exception& hook_error) {
        integration::get_logger().error(log_prefix(id, phase, handler.name()) +
                                        " exception hook raised: " +
                                        hook_error.what());
    }
}

/**
 * @brief Invoke one handler method, isolating std::exception failures
 *
 * @return Method result, or nullopt if it threw
 */
template <typename Result, typename Fn>
std::optional<Result> invoke_isolated(message_handler& handler, handler_phase phase,
                                      core::message_id id, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        integration::get_logger().error(log_prefix(id, phase, handler.name()) +
                                        " raised: " + e.what());
        notify_exception(handler, phase, id, e);
        return std::nullopt;
    }
}

bool call_inbound(message_handler& handler, handler_phase phase,
                  core::incoming_message& message) {
    switch (phase) {
        case handler_phase::filter:
            return handler.filter(message);
        case handler_phase::parse:
            return handler.parse(message);
        case handler_phase::handle:
            return handler.handle(message);
        case handler_phase::default_phase:
            return handler.default_phase(message);
        case handler_phase::cleanup:
            return handler.cleanup(message);
        default:
            return false;
    }
}

}  // namespace

dispatch_error from_store_error(storage::store_error error) noexcept {
    switch (error) {
        case storage::store_error::invalid_transition:
            return dispatch_error::invalid_transition;
        case storage::store_error::message_not_found:
            return dispatch_error::message_not_found;
        default:
            return dispatch_error::store_failed;
    }
}

dispatch_engine::dispatch_engine(const handler::handler_chain& chain,
                                 std::shared_ptr<storage::message_store> store,
                                 std::shared_ptr<delivery::delivery_client> delivery)
    : chain_(chain), store_(std::move(store)), delivery_(std::move(delivery)) {}

// =============================================================================
// Inbound
// =============================================================================

phase_control dispatch_engine::run_phase(handler_phase phase,
                                         core::incoming_message& message,
                                         size_t& faults) {
    auto& logger = integration::get_logger();
    const auto id = message.record().id;

    if (phase == handler_phase::default_phase && message.handled()) {
        return phase_control::proceed;
    }

    for (const auto& handler : chain_.handlers()) {
        auto result = invoke_isolated<bool>(*handler, phase, id, [&] {
            return call_inbound(*handler, phase, message);
        });
        if (!result) {
            ++faults;
            continue;
        }
        if (!*result) {
            continue;
        }

        switch (phase) {
            case handler_phase::filter:
                logger.info(log_prefix(id, phase, handler->name()) +
                            " message vetoed");
                return phase_control::abort;
            case handler_phase::handle:
                message.mark_handled();
                logger.debug(log_prefix(id, phase, handler->name()) +
                             " message handled");
                return phase_control::proceed;
            case handler_phase::default_phase:
                logger.debug(log_prefix(id, phase, handler->name()) +
                             " default response given");
                return phase_control::proceed;
            default:
                break;
        }
    }
    return phase_control::proceed;
}

std::expected<inbound_result, dispatch_error> dispatch_engine::run_inbound(
    core::incoming_message& message) {
    auto& logger = integration::get_logger();
    const auto& record = message.record();
    if (record.direction != core::message_direction::inbound ||
        record.status != core::message_status::received) {
        return std::unexpected(dispatch_error::invalid_message);
    }

    ++stats_.inbound_messages;
    logger.debug("[Dispatch] msg_id=" + std::to_string(record.id) +
                 " inbound from " + core::to_string(record.connection));

    inbound_result result;
    size_t faults = 0;

    constexpr handler_phase phases[] = {
        handler_phase::filter, handler_phase::parse, handler_phase::handle,
        handler_phase::default_phase, handler_phase::cleanup};

    for (auto phase : phases) {
        if (run_phase(phase, message, faults) == phase_control::abort) {
            result.vetoed = true;
            break;
        }
    }

    if (result.vetoed) {
        ++stats_.vetoed_messages;
    }
    stats_.handler_faults += faults;
    result.handler_faults = faults;

    auto finalized = store_->update_status(message.record().id,
                                           core::message_status::handled);
    if (!finalized) {
        logger.error("[Dispatch] msg_id=" + std::to_string(message.record().id) +
                     " failed to persist handled status: " +
                     storage::to_string(finalized.error()));
        return std::unexpected(from_store_error(finalized.error()));
    }
    message.update_record(*finalized);
    result.message = std::move(*finalized);

    // A reply that cannot be persisted does not stop the ones behind it
    while (auto reply = message.pop_response()) {
        auto target = core::to_string(reply->connection);
        auto sent = run_outbound(std::move(*reply));
        if (!sent) {
            ++result.failed_replies;
            logger.error("[Dispatch] msg_id=" + std::to_string(result.message.id) +
                         " reply to " + target + " dropped: " +
                         to_string(sent.error()));
            continue;
        }
        result.replies.push_back(std::move(*sent));
    }

    logger.info("[Dispatch] msg_id=" + std::to_string(result.message.id) +
                " inbound complete handled=" + (message.handled() ? "true" : "false") +
                " vetoed=" + (result.vetoed ? "true" : "false") +
                " replies=" + std::to_string(result.replies.size()) +
                (result.failed_replies ? " failed_replies=" +
                                             std::to_string(result.failed_replies)
                                       : ""));
    return result;
}

// =============================================================================
// Outbound
// =============================================================================

std::expected<core::message_record, dispatch_error> dispatch_engine::run_outbound(
    core::outgoing_message reply) {
    auto& logger = integration::get_logger();

    core::new_message fields;
    fields.connection = reply.connection;
    fields.text = reply.text;
    fields.direction = core::message_direction::outbound;
    fields.status = core::message_status::pending;
    fields.in_response_to = reply.in_response_to;
    fields.params = reply.params;

    auto created = store_->create_message(fields);
    if (!created) {
        logger.error("[Dispatch] failed to persist outbound message to " +
                     core::to_string(reply.connection) + ": " +
                     storage::to_string(created.error()));
        return std::unexpected(from_store_error(created.error()));
    }
    ++stats_.outbound_messages;

    const auto id = created->id;
    const auto& handlers = chain_.handlers();
    for (auto it = handlers.rbegin(); it != handlers.rend(); ++it) {
        auto& handler = **it;
        auto decision = invoke_isolated<send_decision>(
            handler, handler_phase::outgoing, id,
            [&] { return handler.outgoing(reply); });
        if (!decision) {
            ++stats_.handler_faults;
            continue;
        }
        if (*decision == send_decision::cancel) {
            logger.info(log_prefix(id, handler_phase::outgoing, handler.name()) +
                        " message cancelled");
            auto cancelled = store_->update_status(id, core::message_status::cancelled);
            if (!cancelled) {
                return std::unexpected(from_store_error(cancelled.error()));
            }
            ++stats_.cancelled_messages;
            return std::move(*cancelled);
        }
    }

    // Retries must send what the outgoing handlers produced
    if (reply.text != created->text || reply.params != created->params) {
        auto rewritten = store_->update_payload(id, reply.text, reply.params);
        if (!rewritten) {
            logger.error("[Dispatch] msg_id=" + std::to_string(id) +
                         " failed to persist outgoing text: " +
                         storage::to_string(rewritten.error()));
            return std::unexpected(from_store_error(rewritten.error()));
        }
        created = std::move(rewritten);
    }
    return deliver(*created);
}

std::expected<core::message_record, dispatch_error> dispatch_engine::redeliver(
    const core::message_record& message) {
    if (message.direction != core::message_direction::outbound ||
        message.status != core::message_status::queued) {
        return std::unexpected(dispatch_error::invalid_transition);
    }
    return deliver(message);
}

std::expected<core::message_record, dispatch_error> dispatch_engine::deliver(
    const core::message_record& record) {
    auto& logger = integration::get_logger();

    delivery::delivery_result outcome;
    if (delivery_) {
        outcome = delivery_->deliver(record, record.params);
    } else {
        outcome = delivery::delivery_result::queued(
            delivery::delivery_failure::not_configured, "No delivery client");
    }

    auto status = outcome.is_sent() ? core::message_status::sent
                                    : core::message_status::queued;
    auto updated = store_->update_status(record.id, status);
    if (!updated) {
        logger.error("[Dispatch] msg_id=" + std::to_string(record.id) +
                     " failed to persist " + core::to_string(status) +
                     " status: " + storage::to_string(updated.error()));
        return std::unexpected(from_store_error(updated.error()));
    }

    if (outcome.is_sent()) {
        ++stats_.sent_messages;
        logger.info("[Dispatch] msg_id=" + std::to_string(record.id) + " sent to " +
                    core::to_string(record.connection));
    } else {
        ++stats_.queued_messages;
        logger.warning("[Dispatch] msg_id=" + std::to_string(record.id) +
                       " queued reason=" + delivery::to_string(outcome.failure) +
                       (outcome.error_message.empty() ? "" : " error=" + outcome.error_message));
    }
    return std::move(*updated);
}

// =============================================================================
// Statistics
// =============================================================================

dispatch_statistics dispatch_engine::get_statistics() const noexcept {
    dispatch_statistics snapshot;
    snapshot.inbound_messages = stats_.inbound_messages.load();
    snapshot.vetoed_messages = stats_.vetoed_messages.load();
    snapshot.handler_faults = stats_.handler_faults.load();
    snapshot.outbound_messages = stats_.outbound_messages.load();
    snapshot.sent_messages = stats_.sent_messages.load();
    snapshot.queued_messages = stats_.queued_messages.load();
    snapshot.cancelled_messages = stats_.cancelled_messages.load();
    return snapshot;
}

void dispatch_engine::reset_statistics() noexcept {
    stats_.inbound_messages = 0;
    stats_.vetoed_messages = 0;
    stats_.handler_faults = 0;
    stats_.outbound_messages = 0;
    stats_.sent_messages = 0;
    stats_.queued_messages = 0;
    stats_.cancelled_messages = 0;
}

}  // namespace sms::relay::dispatch
