/**
 * @file message_router.cpp
 * @brief Message router implementation
 */

#include "sms/relay/router/message_router.h"

#include "sms/relay/core/envelope.h"
#include "sms/relay/handler/handler_chain.h"
#include "sms/relay/integration/logger_adapter.h"

#include <atomic>
#include <mutex>

namespace sms::relay::router {

namespace {

router_error from_store_error(storage::store_error error) noexcept {
    switch (error) {
        case storage::store_error::message_not_found:
            return router_error::message_not_found;
        case storage::store_error::invalid_transition:
            return router_error::invalid_transition;
        case storage::store_error::invalid_message:
            return router_error::invalid_argument;
        default:
            return router_error::store_failed;
    }
}

router_error from_dispatch_error(dispatch::dispatch_error error) noexcept {
    switch (error) {
        case dispatch::dispatch_error::invalid_transition:
            return router_error::invalid_transition;
        case dispatch::dispatch_error::message_not_found:
            return router_error::message_not_found;
        case dispatch::dispatch_error::invalid_message:
            return router_error::invalid_argument;
        default:
            return router_error::store_failed;
    }
}

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

class message_router::impl {
public:
    impl(router_config config, std::shared_ptr<storage::message_store> store,
         std::shared_ptr<storage::connection_resolver> resolver,
         std::shared_ptr<handler::handler_registry> registry,
         std::shared_ptr<delivery::delivery_client> delivery)
        : config_(std::move(config)),
          store_(std::move(store)),
          resolver_(std::move(resolver)),
          registry_(std::move(registry)),
          delivery_(std::move(delivery)) {}

    // =========================================================================
    // Startup
    // =========================================================================

    std::expected<void, router_error> ensure_started() {
        if (started_.load(std::memory_order_acquire)) {
            return {};
        }

        std::lock_guard lock(start_mutex_);
        if (started_.load(std::memory_order_relaxed)) {
            return {};
        }

        auto& logger = integration::get_logger();
        logger.info("[Router] starting with " +
                    std::to_string(config_.handler_names.size()) + " handler(s)");

        if (!store_ || !resolver_ || !registry_) {
            logger.error("[Router] startup failed: missing collaborator");
            return std::unexpected(router_error::startup_failed);
        }

        handler::handler_chain chain;
        for (const auto& name : config_.handler_names) {
            handler::handler_settings settings;
            if (auto it = config_.handler_options.find(name);
                it != config_.handler_options.end()) {
                settings = it->second;
            }

            auto instance = registry_->instantiate(name, settings);
            if (!instance) {
                logger.error("[Router] startup failed: cannot load handler=" + name +
                             ": " + handler::to_string(instance.error()));
                return std::unexpected(
                    instance.error() == handler::registry_error::not_found
                        ? router_error::unknown_handler
                        : router_error::startup_failed);
            }

            try {
                (*instance)->start();
            } catch (const std::exception& e) {
                logger.error("[Router] startup failed: handler=" + name +
                             " start raised: " + e.what());
                return std::unexpected(router_error::handler_start_failed);
            }

            if (auto added = chain.add(std::move(*instance)); !added) {
                logger.error("[Router] startup failed: handler=" + name + ": " +
                             handler::to_string(added.error()));
                return std::unexpected(router_error::startup_failed);
            }
            logger.debug("[Router] loaded handler=" + name);
        }
        chain.seal();

        auto queued = store_->find_by_status(core::message_status::queued);
        if (!queued) {
            logger.error(std::string("[Router] startup failed: backlog load: ") +
                         storage::to_string(queued.error()));
            return std::unexpected(from_store_error(queued.error()));
        }

        chain_ = std::move(chain);
        engine_ = std::make_unique<dispatch::dispatch_engine>(chain_, store_, delivery_);
        {
            std::lock_guard backlog_lock(backlog_mutex_);
            backlog_.clear();
            for (auto& record : *queued) {
                if (record.direction == core::message_direction::outbound) {
                    backlog_.emplace(record.id, std::move(record));
                }
            }
        }

        started_.store(true, std::memory_order_release);
        logger.info("[Router] started backlog=" + std::to_string(backlog_size()));
        return {};
    }

    bool is_started() const noexcept {
        return started_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Entry Points
    // =========================================================================

    std::expected<dispatch::inbound_result, router_error> process_incoming(
        std::string_view backend, std::string_view sender, std::string_view text) {
        if (auto started = ensure_started(); !started) {
            return std::unexpected(started.error());
        }
        if (backend.empty() || sender.empty()) {
            return std::unexpected(router_error::invalid_argument);
        }

        auto conn = resolver_->get_or_create(backend, sender);
        if (!conn) {
            return std::unexpected(from_store_error(conn.error()));
        }

        core::new_message fields;
        fields.connection = *conn;
        fields.text = std::string(text);
        fields.direction = core::message_direction::inbound;
        fields.status = core::message_status::received;

        auto record = store_->create_message(fields);
        if (!record) {
            integration::get_logger().error(
                "[Router] failed to persist inbound message from " +
                core::to_string(*conn) + ": " + storage::to_string(record.error()));
            return std::unexpected(from_store_error(record.error()));
        }

        core::incoming_message envelope(std::move(*record));
        auto result = engine_->run_inbound(envelope);
        if (!result) {
            return std::unexpected(from_dispatch_error(result.error()));
        }

        for (const auto& reply : result->replies) {
            track(reply);
        }
        if (result->failed_replies > 0) {
            integration::get_logger().warning(
                "[Router] msg_id=" + std::to_string(result->message.id) + " " +
                std::to_string(result->failed_replies) + " reply(ies) not persisted");
        }
        return std::move(*result);
    }

    std::expected<core::message_record, router_error> send_outgoing(
        const core::connection& connection, std::string_view text,
        std::optional<core::message_id> source, core::param_map params) {
        if (auto started = ensure_started(); !started) {
            return std::unexpected(started.error());
        }

        core::outgoing_message message;
        message.connection = connection;
        if (message.connection.id <= 0) {
            auto resolved = resolver_->get_or_create(connection.backend,
                                                     connection.identity);
            if (!resolved) {
                return std::unexpected(from_store_error(resolved.error()));
            }
            message.connection = *resolved;
        }
        message.text = std::string(text);
        message.in_response_to = source;
        message.params = std::move(params);

        auto result = engine_->run_outbound(std::move(message));
        if (!result) {
            return std::unexpected(from_dispatch_error(result.error()));
        }
        track(*result);
        return std::move(*result);
    }

    std::expected<core::message_record, router_error> mark_sent(core::message_id id) {
        if (auto started = ensure_started(); !started) {
            return std::unexpected(started.error());
        }

        auto updated = store_->update_status(id, core::message_status::sent);
        if (!updated) {
            integration::get_logger().warning(
                "[Router] msg_id=" + std::to_string(id) + " mark_sent rejected: " +
                storage::to_string(updated.error()));
            return std::unexpected(from_store_error(updated.error()));
        }
        track(*updated);
        integration::get_logger().info("[Router] msg_id=" + std::to_string(id) +
                                       " marked sent");
        return std::move(*updated);
    }

    // =========================================================================
    // Backlog
    // =========================================================================

    std::expected<std::vector<core::message_record>, router_error> outgoing_backlog() {
        if (auto started = ensure_started(); !started) {
            return std::unexpected(started.error());
        }
        return backlog_snapshot();
    }

    std::expected<retry_summary, router_error> retry_queued() {
        if (auto started = ensure_started(); !started) {
            return std::unexpected(started.error());
        }

        retry_summary summary;
        for (const auto& record : backlog_snapshot()) {
            ++summary.attempted;
            auto result = engine_->redeliver(record);
            if (!result) {
                ++summary.failed;
                integration::get_logger().error(
                    "[Router] msg_id=" + std::to_string(record.id) +
                    " retry failed: " + dispatch::to_string(result.error()));
                // Resync with whatever the store now holds for this message
                if (auto current = store_->get_message(record.id)) {
                    track(*current);
                }
                continue;
            }
            track(*result);
            if (result->status == core::message_status::sent) {
                ++summary.sent;
            } else {
                ++summary.still_queued;
            }
        }

        integration::get_logger().info(
            "[Router] retry attempted=" + std::to_string(summary.attempted) +
            " sent=" + std::to_string(summary.sent) +
            " still_queued=" + std::to_string(summary.still_queued) +
            " failed=" + std::to_string(summary.failed));
        return summary;
    }

    router_statistics get_statistics() const {
        router_statistics stats;
        stats.started = is_started();
        if (stats.started) {
            stats.dispatch_stats = engine_->get_statistics();
            stats.handler_count = chain_.size();
        }
        stats.backlog_size = backlog_size();
        return stats;
    }

private:
    /**
     * @brief Keep the backlog in step with a message's latest status
     */
    void track(const core::message_record& record) {
        if (record.direction != core::message_direction::outbound) {
            return;
        }
        std::lock_guard lock(backlog_mutex_);
        if (record.status == core::message_status::queued) {
            backlog_.insert_or_assign(record.id, record);
        } else {
            backlog_.erase(record.id);
        }
    }

    std::vector<core::message_record> backlog_snapshot() const {
        std::lock_guard lock(backlog_mutex_);
        std::vector<core::message_record> snapshot;
        snapshot.reserve(backlog_.size());
        for (const auto& [_, record] : backlog_) {
            snapshot.push_back(record);
        }
        return snapshot;
    }

    size_t backlog_size() const {
        std::lock_guard lock(backlog_mutex_);
        return backlog_.size();
    }

    router_config config_;
    std::shared_ptr<storage::message_store> store_;
    std::shared_ptr<storage::connection_resolver> resolver_;
    std::shared_ptr<handler::handler_registry> registry_;
    std::shared_ptr<delivery::delivery_client> delivery_;

    // Written once under start_mutex_ before started_ is set
    handler::handler_chain chain_;
    std::unique_ptr<dispatch::dispatch_engine> engine_;

    std::mutex start_mutex_;
    std::atomic<bool> started_{false};

    mutable std::mutex backlog_mutex_;
    std::map<core::message_id, core::message_record> backlog_;
};

// =============================================================================
// Public Interface
// =============================================================================

message_router::message_router(router_config config,
                               std::shared_ptr<storage::message_store> store,
                               std::shared_ptr<storage::connection_resolver> resolver,
                               std::shared_ptr<handler::handler_registry> registry,
                               std::shared_ptr<delivery::delivery_client> delivery)
    : pimpl_(std::make_unique<impl>(std::move(config), std::move(store),
                                    std::move(resolver), std::move(registry),
                                    std::move(delivery))) {}

message_router::~message_router() = default;

std::expected<void, router_error> message_router::ensure_started() {
    return pimpl_->ensure_started();
}

bool message_router::is_started() const noexcept {
    return pimpl_->is_started();
}

std::expected<core::message_record, router_error> message_router::handle_incoming(
    std::string_view backend, std::string_view sender, std::string_view text) {
    auto result = pimpl_->process_incoming(backend, sender, text);
    if (!result) {
        return std::unexpected(result.error());
    }
    return std::move(result->message);
}

std::expected<dispatch::inbound_result, router_error> message_router::process_incoming(
    std::string_view backend, std::string_view sender, std::string_view text) {
    return pimpl_->process_incoming(backend, sender, text);
}

std::expected<core::message_record, router_error> message_router::send_outgoing(
    const core::connection& connection, std::string_view text,
    std::optional<core::message_id> source, core::param_map params) {
    return pimpl_->send_outgoing(connection, text, source, std::move(params));
}

std::expected<core::message_record, router_error> message_router::mark_sent(
    core::message_id id) {
    return pimpl_->mark_sent(id);
}

std::expected<std::vector<core::message_record>, router_error>
message_router::outgoing_backlog() {
    return pimpl_->outgoing_backlog();
}

std::expected<retry_summary, router_error> message_router::retry_queued() {
    return pimpl_->retry_queued();
}

router_statistics message_router::get_statistics() const {
    return pimpl_->get_statistics();
}

}  // namespace sms::relay::router
