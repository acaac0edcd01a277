/**
 * @file handler_registry.cpp
 * @brief Handler registry implementation
 */

#include "sms/relay/handler/handler_registry.h"

#include "sms/relay/handlers/blocklist_handler.h"
#include "sms/relay/handlers/default_reply_handler.h"
#include "sms/relay/handlers/echo_handler.h"
#include "sms/relay/integration/logger_adapter.h"

namespace sms::relay::handler {

// =============================================================================
// Factory Registration
// =============================================================================

std::expected<void, registry_error> handler_registry::register_factory(
    std::string name, handler_factory factory) {
    if (name.empty() || !factory) {
        return std::unexpected(registry_error::invalid_factory);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (factories_.contains(name)) {
        return std::unexpected(registry_error::already_registered);
    }

    factories_.emplace(std::move(name), std::move(factory));
    return {};
}

bool handler_registry::unregister_factory(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return false;
    }
    factories_.erase(it);
    return true;
}

bool handler_registry::has_factory(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> handler_registry::registered_names() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    return names;
}

size_t handler_registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.size();
}

// =============================================================================
// Instantiation
// =============================================================================

std::expected<std::unique_ptr<message_handler>, registry_error>
handler_registry::instantiate(std::string_view name,
                              const handler_settings& settings) const {
    handler_factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            return std::unexpected(registry_error::not_found);
        }
        factory = it->second;
    }

    std::unique_ptr<message_handler> handler;
    try {
        handler = factory(settings);
    } catch (const std::exception& e) {
        integration::get_logger().error("[Registry] factory for handler=" +
                                        std::string(name) + " threw: " + e.what());
        return std::unexpected(registry_error::factory_failed);
    }

    if (!handler) {
        return std::unexpected(registry_error::factory_returned_null);
    }
    return handler;
}

// =============================================================================
// Built-in Handlers
// =============================================================================

void register_builtin_handlers(handler_registry& registry) {
    auto register_one = [&registry](std::string name, handler_factory factory) {
        auto result = registry.register_factory(name, std::move(factory));
        if (!result && result.error() != registry_error::already_registered) {
            integration::get_logger().warning(
                "[Registry] failed to register built-in handler=" + name + ": " +
                to_string(result.error()));
        }
    };

    register_one(std::string(handlers::echo_handler::handler_name),
                 [](const handler_settings& settings) {
                     return std::make_unique<handlers::echo_handler>(settings);
                 });
    register_one(std::string(handlers::blocklist_handler::handler_name),
                 [](const handler_settings& settings) {
                     return std::make_unique<handlers::blocklist_handler>(settings);
                 });
    register_one(std::string(handlers::default_reply_handler::handler_name),
                 [](const handler_settings& settings) {
                     return std::make_unique<handlers::default_reply_handler>(settings);
                 });
}

}  // namespace sms::relay::handler
