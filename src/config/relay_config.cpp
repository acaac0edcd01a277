/**
 * @file relay_config.cpp
 * @brief Configuration validation
 */

#include "sms/relay/config/relay_config.h"

#include <filesystem>
#include <set>

namespace sms::relay::config {

std::vector<validation_error_info> relay_config::validate() const {
    std::vector<validation_error_info> errors;

    if (server.name.empty()) {
        errors.push_back({"server.name", "Server name is required", std::nullopt,
                          "non-empty string"});
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < routing.handlers.size(); ++i) {
        const auto& name = routing.handlers[i];
        auto path = "router.handlers." + std::to_string(i);
        if (name.empty()) {
            errors.push_back({path, "Handler name is empty", name, "handler name"});
        } else if (!seen.insert(name).second) {
            errors.push_back({path, "Handler listed more than once", name,
                              "unique handler names"});
        }
    }

    for (const auto& [name, _] : handler_options) {
        if (!seen.contains(name)) {
            errors.push_back({"handler_options." + name,
                              "Options given for a handler that is not loaded",
                              name, "a name listed in router.handlers"});
        }
    }

    if (!delivery.gateway_url.empty() &&
        !delivery.gateway_url.starts_with("http://") &&
        !delivery.gateway_url.starts_with("https://")) {
        errors.push_back({"delivery.gateway_url", "Unsupported gateway URL scheme",
                          delivery.gateway_url, "http://... or https://..."});
    }

    if (!delivery.ca_file.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(delivery.ca_file, ec)) {
            errors.push_back({"delivery.ca_file", "CA bundle not found",
                              delivery.ca_file, "readable PEM file"});
        }
    }

    if (delivery.timeout.count() <= 0) {
        errors.push_back({"delivery.timeout", "Timeout must be positive",
                          std::to_string(delivery.timeout.count()) + "ms",
                          "> 0"});
    }

    if (store.type == storage::store_type::sqlite && store.database_path.empty()) {
        errors.push_back({"storage.database_path",
                          "Database path is required for sqlite storage", std::nullopt,
                          "file path"});
    }

    return errors;
}

router::router_config relay_config::to_router_config() const {
    router::router_config config;
    config.handler_names = routing.handlers;
    for (const auto& [name, options] : handler_options) {
        config.handler_options[name] = options;
    }
    return config;
}

delivery::gateway_config relay_config::to_gateway_config() const {
    delivery::gateway_config config;
    config.url = delivery.gateway_url;
    config.timeout = delivery.timeout;
    config.tls.verify_peer = delivery.verify_tls;
    config.tls.ca_file = delivery.ca_file;
    return config;
}

}  // namespace sms::relay::config
