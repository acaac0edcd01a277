#ifndef SMS_RELAY_CONFIG_RELAY_CONFIG_H
#define SMS_RELAY_CONFIG_RELAY_CONFIG_H

/**
 * @file relay_config.h
 * @brief Configuration data structures for the SMS relay
 *
 * Sections:
 *   - server:          instance name
 *   - router:          handler chain order
 *   - handler_options: per-handler settings
 *   - delivery:        gateway URL template and timeout
 *   - storage:         message store backend
 *   - logging:         log level
 */

#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/integration/logger_adapter.h"
#include "sms/relay/router/message_router.h"
#include "sms/relay/storage/message_store.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sms::relay::config {

// =============================================================================
// Error Codes (-750 to -759)
// =============================================================================

enum class config_error : int {
    file_not_found = -750,

    /** YAML syntax the loader does not accept */
    parse_error = -751,

    /** One or more fields rejected; see config_load_error::validation_errors */
    validation_error = -752,

    /** ${VAR} without a fallback and VAR unset */
    env_var_not_found = -755,

    /** Not a .yaml or .yml file */
    invalid_format = -756,

    /** Nothing but blank lines and comments */
    empty_config = -757,

    io_error = -758
};

[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Configuration file not found";
        case config_error::parse_error:
            return "Malformed configuration";
        case config_error::validation_error:
            return "Configuration rejected by validation";
        case config_error::env_var_not_found:
            return "Referenced environment variable is not set";
        case config_error::invalid_format:
            return "Unsupported configuration file type";
        case config_error::empty_config:
            return "Configuration has no settings";
        case config_error::io_error:
            return "Configuration file could not be read";
        default:
            return "Unknown configuration error";
    }
}

/**
 * @brief A rejected field
 */
struct validation_error_info {
    /** Dotted key, e.g. "delivery.timeout" or "router.handlers.1" */
    std::string field_path;

    std::string message;

    /** Value as written in the configuration */
    std::optional<std::string> actual_value;

    /** What would have been accepted */
    std::optional<std::string> expected;
};

// =============================================================================
// Sections
// =============================================================================

struct server_config {
    std::string name = "SMS_RELAY";
};

struct routing_config {
    /** Handler names in chain order */
    std::vector<std::string> handlers;
};

struct delivery_config {
    /** Gateway URL template; empty leaves every message queued */
    std::string gateway_url;

    std::chrono::milliseconds timeout{std::chrono::seconds{10}};

    /** https:// gateways: verify the server certificate */
    bool verify_tls = true;

    /** https:// gateways: trusted CA bundle; the system store when empty */
    std::string ca_file;
};

struct logging_config {
    integration::log_level level = integration::log_level::info;
};

/**
 * @brief Complete relay configuration
 */
struct relay_config {
    server_config server;
    routing_config routing;

    /** handler_options.<handler>.<key> */
    std::map<std::string, std::map<std::string, std::string>> handler_options;

    delivery_config delivery;
    storage::store_config store;
    logging_config logging;

    /**
     * @brief Check every section, collecting all failures
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    [[nodiscard]] bool is_valid() const { return validate().empty(); }

    /**
     * @brief Router settings derived from this configuration
     */
    [[nodiscard]] router::router_config to_router_config() const;

    /**
     * @brief Gateway settings derived from this configuration
     */
    [[nodiscard]] delivery::gateway_config to_gateway_config() const;
};

}  // namespace sms::relay::config

#endif  // SMS_RELAY_CONFIG_RELAY_CONFIG_H
