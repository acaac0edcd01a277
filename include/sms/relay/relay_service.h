#ifndef SMS_RELAY_RELAY_SERVICE_H
#define SMS_RELAY_RELAY_SERVICE_H

/**
 * @file relay_service.h
 * @brief Assembles a running relay from configuration
 *
 * Wires together the message store, the handler registry (with the
 * built-in handlers registered), the gateway delivery client and the
 * message router, and applies the configured log level.
 *
 * @example
 * ```cpp
 * auto service = relay_service::create_from_file("/etc/sms_relay/config.yaml");
 * if (!service) {
 *     std::cerr << to_string(service.error()) << std::endl;
 *     return 1;
 * }
 * auto message = (*service)->get_router().handle_incoming("carrier", "+1555", "hi");
 * ```
 */

#include "sms/relay/config/config_loader.h"
#include "sms/relay/config/relay_config.h"
#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/handler/handler_registry.h"
#include "sms/relay/router/message_router.h"
#include "sms/relay/storage/message_store.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

namespace sms::relay {

// =============================================================================
// Service Error Codes (-800 to -809)
// =============================================================================

/**
 * @brief Relay service specific error codes
 *
 * Allocated range: -800 to -809
 */
enum class service_error : int {
    /** Configuration failed validation */
    invalid_configuration = -800,

    /** Configuration file could not be loaded */
    config_load_failed = -801,

    /** Message store could not be opened */
    store_open_failed = -802
};

[[nodiscard]] constexpr int to_error_code(service_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(service_error error) noexcept {
    switch (error) {
        case service_error::invalid_configuration:
            return "Invalid configuration";
        case service_error::config_load_failed:
            return "Failed to load configuration";
        case service_error::store_open_failed:
            return "Failed to open message store";
        default:
            return "Unknown service error";
    }
}

class relay_service {
public:
    /**
     * @brief Build a service from an in-memory configuration
     *
     * @param config Validated configuration
     * @param registry Handler registry; a new one with the built-in
     *                 handlers when null
     * @param http HTTP transport for the gateway; Boost.Beast when null
     */
    [[nodiscard]] static std::expected<std::unique_ptr<relay_service>, service_error>
    create(const config::relay_config& config,
           std::shared_ptr<handler::handler_registry> registry = nullptr,
           std::unique_ptr<delivery::http_client_adapter> http = nullptr);

    /**
     * @brief Load configuration from @p path and build a service
     */
    [[nodiscard]] static std::expected<std::unique_ptr<relay_service>, service_error>
    create_from_file(const std::filesystem::path& path);

    ~relay_service();

    relay_service(const relay_service&) = delete;
    relay_service& operator=(const relay_service&) = delete;

    [[nodiscard]] router::message_router& get_router() noexcept { return *router_; }

    [[nodiscard]] const config::relay_config& config() const noexcept { return config_; }

    [[nodiscard]] std::string_view name() const noexcept { return config_.server.name; }

    [[nodiscard]] const storage::store_handles& store() const noexcept { return store_; }

    [[nodiscard]] handler::handler_registry& registry() noexcept { return *registry_; }

private:
    relay_service(config::relay_config config, storage::store_handles store,
                  std::shared_ptr<handler::handler_registry> registry,
                  std::shared_ptr<delivery::delivery_client> delivery);

    config::relay_config config_;
    storage::store_handles store_;
    std::shared_ptr<handler::handler_registry> registry_;
    std::shared_ptr<delivery::delivery_client> delivery_;
    std::unique_ptr<router::message_router> router_;
};

}  // namespace sms::relay

#endif  // SMS_RELAY_RELAY_SERVICE_H
