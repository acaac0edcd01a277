/**
 * @file relay_service.cpp
 * @brief Relay service assembly
 */

#include "sms/relay/relay_service.h"

#include "sms/relay/integration/logger_adapter.h"

namespace sms::relay {

std::expected<std::unique_ptr<relay_service>, service_error> relay_service::create(
    const config::relay_config& config,
    std::shared_ptr<handler::handler_registry> registry,
    std::unique_ptr<delivery::http_client_adapter> http) {
    auto& logger = integration::get_logger();

    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto& error : errors) {
            logger.error("[Service] invalid configuration " + error.field_path + ": " +
                         error.message);
        }
        return std::unexpected(service_error::invalid_configuration);
    }

    logger.set_level(config.logging.level);

    auto store = storage::open_store(config.store);
    if (!store) {
        logger.error(std::string("[Service] cannot open ") +
                     storage::to_string(config.store.type) +
                     " store: " + storage::to_string(store.error()));
        return std::unexpected(service_error::store_open_failed);
    }

    if (!registry) {
        registry = std::make_shared<handler::handler_registry>();
        handler::register_builtin_handlers(*registry);
    }

    auto delivery = std::make_shared<delivery::gateway_delivery_client>(
        config.to_gateway_config(), std::move(http));
    if (!config.delivery.gateway_url.empty()) {
        logger.info("[Service] gateway configured timeout_ms=" +
                    std::to_string(config.delivery.timeout.count()));
    } else {
        logger.warning("[Service] no gateway configured; outbound messages will queue");
    }

    return std::unique_ptr<relay_service>(
        new relay_service(config, std::move(*store), std::move(registry),
                          std::move(delivery)));
}

std::expected<std::unique_ptr<relay_service>, service_error>
relay_service::create_from_file(const std::filesystem::path& path) {
    auto loaded = config::config_loader::load(path);
    if (!loaded) {
        integration::get_logger().error("[Service] " + loaded.error().to_string());
        return std::unexpected(loaded.error().code == config::config_error::validation_error
                                   ? service_error::invalid_configuration
                                   : service_error::config_load_failed);
    }
    return create(*loaded);
}

relay_service::relay_service(config::relay_config config, storage::store_handles store,
                             std::shared_ptr<handler::handler_registry> registry,
                             std::shared_ptr<delivery::delivery_client> delivery)
    : config_(std::move(config)),
      store_(std::move(store)),
      registry_(std::move(registry)),
      delivery_(std::move(delivery)),
      router_(std::make_unique<router::message_router>(
          config_.to_router_config(), store_.messages, store_.connections, registry_,
          delivery_)) {}

relay_service::~relay_service() = default;

}  // namespace sms::relay
