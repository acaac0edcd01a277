#ifndef SMS_RELAY_HANDLER_HANDLER_REGISTRY_H
#define SMS_RELAY_HANDLER_HANDLER_REGISTRY_H

/**
 * @file handler_registry.h
 * @brief Name to factory map used to build the handler chain at startup
 *
 * Handler names come from configuration. Each factory receives the
 * per-handler settings map (handler_options.<name>.* in the YAML file).
 *
 * @example
 * ```cpp
 * handler_registry registry;
 * register_builtin_handlers(registry);
 * registry.register_factory("ping", [](const handler_settings&) {
 *     return std::make_unique<ping_handler>();
 * });
 *
 * auto handler = registry.instantiate("echo", {{"prefix", "re: "}});
 * ```
 */

#include "sms/relay/handler/handler_base.h"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sms::relay::handler {

// =============================================================================
// Registry Error Codes (-890 to -899)
// =============================================================================

/**
 * @brief Handler registry specific error codes
 *
 * Allocated range: -890 to -899
 */
enum class registry_error : int {
    /** No factory registered under the name */
    not_found = -890,

    /** Factory already registered under the name */
    already_registered = -891,

    /** Empty name or empty factory */
    invalid_factory = -892,

    /** Factory returned no handler */
    factory_returned_null = -893,

    /** Factory threw while building the handler */
    factory_failed = -894
};

[[nodiscard]] constexpr int to_error_code(registry_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(registry_error error) noexcept {
    switch (error) {
        case registry_error::not_found:
            return "Handler not found";
        case registry_error::already_registered:
            return "Handler factory already registered";
        case registry_error::invalid_factory:
            return "Invalid handler factory";
        case registry_error::factory_returned_null:
            return "Handler factory returned null";
        case registry_error::factory_failed:
            return "Handler factory failed";
        default:
            return "Unknown registry error";
    }
}

/** Per-handler configuration values */
using handler_settings = std::map<std::string, std::string>;

/** Builds one handler instance */
using handler_factory =
    std::function<std::unique_ptr<message_handler>(const handler_settings&)>;

/**
 * @brief Thread-safe registry of handler factories
 */
class handler_registry {
public:
    handler_registry() = default;

    handler_registry(const handler_registry&) = delete;
    handler_registry& operator=(const handler_registry&) = delete;

    /**
     * @brief Register a factory under @p name
     *
     * @return already_registered if the name is taken
     */
    [[nodiscard]] std::expected<void, registry_error> register_factory(
        std::string name, handler_factory factory);

    bool unregister_factory(std::string_view name);

    /**
     * @brief Build a handler by name
     *
     * The factory runs outside the registry lock.
     */
    [[nodiscard]] std::expected<std::unique_ptr<message_handler>, registry_error>
    instantiate(std::string_view name, const handler_settings& settings = {}) const;

    [[nodiscard]] bool has_factory(std::string_view name) const;

    /**
     * @brief Registered names, sorted
     */
    [[nodiscard]] std::vector<std::string> registered_names() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, handler_factory, std::less<>> factories_;
};

/**
 * @brief Register the echo, blocklist and default_reply handlers
 */
void register_builtin_handlers(handler_registry& registry);

}  // namespace sms::relay::handler

#endif  // SMS_RELAY_HANDLER_HANDLER_REGISTRY_H
