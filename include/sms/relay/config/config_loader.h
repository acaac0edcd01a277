#ifndef SMS_RELAY_CONFIG_CONFIG_LOADER_H
#define SMS_RELAY_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief Loads relay_config from YAML files or strings
 *
 * The accepted YAML is the subset a relay configuration needs: nested
 * maps, scalar sequences in block or flow form, quoted scalars and
 * comments. Every scalar goes through environment expansion before it is
 * interpreted:
 *   - ${VAR}             value of VAR; env_var_not_found when unset
 *   - ${VAR:-fallback}   value of VAR, or fallback when unset
 *
 * @example
 * ```cpp
 * auto config = config_loader::load("/etc/sms_relay/sms_relay.yaml");
 * if (!config) {
 *     std::cerr << config.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto router_settings = config->to_router_config();
 * ```
 */

#include "sms/relay/config/relay_config.h"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace sms::relay::config {

/**
 * @brief Why a configuration could not be loaded, and where
 */
struct config_load_error {
    config_error code;
    std::string message;

    /** Set when loading from a file */
    std::optional<std::filesystem::path> file_path;

    /** 1-based source line for syntax and environment errors */
    std::optional<size_t> line_number;

    /** Every rejected field, for validation_error */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Message, location and one line per rejected field
     */
    [[nodiscard]] std::string to_string() const;
};

using config_result = std::expected<relay_config, config_load_error>;

class config_loader {
public:
    /**
     * @brief Load a .yaml or .yml file; other extensions are invalid_format
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_yaml(const std::filesystem::path& path);

    /**
     * @brief Parse, expand and validate YAML text
     *
     * Blank or comment-only text is empty_config. Unknown keys are ignored.
     */
    [[nodiscard]] static config_result load_yaml_string(std::string_view yaml_content);

    [[nodiscard]] static std::vector<validation_error_info> validate(
        const relay_config& config);

    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    /**
     * @brief True when @p value holds a complete ${...} reference
     */
    [[nodiscard]] static bool needs_env_expansion(std::string_view value);

    [[nodiscard]] static relay_config get_default_config();

    config_loader() = delete;
};

}  // namespace sms::relay::config

#endif  // SMS_RELAY_CONFIG_CONFIG_LOADER_H
