/**
 * @file config_loader.cpp
 * @brief Implementation of configuration file loading and parsing
 *
 * Uses a small parser for the YAML subset the relay needs: nested maps,
 * block sequences of scalars, flow sequences of scalars, quoted strings
 * and comments.
 */

#include "sms/relay/config/config_loader.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>

namespace sms::relay::config {

namespace {

// =============================================================================
// Helper Functions
// =============================================================================

config_load_error make_error(config_error code, std::string message,
                             std::optional<size_t> line = std::nullopt) {
    config_load_error error{.code = code, .message = std::move(message)};
    error.line_number = line;
    return error;
}

config_load_error make_file_error(config_error code, std::string_view what,
                                  const std::filesystem::path& path) {
    auto error = make_error(code, std::string(what) + ": " + path.string());
    error.file_path = path;
    return error;
}

[[nodiscard]] std::expected<std::string, config_load_error> read_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_file_error(config_error::file_not_found,
                                               "Configuration file not found", path));
    }

    std::ifstream file(path, std::ios::binary);
    std::string content{std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>()};
    if (!file.is_open() || file.bad()) {
        return std::unexpected(make_file_error(config_error::io_error,
                                               "Cannot read configuration file", path));
    }
    return content;
}

/**
 * @brief Trim whitespace from string
 */
[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

/**
 * @brief Remove quotes from string value
 */
[[nodiscard]] std::string unquote(std::string_view str) {
    if (str.length() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return std::string(str.substr(1, str.length() - 2));
        }
    }
    return std::string(str);
}

/**
 * @brief Drop a trailing "# comment" that is outside quotes
 */
[[nodiscard]] std::string strip_comment(std::string_view line) {
    char quote = '\0';
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

std::string to_lower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

/**
 * @brief Parse boolean value
 */
[[nodiscard]] std::optional<bool> parse_bool(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief Parse integer value
 */
[[nodiscard]] std::optional<int64_t> parse_int(std::string_view str) {
    if (str.empty()) return std::nullopt;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief "30s", "5m", "1h", "2d"; a bare number is seconds
 */
[[nodiscard]] std::optional<std::chrono::seconds> parse_duration(std::string_view str) {
    if (str.empty()) return std::nullopt;
    if (auto bare = parse_int(str)) {
        return std::chrono::seconds(*bare);
    }

    constexpr std::pair<char, int64_t> units[] = {
        {'s', 1}, {'m', 60}, {'h', 3600}, {'d', 86400}};
    auto suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(str.back())));
    auto count = parse_int(str.substr(0, str.size() - 1));
    if (!count) return std::nullopt;

    for (const auto& [unit, factor] : units) {
        if (unit == suffix) {
            return std::chrono::seconds(*count * factor);
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<storage::store_type> parse_store_type(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "sqlite") return storage::store_type::sqlite;
    if (lower == "memory") return storage::store_type::memory;
    return std::nullopt;
}

// =============================================================================
// Simple YAML Parser (subset)
// =============================================================================

/**
 * @brief Flattens YAML into dotted keys
 *
 * Nested maps become "a.b.c"; sequence items become "a.b.0", "a.b.1".
 */
class simple_yaml_parser {
public:
    struct parse_result {
        std::map<std::string, std::string> flat_values;
        std::map<std::string, size_t> line_numbers;
        size_t error_line = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        std::vector<std::pair<int, std::string>> path_stack;
        std::map<std::string, size_t> sequence_sizes;
        size_t line_number = 0;

        std::istringstream stream{std::string{content}};
        std::string raw_line;

        while (std::getline(stream, raw_line)) {
            ++line_number;

            auto line = strip_comment(raw_line);
            auto trimmed = trim(line);
            if (trimmed.empty()) {
                continue;
            }

            // Calculate indentation
            int indent = 0;
            for (char c : line) {
                if (c == ' ')
                    indent++;
                else if (c == '\t')
                    indent += 2;
                else
                    break;
            }

            bool is_item = trimmed == "-" || trimmed.starts_with("- ");

            // A sequence may sit at the same indentation as its key
            while (!path_stack.empty() &&
                   (is_item ? indent < path_stack.back().first
                            : indent <= path_stack.back().first)) {
                path_stack.pop_back();
            }

            auto path = build_path(path_stack);

            if (is_item) {
                if (path.empty()) {
                    return fail(result, line_number, "Sequence item outside a key");
                }
                auto item = unquote(trim(trimmed.substr(1)));
                auto index = sequence_sizes[path]++;
                auto key = path + "." + std::to_string(index);
                result.flat_values[key] = item;
                result.line_numbers[key] = line_number;
                continue;
            }

            auto colon_pos = find_key_colon(trimmed);
            if (colon_pos == std::string::npos) {
                return fail(result, line_number, "Invalid YAML syntax: missing colon");
            }

            auto key = unquote(trim(trimmed.substr(0, colon_pos)));
            auto value = trim(trimmed.substr(colon_pos + 1));
            if (key.empty()) {
                return fail(result, line_number, "Invalid YAML syntax: empty key");
            }

            auto full_path = path.empty() ? key : path + "." + key;
            if (value.empty()) {
                // Section header
                path_stack.emplace_back(indent, key);
            } else if (value.front() == '[') {
                if (value.back() != ']') {
                    return fail(result, line_number, "Unterminated flow sequence");
                }
                size_t index = 0;
                std::string_view items(value);
                items = items.substr(1, items.size() - 2);
                while (!trim(items).empty()) {
                    auto comma = items.find(',');
                    auto item = unquote(trim(items.substr(0, comma)));
                    auto item_key = full_path + "." + std::to_string(index++);
                    result.flat_values[item_key] = item;
                    result.line_numbers[item_key] = line_number;
                    if (comma == std::string_view::npos) break;
                    items.remove_prefix(comma + 1);
                }
            } else {
                result.flat_values[full_path] = unquote(value);
                result.line_numbers[full_path] = line_number;
            }
        }

        return result;
    }

private:
    static parse_result& fail(parse_result& result, size_t line, std::string message) {
        result.success = false;
        result.error_line = line;
        result.error_message = std::move(message);
        return result;
    }

    /**
     * @brief Colon that ends the key: first ':' followed by space or EOL
     */
    [[nodiscard]] static size_t find_key_colon(std::string_view line) {
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == ':' && (i + 1 == line.size() || line[i + 1] == ' ' ||
                                   line[i + 1] == '\t')) {
                return i;
            }
        }
        return std::string::npos;
    }

    [[nodiscard]] static std::string build_path(
        const std::vector<std::pair<int, std::string>>& stack) {
        std::string path;
        for (const auto& [_, part] : stack) {
            if (!path.empty()) path += ".";
            path += part;
        }
        return path;
    }
};

/**
 * @brief Apply parsed values to configuration
 */
[[nodiscard]] config_result apply_yaml_values(
    const simple_yaml_parser::parse_result& parsed) {
    relay_config config = config_loader::get_default_config();
    std::vector<validation_error_info> errors;
    std::map<size_t, std::string> handlers;

    auto invalid = [&errors](const std::string& key, const std::string& value,
                             std::string expected) {
        errors.push_back({key, "Invalid value", value, std::move(expected)});
    };

    for (const auto& [key, value] : parsed.flat_values) {
        auto expanded = config_loader::expand_env_vars(value);
        if (!expanded) {
            auto error = expanded.error();
            if (auto it = parsed.line_numbers.find(key); it != parsed.line_numbers.end()) {
                error.line_number = it->second;
            }
            return std::unexpected(std::move(error));
        }
        const std::string& val = *expanded;

        // Server settings
        if (key == "server.name") {
            config.server.name = val;
        }
        // Router settings
        else if (key.starts_with("router.handlers.")) {
            auto index = parse_int(std::string_view(key).substr(16));
            if (!index || *index < 0) {
                invalid(key, val, "sequence of handler names");
            } else {
                handlers[static_cast<size_t>(*index)] = val;
            }
        } else if (key == "router.handlers") {
            invalid(key, val, "sequence of handler names");
        }
        // Handler options
        else if (key.starts_with("handler_options.")) {
            auto rest = std::string_view(key).substr(16);
            auto dot = rest.find('.');
            if (dot == std::string_view::npos || dot == 0 || dot + 1 == rest.size()) {
                invalid(key, val, "handler_options.<handler>.<key>");
            } else {
                config.handler_options[std::string(rest.substr(0, dot))]
                                      [std::string(rest.substr(dot + 1))] = val;
            }
        }
        // Delivery settings
        else if (key == "delivery.gateway_url") {
            config.delivery.gateway_url = val;
        } else if (key == "delivery.timeout") {
            if (auto v = parse_duration(val)) {
                config.delivery.timeout = *v;
            } else {
                invalid(key, val, "duration (e.g. 10s, 1m)");
            }
        } else if (key == "delivery.verify_tls") {
            if (auto v = parse_bool(val)) {
                config.delivery.verify_tls = *v;
            } else {
                invalid(key, val, "boolean");
            }
        } else if (key == "delivery.ca_file") {
            config.delivery.ca_file = val;
        }
        // Storage settings
        else if (key == "storage.type") {
            if (auto v = parse_store_type(val)) {
                config.store.type = *v;
            } else {
                invalid(key, val, "sqlite or memory");
            }
        } else if (key == "storage.database_path") {
            config.store.database_path = val;
        } else if (key == "storage.enable_wal_mode") {
            if (auto v = parse_bool(val)) {
                config.store.enable_wal_mode = *v;
            } else {
                invalid(key, val, "boolean");
            }
        } else if (key == "storage.busy_timeout") {
            if (auto v = parse_duration(val)) {
                config.store.busy_timeout = *v;
            } else {
                invalid(key, val, "duration (e.g. 5s)");
            }
        }
        // Logging settings
        else if (key == "logging.level") {
            if (auto v = integration::parse_log_level(val)) {
                config.logging.level = *v;
            } else {
                invalid(key, val, "trace, debug, info, warning, error or critical");
            }
        }
    }

    for (auto& [_, name] : handlers) {
        config.routing.handlers.push_back(std::move(name));
    }

    auto validation = config.validate();
    errors.insert(errors.end(), validation.begin(), validation.end());
    if (!errors.empty()) {
        auto error = make_error(config_error::validation_error,
                                "Configuration validation failed");
        error.validation_errors = std::move(errors);
        return std::unexpected(std::move(error));
    }

    return config;
}

}  // namespace

// =============================================================================
// config_load_error
// =============================================================================

std::string config_load_error::to_string() const {
    std::ostringstream out;
    out << message;
    if (file_path) out << " (file: " << file_path->string() << ")";
    if (line_number) out << " at line " << *line_number;

    if (!validation_errors.empty()) {
        out << "\nValidation errors:";
        for (const auto& v : validation_errors) {
            out << "\n  - " << v.field_path << ": " << v.message;
            if (v.actual_value) out << " (got: " << *v.actual_value << ")";
            if (v.expected) out << " (expected: " << *v.expected << ")";
        }
    }
    return out.str();
}

// =============================================================================
// config_loader
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    auto ext = to_lower(path.extension().string());
    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml(path);
    }

    auto error = make_error(config_error::invalid_format,
                            "Unknown configuration file format: " + ext +
                                ". Use .yaml or .yml");
    error.file_path = path;
    return std::unexpected(std::move(error));
}

config_result config_loader::load_yaml(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto result = load_yaml_string(*content);
    if (!result) {
        auto error = std::move(result).error();
        error.file_path = path;
        return std::unexpected(std::move(error));
    }
    return result;
}

config_result config_loader::load_yaml_string(std::string_view yaml_content) {
    if (trim(yaml_content).empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration content is empty"));
    }

    auto parsed = simple_yaml_parser::parse(yaml_content);
    if (!parsed.success) {
        return std::unexpected(make_error(config_error::parse_error,
                                          parsed.error_message, parsed.error_line));
    }
    if (parsed.flat_values.empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration contains no settings"));
    }

    return apply_yaml_values(parsed);
}

std::vector<validation_error_info> config_loader::validate(const relay_config& config) {
    return config.validate();
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string expanded;
    expanded.reserve(value.size());

    while (!value.empty()) {
        auto open = value.find("${");
        expanded.append(value.substr(0, open));
        if (open == std::string_view::npos) {
            break;
        }

        auto close = value.find('}', open + 2);
        if (close == std::string_view::npos) {
            return std::unexpected(make_error(config_error::parse_error,
                                              "Unclosed environment variable reference"));
        }

        // ${NAME} or ${NAME:-fallback}
        auto reference = value.substr(open + 2, close - open - 2);
        auto separator = reference.find(":-");
        std::string name(reference.substr(0, separator));

        if (const char* env = std::getenv(name.c_str())) {
            expanded += env;
        } else if (separator != std::string_view::npos) {
            expanded.append(reference.substr(separator + 2));
        } else {
            return std::unexpected(make_error(
                config_error::env_var_not_found,
                "Environment variable '" + name + "' not found"));
        }
        value.remove_prefix(close + 1);
    }
    return expanded;
}

bool config_loader::needs_env_expansion(std::string_view value) {
    auto start = value.find("${");
    return start != std::string_view::npos &&
           value.find('}', start + 2) != std::string_view::npos;
}

relay_config config_loader::get_default_config() {
    return relay_config{};
}

}  // namespace sms::relay::config
