#ifndef SMS_RELAY_INTEGRATION_LOGGER_ADAPTER_H
#define SMS_RELAY_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Logging seam for the relay
 *
 * Components log through get_logger() with a bracketed component prefix,
 * e.g. "[Dispatch] msg_id=7 phase=handle handler=echo handled". Until a
 * logger is installed, lines go to a console adapter; set_default_logger()
 * can route them to a common_system ILogger instead.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::common::interfaces {
class ILogger;
}  // namespace kcenon::common::interfaces

namespace sms::relay::integration {

enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

/**
 * @brief Upper-case tag used in console lines
 */
[[nodiscard]] constexpr const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parse a log level name ("debug", "WARN", "critical", ...)
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name);

/**
 * @brief Sink for relay log lines
 *
 * Implementations must accept concurrent log() calls.
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Emit @p message unless @p level is below get_level()
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }
    void debug(std::string_view message) { log(log_level::debug, message); }
    void info(std::string_view message) { log(log_level::info, message); }
    void warning(std::string_view message) { log(log_level::warning, message); }
    void error(std::string_view message) { log(log_level::error, message); }
    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    virtual void set_level(log_level level) = 0;

    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    virtual void flush() = 0;
};

/**
 * @brief Process-wide logger; a console adapter named "sms_relay" until replaced
 *
 * The returned reference stays valid across set_default_logger() and
 * reset_default_logger(); each call goes to the adapter installed at the
 * time of that call.
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Console adapter tagging each line with [@p name]
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Create a logger adapter that forwards to a common_system ILogger
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Replace the global logger with an adapter
 */
void set_default_logger(std::unique_ptr<logger_adapter> logger);

/**
 * @brief Replace the global logger with a common_system ILogger
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Drop the global logger; the next get_logger() recreates the console one
 */
void reset_default_logger();

}  // namespace sms::relay::integration

#endif  // SMS_RELAY_INTEGRATION_LOGGER_ADAPTER_H
