/**
 * @file logger_adapter.cpp
 * @brief Console and common_system ILogger adapters, process-wide default logger
 */

#include "sms/relay/integration/logger_adapter.h"

#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace sms::relay::integration {

namespace {

namespace kc = kcenon::common::interfaces;

// Indexed by log_level
constexpr std::array<kc::log_level, 6> kcenon_levels = {
    kc::log_level::trace,   kc::log_level::debug, kc::log_level::info,
    kc::log_level::warning, kc::log_level::error, kc::log_level::critical};

constexpr std::array<std::pair<std::string_view, log_level>, 8> level_aliases = {{
    {"trace", log_level::trace},
    {"debug", log_level::debug},
    {"info", log_level::info},
    {"warn", log_level::warning},
    {"warning", log_level::warning},
    {"error", log_level::error},
    {"critical", log_level::critical},
    {"fatal", log_level::critical},
}};

kc::log_level to_kcenon(log_level level) {
    auto index = static_cast<size_t>(level);
    return index < kcenon_levels.size() ? kcenon_levels[index] : kc::log_level::info;
}

log_level from_kcenon(kc::log_level level) {
    if (level == kc::log_level::off) {
        return log_level::critical;
    }
    for (size_t i = 0; i < kcenon_levels.size(); ++i) {
        if (kcenon_levels[i] == level) {
            return static_cast<log_level>(i);
        }
    }
    return log_level::info;
}

/**
 * @brief "2026-01-31T08:15:02.041Z [WARN] [name] message"
 */
std::string format_line(std::string_view name, log_level level,
                        std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream line;
    line << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
         << std::setw(3) << millis << "Z [" << to_string(level) << "] ";
    if (!name.empty()) {
        line << '[' << name << "] ";
    }
    line << message << '\n';
    return line.str();
}

// =============================================================================
// ILogger bridge
// =============================================================================

class ilogger_adapter final : public logger_adapter {
public:
    explicit ilogger_adapter(std::shared_ptr<kc::ILogger> target)
        : target_(std::move(target)) {
        if (target_) {
            level_.store(from_kcenon(target_->get_level()));
        }
    }

    void log(log_level level, std::string_view message) override {
        if (target_ && is_enabled(level)) {
            target_->log(to_kcenon(level), message);
        }
    }

    void set_level(log_level level) override {
        level_.store(level);
        if (target_) {
            target_->set_level(to_kcenon(level));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return level_.load();
    }

    void flush() override {
        if (target_) {
            target_->flush();
        }
    }

private:
    std::shared_ptr<kc::ILogger> target_;
    std::atomic<log_level> level_{log_level::info};
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Timestamped console output; error and critical go to stderr
 *
 * Lines are formatted outside the lock and written whole, so concurrent
 * dispatch threads never interleave within a line.
 */
class console_logger_adapter final : public logger_adapter {
public:
    explicit console_logger_adapter(std::string_view name) : name_(name) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }
        auto line = format_line(name_, level, message);

        std::lock_guard lock(write_mutex_);
        (level >= log_level::error ? std::cerr : std::cout) << line;
    }

    void set_level(log_level level) override { level_.store(level); }

    [[nodiscard]] log_level get_level() const noexcept override {
        return level_.load();
    }

    void flush() override {
        std::lock_guard lock(write_mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    std::atomic<log_level> level_{log_level::info};
    std::mutex write_mutex_;
};

// =============================================================================
// Default logger slot
// =============================================================================

/**
 * @brief The adapter get_logger() returns
 *
 * Callers keep the reference across calls (`auto& logger = get_logger();`),
 * so this object lives until exit and forwards each call to the currently
 * installed target. A replaced target is destroyed once the calls already
 * using it return.
 */
class default_logger final : public logger_adapter {
public:
    void log(log_level level, std::string_view message) override {
        current()->log(level, message);
    }

    void set_level(log_level level) override { current()->set_level(level); }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current()->get_level();
    }

    void flush() override { current()->flush(); }

    void replace(std::shared_ptr<logger_adapter> next) {
        // Declared before the lock so the old target dies after it is released
        std::shared_ptr<logger_adapter> previous;
        std::lock_guard lock(mutex_);
        previous = std::exchange(target_, std::move(next));
    }

private:
    std::shared_ptr<logger_adapter> current() const {
        std::lock_guard lock(mutex_);
        if (!target_) {
            target_ = std::make_shared<console_logger_adapter>("sms_relay");
        }
        return target_;
    }

    mutable std::mutex mutex_;
    mutable std::shared_ptr<logger_adapter> target_;
};

default_logger& slot() {
    static default_logger instance;
    return instance;
}

}  // namespace

std::optional<log_level> parse_log_level(std::string_view name) {
    std::string folded(name);
    for (auto& c : folded) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto& [alias, level] : level_aliases) {
        if (folded == alias) {
            return level;
        }
    }
    return std::nullopt;
}

logger_adapter& get_logger() {
    return slot();
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    return std::make_unique<console_logger_adapter>(name);
}

std::unique_ptr<logger_adapter> create_logger(std::shared_ptr<kc::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger));
}

void set_default_logger(std::unique_ptr<logger_adapter> logger) {
    slot().replace(std::move(logger));
}

void set_default_logger(std::shared_ptr<kc::ILogger> logger) {
    slot().replace(std::make_shared<ilogger_adapter>(std::move(logger)));
}

void reset_default_logger() {
    slot().replace(nullptr);
}

}  // namespace sms::relay::integration
