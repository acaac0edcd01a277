/**
 * @file test_helpers.h
 * @brief Common test utilities and helpers for SMS relay tests
 *
 * Provides fixtures, recording handlers, a capturing logger and macros
 * for unit testing. Uses Google Test (gtest) and Google Mock (gmock).
 */

#ifndef SMS_RELAY_TEST_HELPERS_H
#define SMS_RELAY_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sms/relay/core/envelope.h"
#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/handler/handler_base.h"
#include "sms/relay/integration/logger_adapter.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sms::relay::test {

// =============================================================================
// Temporary Files
// =============================================================================

/**
 * @brief Unique path under the system temp directory, removed on destruction
 *
 * SQLite side files (-wal, -shm) are removed as well.
 */
class temp_path {
public:
    explicit temp_path(std::string_view extension = ".db") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("sms_relay_test_" + std::to_string(stamp) + "_" +
                 std::to_string(counter++) + std::string(extension));
    }

    ~temp_path() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-wal", ec);
        std::filesystem::remove(path_.string() + "-shm", ec);
    }

    temp_path(const temp_path&) = delete;
    temp_path& operator=(const temp_path&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::string string() const { return path_.string(); }

    /**
     * @brief Write @p content to the file, replacing any previous content
     */
    void write(std::string_view content) const {
        std::ofstream file(path_, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write temp file: " + path_.string());
        }
        file << content;
    }

private:
    std::filesystem::path path_;
};

// =============================================================================
// Capturing Logger
// =============================================================================

/**
 * @brief Logger that keeps every enabled line in memory
 */
class capturing_logger : public integration::logger_adapter {
public:
    struct entry {
        integration::log_level level;
        std::string message;
    };

    void log(integration::log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }
        std::lock_guard lock(mutex_);
        entries_.push_back({level, std::string(message)});
    }

    void set_level(integration::log_level level) override { level_ = level; }

    [[nodiscard]] integration::log_level get_level() const noexcept override {
        return level_;
    }

    void flush() override {}

    [[nodiscard]] std::vector<entry> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    [[nodiscard]] bool contains(std::string_view fragment) const {
        std::lock_guard lock(mutex_);
        for (const auto& e : entries_) {
            if (e.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<entry> entries_;
    std::atomic<integration::log_level> level_{integration::log_level::trace};
};

// =============================================================================
// Recording Handler
// =============================================================================

/**
 * @brief Configurable handler that records the phases it sees
 *
 * Every phase hook can be replaced with a callback; by default each one
 * behaves like message_handler's default. Calls are appended to a shared
 * journal as "<name>:<phase>" so tests can check ordering across handlers.
 */
class recording_handler : public handler::message_handler {
public:
    using inbound_hook = std::function<bool(core::incoming_message&)>;
    using outgoing_hook = std::function<handler::send_decision(core::outgoing_message&)>;

    recording_handler(std::string name,
                      std::shared_ptr<std::vector<std::string>> journal)
        : name_(std::move(name)), journal_(std::move(journal)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void start() override {
        record("start");
        if (on_start) on_start();
    }

    bool filter(core::incoming_message& message) override {
        return run("filter", on_filter, message);
    }
    bool parse(core::incoming_message& message) override {
        return run("parse", on_parse, message);
    }
    bool handle(core::incoming_message& message) override {
        return run("handle", on_handle, message);
    }
    bool default_phase(core::incoming_message& message) override {
        return run("default", on_default, message);
    }
    bool cleanup(core::incoming_message& message) override {
        return run("cleanup", on_cleanup, message);
    }

    handler::send_decision outgoing(core::outgoing_message& message) override {
        record("outgoing");
        return on_outgoing ? on_outgoing(message) : handler::send_decision::proceed;
    }

    void on_exception(handler::handler_phase phase, const std::exception& error) override {
        record(std::string("exception:") + handler::to_string(phase));
        last_exception = error.what();
        if (throw_from_hook) {
            throw std::runtime_error("hook failure");
        }
    }

    std::function<void()> on_start;
    inbound_hook on_filter;
    inbound_hook on_parse;
    inbound_hook on_handle;
    inbound_hook on_default;
    inbound_hook on_cleanup;
    outgoing_hook on_outgoing;
    bool throw_from_hook = false;
    std::string last_exception;

private:
    void record(std::string_view what) {
        if (journal_) {
            journal_->push_back(name_ + ":" + std::string(what));
        }
    }

    bool run(std::string_view phase, const inbound_hook& hook,
             core::incoming_message& message) {
        record(phase);
        return hook ? hook(message) : false;
    }

    std::string name_;
    std::shared_ptr<std::vector<std::string>> journal_;
};

// =============================================================================
// Delivery Stub
// =============================================================================

/**
 * @brief Delivery client returning a scripted outcome and recording calls
 */
class scripted_delivery_client : public delivery::delivery_client {
public:
    struct call {
        core::message_record message;
        core::param_map params;
    };

    delivery::delivery_result deliver(const core::message_record& message,
                                      const core::param_map& extra_params) override {
        std::lock_guard lock(mutex_);
        calls_.push_back({message, extra_params});
        if (succeed) {
            return delivery::delivery_result::ok(200);
        }
        return delivery::delivery_result::queued(delivery::delivery_failure::rejected,
                                                 "Gateway returned HTTP 500", 500);
    }

    [[nodiscard]] std::vector<call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::atomic<bool> succeed{true};

private:
    mutable std::mutex mutex_;
    std::vector<call> calls_;
};

// =============================================================================
// Test Fixture Base Class
// =============================================================================

/**
 * @brief Base fixture for SMS relay tests
 *
 * Installs a capturing logger for the duration of each test.
 */
class sms_relay_test : public ::testing::Test {
protected:
    void SetUp() override {
        auto logger = std::make_unique<capturing_logger>();
        logger_ = logger.get();
        integration::set_default_logger(std::move(logger));
    }

    void TearDown() override {
        integration::reset_default_logger();
        logger_ = nullptr;
    }

    [[nodiscard]] capturing_logger& logger() { return *logger_; }

private:
    capturing_logger* logger_ = nullptr;
};

// =============================================================================
// Custom Matchers
// =============================================================================

/**
 * @brief Matcher for checking if a string contains a substring
 */
MATCHER_P(ContainsSubstring, substring, "") {
    return arg.find(substring) != std::string::npos;
}

// =============================================================================
// Synchronization Utilities
// =============================================================================

/**
 * @brief Wait for a condition using yield-based polling with timeout
 */
template <typename Predicate>
bool wait_for(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::yield();
    }
    return true;
}

// =============================================================================
// Helper Macros
// =============================================================================

/**
 * @brief Assert that an expected value has a value (for std::expected)
 */
#define ASSERT_EXPECTED_OK(expected) \
    ASSERT_TRUE((expected).has_value()) << "Expected value but got error"

/**
 * @brief Expect that an expected value has a value (for std::expected)
 */
#define EXPECT_EXPECTED_OK(expected) \
    EXPECT_TRUE((expected).has_value()) << "Expected value but got error"

/**
 * @brief Assert that an expected value has an error (for std::expected)
 */
#define ASSERT_EXPECTED_ERROR(expected) \
    ASSERT_FALSE((expected).has_value()) << "Expected error but got value"

/**
 * @brief Expect that an expected value has an error (for std::expected)
 */
#define EXPECT_EXPECTED_ERROR(expected) \
    EXPECT_FALSE((expected).has_value()) << "Expected error but got value"

}  // namespace sms::relay::test

#endif  // SMS_RELAY_TEST_HELPERS_H
