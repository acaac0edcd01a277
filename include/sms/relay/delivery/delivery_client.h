#ifndef SMS_RELAY_DELIVERY_DELIVERY_CLIENT_H
#define SMS_RELAY_DELIVERY_DELIVERY_CLIENT_H

/**
 * @file delivery_client.h
 * @brief Hands outbound messages to the SMS gateway
 *
 * Delivery never throws and never retries. Every failure is reported as
 * delivery_status::queued so the caller can park the message for a later
 * retry; the failure reason is kept for diagnostics only.
 *
 * Gateway URL template placeholders ({name} or %(name)s):
 *   backend, recipient, text, id, plus any handler-supplied parameter.
 * Values are URL-encoded with quote_plus rules. Unknown placeholders are
 * left in place.
 *
 * @example
 * ```
 * http://127.0.0.1:13013/cgi-bin/sendsms?to={recipient}&text={text}
 * ```
 */

#include "sms/relay/core/message_types.h"
#include "sms/relay/delivery/http_client.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sms::relay::delivery {

/**
 * @brief Outcome of one delivery attempt
 */
enum class delivery_status {
    sent,
    queued
};

[[nodiscard]] constexpr const char* to_string(delivery_status status) noexcept {
    return status == delivery_status::sent ? "sent" : "queued";
}

/**
 * @brief Why a delivery attempt ended queued
 */
enum class delivery_failure {
    none,

    /** No gateway URL configured */
    not_configured,

    /** Request never produced an HTTP response */
    transport_error,

    /** Gateway answered with a non-2xx status */
    rejected
};

[[nodiscard]] constexpr const char* to_string(delivery_failure failure) noexcept {
    switch (failure) {
        case delivery_failure::none:
            return "none";
        case delivery_failure::not_configured:
            return "not_configured";
        case delivery_failure::transport_error:
            return "transport_error";
        case delivery_failure::rejected:
            return "rejected";
        default:
            return "unknown";
    }
}

struct delivery_result {
    delivery_status status = delivery_status::queued;

    delivery_failure failure = delivery_failure::none;

    /** HTTP status when the gateway answered */
    std::optional<int> http_status;

    /** Error message if delivery failed */
    std::string error_message;

    /** Round-trip time for delivery */
    std::chrono::milliseconds round_trip_time{0};

    [[nodiscard]] bool is_sent() const noexcept {
        return status == delivery_status::sent;
    }

    [[nodiscard]] static delivery_result ok(
        int http_status_code,
        std::chrono::milliseconds rtt = std::chrono::milliseconds{0}) {
        delivery_result result;
        result.status = delivery_status::sent;
        result.http_status = http_status_code;
        result.round_trip_time = rtt;
        return result;
    }

    [[nodiscard]] static delivery_result queued(delivery_failure reason,
                                                std::string error,
                                                std::optional<int> http_status_code = {}) {
        delivery_result result;
        result.status = delivery_status::queued;
        result.failure = reason;
        result.http_status = http_status_code;
        result.error_message = std::move(error);
        return result;
    }
};

/**
 * @brief Gateway transport seen by the dispatch engine and router
 */
class delivery_client {
public:
    virtual ~delivery_client() = default;

    /**
     * @brief Attempt to deliver @p message
     *
     * @param message Persisted outbound message
     * @param extra_params Handler-supplied gateway parameters
     */
    [[nodiscard]] virtual delivery_result deliver(const core::message_record& message,
                                                  const core::param_map& extra_params) = 0;

protected:
    delivery_client() = default;
};

/**
 * @brief Gateway configuration
 */
struct gateway_config {
    /** URL template; empty means no gateway */
    std::string url;

    /** Bound on one delivery attempt */
    std::chrono::milliseconds timeout{10000};

    /** Certificate checks for an https:// gateway */
    tls_options tls;

    [[nodiscard]] bool is_configured() const noexcept { return !url.empty(); }
};

/**
 * @brief Delivery client issuing one HTTP GET per message
 */
class gateway_delivery_client final : public delivery_client {
public:
    /**
     * @param config Gateway URL template, timeout and TLS settings
     * @param http HTTP transport; a beast_http_client using config.tls when null
     */
    explicit gateway_delivery_client(gateway_config config,
                                     std::unique_ptr<http_client_adapter> http = nullptr);

    ~gateway_delivery_client() override = default;

    [[nodiscard]] delivery_result deliver(const core::message_record& message,
                                          const core::param_map& extra_params) override;

    /**
     * @brief Gateway URL for @p message, or nullopt when not configured
     */
    [[nodiscard]] std::optional<std::string> build_url(
        const core::message_record& message,
        const core::param_map& extra_params) const;

    [[nodiscard]] const gateway_config& config() const noexcept { return config_; }

private:
    gateway_config config_;
    std::unique_ptr<http_client_adapter> http_;
};

// =============================================================================
// Template helpers
// =============================================================================

/**
 * @brief Encode a value for a query string
 *
 * Space becomes '+', A-Z a-z 0-9 and "_.-~" are kept, every other byte
 * becomes %XX (upper-case hex). '~' is kept as an RFC 3986 unreserved
 * character, so "a~b" encodes as "a~b" where older form encoders
 * (Python 2 quote_plus among them) send "a%7Eb". Gateways decode both the
 * same way.
 */
[[nodiscard]] std::string url_encode(std::string_view value);

/**
 * @brief Substitute {name} and %(name)s placeholders with encoded values
 */
[[nodiscard]] std::string expand_url_template(std::string_view url_template,
                                              const core::param_map& params);

}  // namespace sms::relay::delivery

#endif  // SMS_RELAY_DELIVERY_DELIVERY_CLIENT_H
