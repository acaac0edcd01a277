#ifndef SMS_RELAY_DELIVERY_HTTP_CLIENT_H
#define SMS_RELAY_DELIVERY_HTTP_CLIENT_H

/**
 * @file http_client.h
 * @brief HTTP client adapter used to reach the SMS gateway
 *
 * The delivery client talks to the gateway through http_client_adapter so
 * tests can replace the transport. Two implementations ship:
 *   - callback_http_client: forwards to a std::function
 *   - beast_http_client: synchronous Boost.Beast client for http:// and
 *     https:// (OpenSSL, peer verification on by default)
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sms::relay::delivery {

// =============================================================================
// HTTP Error Codes (-950 to -959)
// =============================================================================

/**
 * @brief Transport level error codes
 *
 * Allocated range: -950 to -959
 */
enum class http_error : int {
    /** URL could not be parsed or uses an unsupported scheme */
    invalid_url = -950,

    /** Host name resolution failed */
    resolve_failed = -951,

    /** TCP connection failed */
    connect_failed = -952,

    /** Request did not complete in time */
    timeout = -953,

    /** Read or write on the socket failed */
    io_error = -954,

    /** TLS handshake failed or the server certificate was rejected */
    tls_failed = -955
};

[[nodiscard]] constexpr int to_error_code(http_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(http_error error) noexcept {
    switch (error) {
        case http_error::invalid_url:
            return "Invalid or unsupported URL";
        case http_error::resolve_failed:
            return "Host resolution failed";
        case http_error::connect_failed:
            return "Connection failed";
        case http_error::timeout:
            return "Request timed out";
        case http_error::io_error:
            return "I/O error";
        case http_error::tls_failed:
            return "TLS handshake failed";
        default:
            return "Unknown HTTP error";
    }
}

// =============================================================================
// Request / Response
// =============================================================================

enum class http_method {
    get,
    post
};

struct http_request {
    http_method method{http_method::get};

    std::string url;

    std::vector<std::pair<std::string, std::string>> headers;

    /** Request body (POST only) */
    std::string body;

    std::chrono::milliseconds timeout{10000};
};

struct http_response {
    int status_code{200};

    std::vector<std::pair<std::string, std::string>> headers;

    std::string body;

    /**
     * @brief Check for a 2xx status
     */
    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Header value by name (case-insensitive)
     */
    [[nodiscard]] std::optional<std::string_view> get_header(
        std::string_view name) const noexcept;
};

/**
 * @brief Components of an http:// or https:// URL
 */
struct parsed_url {
    /** https:// */
    bool secure = false;

    std::string host;

    /** Explicit port, otherwise 80 or 443 by scheme */
    std::string port{"80"};

    /** Path and query, always starting with '/' */
    std::string target{"/"};
};

/**
 * @brief Split a URL into scheme, host, port and target
 *
 * @return invalid_url for schemes other than http and https, a missing
 *         host or a non-numeric port
 */
[[nodiscard]] std::expected<parsed_url, http_error> parse_url(std::string_view url);

// =============================================================================
// Adapter Interface
// =============================================================================

/**
 * @brief Abstract HTTP client
 *
 * @example Mock Implementation for Testing
 * ```cpp
 * class mock_http_client : public http_client_adapter {
 * public:
 *     std::expected<http_response, http_error> execute(
 *         const http_request&) override {
 *         http_response response;
 *         response.status_code = 202;
 *         return response;
 *     }
 * };
 * ```
 */
class http_client_adapter {
public:
    virtual ~http_client_adapter() = default;

    // Non-copyable
    http_client_adapter(const http_client_adapter&) = delete;
    http_client_adapter& operator=(const http_client_adapter&) = delete;

    /**
     * @brief Execute an HTTP request
     *
     * A non-2xx response is a successful execution; only transport
     * failures are reported as errors.
     */
    [[nodiscard]] virtual std::expected<http_response, http_error> execute(
        const http_request& request) = 0;

    /**
     * @brief Convenience GET
     */
    [[nodiscard]] virtual std::expected<http_response, http_error> get(
        std::string_view url,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{10000});

protected:
    http_client_adapter() = default;
};

/**
 * @brief HTTP client that forwards to a callback
 */
class callback_http_client final : public http_client_adapter {
public:
    using execute_callback =
        std::function<std::expected<http_response, http_error>(const http_request&)>;

    explicit callback_http_client(execute_callback callback);

    ~callback_http_client() override = default;

    [[nodiscard]] std::expected<http_response, http_error> execute(
        const http_request& request) override;

private:
    execute_callback callback_;
};

/**
 * @brief Server certificate checks for https:// requests
 */
struct tls_options {
    /** Verify the certificate chain and the host name */
    bool verify_peer = true;

    /** PEM bundle of trusted CAs; the system store when empty */
    std::filesystem::path ca_file;
};

/**
 * @brief Synchronous HTTP/1.1 client built on Boost.Beast
 *
 * One connection per request. The whole exchange (resolve, connect,
 * TLS handshake, write, read) is bounded by the request timeout.
 */
class beast_http_client final : public http_client_adapter {
public:
    explicit beast_http_client(std::string user_agent = "sms-relay/1.0",
                               tls_options tls = {});

    ~beast_http_client() override = default;

    [[nodiscard]] std::expected<http_response, http_error> execute(
        const http_request& request) override;

private:
    std::string user_agent_;
    tls_options tls_;
};

}  // namespace sms::relay::delivery

#endif  // SMS_RELAY_DELIVERY_HTTP_CLIENT_H
