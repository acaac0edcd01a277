/**
 * @file delivery_client.cpp
 * @brief Gateway delivery client implementation
 */

#include "sms/relay/delivery/delivery_client.h"

#include "sms/relay/integration/logger_adapter.h"

namespace sms::relay::delivery {

// =============================================================================
// Template helpers
// =============================================================================

std::string url_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-' || c == '~') {
            encoded.push_back(ch);
        } else if (c == ' ') {
            encoded.push_back('+');
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string expand_url_template(std::string_view url_template,
                                const core::param_map& params) {
    std::string result;
    result.reserve(url_template.size());

    size_t pos = 0;
    while (pos < url_template.size()) {
        char c = url_template[pos];

        if (c == '{') {
            auto close = url_template.find('}', pos + 1);
            if (close != std::string_view::npos) {
                auto name = std::string(url_template.substr(pos + 1, close - pos - 1));
                auto it = params.find(name);
                if (it != params.end()) {
                    result += url_encode(it->second);
                    pos = close + 1;
                    continue;
                }
            }
        } else if (c == '%' && pos + 1 < url_template.size() &&
                   url_template[pos + 1] == '(') {
            auto close = url_template.find(")s", pos + 2);
            if (close != std::string_view::npos) {
                auto name = std::string(url_template.substr(pos + 2, close - pos - 2));
                auto it = params.find(name);
                if (it != params.end()) {
                    result += url_encode(it->second);
                    pos = close + 2;
                    continue;
                }
            }
        }

        result.push_back(c);
        ++pos;
    }
    return result;
}

// =============================================================================
// gateway_delivery_client
// =============================================================================

gateway_delivery_client::gateway_delivery_client(
    gateway_config config, std::unique_ptr<http_client_adapter> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (!http_) {
        http_ = std::make_unique<beast_http_client>("sms-relay/1.0", config_.tls);
    }
}

std::optional<std::string> gateway_delivery_client::build_url(
    const core::message_record& message, const core::param_map& extra_params) const {
    if (!config_.is_configured()) {
        return std::nullopt;
    }

    core::param_map params = extra_params;
    params["backend"] = message.connection.backend;
    params["recipient"] = message.connection.identity;
    params["text"] = message.text;
    params["id"] = std::to_string(message.id);

    return expand_url_template(config_.url, params);
}

delivery_result gateway_delivery_client::deliver(const core::message_record& message,
                                                 const core::param_map& extra_params) {
    auto& logger = integration::get_logger();
    auto url = build_url(message, extra_params);
    if (!url) {
        logger.warning("[Delivery] msg_id=" + std::to_string(message.id) +
                       " no gateway configured, message queued");
        return delivery_result::queued(delivery_failure::not_configured,
                                       "No gateway URL configured");
    }

    http_request request;
    request.method = http_method::get;
    request.url = *url;
    request.timeout = config_.timeout;

    auto started = std::chrono::steady_clock::now();
    std::expected<http_response, http_error> response =
        std::unexpected(http_error::io_error);
    try {
        response = http_->execute(request);
    } catch (const std::exception& e) {
        logger.error("[Delivery] msg_id=" + std::to_string(message.id) +
                     " transport threw: " + e.what());
        return delivery_result::queued(delivery_failure::transport_error, e.what());
    }
    auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!response) {
        logger.warning("[Delivery] msg_id=" + std::to_string(message.id) +
                       " transport error: " + to_string(response.error()));
        auto result = delivery_result::queued(delivery_failure::transport_error,
                                              to_string(response.error()));
        result.round_trip_time = rtt;
        return result;
    }

    if (!response->is_success()) {
        logger.warning("[Delivery] msg_id=" + std::to_string(message.id) +
                       " gateway rejected status=" +
                       std::to_string(response->status_code));
        auto result = delivery_result::queued(
            delivery_failure::rejected,
            "Gateway returned HTTP " + std::to_string(response->status_code),
            response->status_code);
        result.round_trip_time = rtt;
        return result;
    }

    logger.debug("[Delivery] msg_id=" + std::to_string(message.id) +
                 " delivered status=" + std::to_string(response->status_code) +
                 " rtt_ms=" + std::to_string(rtt.count()));
    return delivery_result::ok(response->status_code, rtt);
}

}  // namespace sms::relay::delivery
