/**
 * @file handler_chain.cpp
 * @brief Handler chain implementation
 */

#include "sms/relay/handler/handler_chain.h"

#include <string>

namespace sms::relay::handler {

std::expected<void, chain_error> handler_chain::add(
    std::unique_ptr<message_handler> handler) {
    if (!handler) {
        return std::unexpected(chain_error::null_handler);
    }
    if (sealed_) {
        return std::unexpected(chain_error::sealed);
    }
    handlers_.push_back(std::move(handler));
    return {};
}

std::vector<std::string> handler_chain::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        result.emplace_back(handler->name());
    }
    return result;
}

}  // namespace sms::relay::handler
