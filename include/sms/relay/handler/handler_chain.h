#ifndef SMS_RELAY_HANDLER_HANDLER_CHAIN_H
#define SMS_RELAY_HANDLER_HANDLER_CHAIN_H

/**
 * @file handler_chain.h
 * @brief Ordered, sealable list of handler instances
 *
 * Handlers are added in registration order during startup, then the chain
 * is sealed. After sealing the order never changes and further additions
 * fail, so dispatch can read the chain without locking.
 */

#include "sms/relay/handler/handler_base.h"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace sms::relay::handler {

// =============================================================================
// Chain Error Codes (-880 to -889)
// =============================================================================

/**
 * @brief Handler chain specific error codes
 *
 * Allocated range: -880 to -889
 */
enum class chain_error : int {
    /** Null handler provided */
    null_handler = -880,

    /** Chain is sealed */
    sealed = -881
};

[[nodiscard]] constexpr int to_error_code(chain_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(chain_error error) noexcept {
    switch (error) {
        case chain_error::null_handler:
            return "Null handler provided";
        case chain_error::sealed:
            return "Handler chain is sealed";
        default:
            return "Unknown chain error";
    }
}

class handler_chain {
public:
    handler_chain() = default;

    handler_chain(const handler_chain&) = delete;
    handler_chain& operator=(const handler_chain&) = delete;
    handler_chain(handler_chain&&) noexcept = default;
    handler_chain& operator=(handler_chain&&) noexcept = default;

    /**
     * @brief Append a handler at the end of the chain
     */
    [[nodiscard]] std::expected<void, chain_error> add(
        std::unique_ptr<message_handler> handler);

    /**
     * @brief Freeze the order; later add() calls fail
     */
    void seal() noexcept { sealed_ = true; }

    [[nodiscard]] bool sealed() const noexcept { return sealed_; }
    [[nodiscard]] size_t size() const noexcept { return handlers_.size(); }
    [[nodiscard]] bool empty() const noexcept { return handlers_.empty(); }

    /**
     * @brief Handlers in registration order
     */
    [[nodiscard]] const std::vector<std::unique_ptr<message_handler>>& handlers()
        const noexcept {
        return handlers_;
    }

    /**
     * @brief Handler names in registration order
     */
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::vector<std::unique_ptr<message_handler>> handlers_;
    bool sealed_ = false;
};

}  // namespace sms::relay::handler

#endif  // SMS_RELAY_HANDLER_HANDLER_CHAIN_H
