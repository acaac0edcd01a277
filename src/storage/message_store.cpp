/**
 * @file message_store.cpp
 * @brief Store factory
 */

#include "sms/relay/storage/message_store.h"

#include "sms/relay/storage/memory_message_store.h"
#include "sms/relay/storage/sqlite_message_store.h"

namespace sms::relay::storage {

std::expected<store_handles, store_error> open_store(const store_config& config) {
    if (!config.is_valid()) {
        return std::unexpected(store_error::database_error);
    }

    switch (config.type) {
        case store_type::memory: {
            auto store = std::make_shared<memory_message_store>();
            return store_handles{store, store};
        }
        case store_type::sqlite: {
            auto opened = sqlite_message_store::open(config);
            if (!opened) {
                return std::unexpected(opened.error());
            }
            std::shared_ptr<sqlite_message_store> store = std::move(*opened);
            return store_handles{store, store};
        }
    }
    return std::unexpected(store_error::database_error);
}

}  // namespace sms::relay::storage
