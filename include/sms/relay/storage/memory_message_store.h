#ifndef SMS_RELAY_STORAGE_MEMORY_MESSAGE_STORE_H
#define SMS_RELAY_STORAGE_MEMORY_MESSAGE_STORE_H

/**
 * @file memory_message_store.h
 * @brief In-memory message store and connection resolver
 *
 * Thread-safe; every operation holds a single mutex. Contents are lost
 * when the object is destroyed.
 */

#include "sms/relay/storage/message_store.h"

#include <map>
#include <mutex>
#include <utility>

namespace sms::relay::storage {

class memory_message_store final : public message_store,
                                   public connection_resolver {
public:
    memory_message_store() = default;
    ~memory_message_store() override = default;

    memory_message_store(const memory_message_store&) = delete;
    memory_message_store& operator=(const memory_message_store&) = delete;

    [[nodiscard]] std::expected<core::message_record, store_error>
    create_message(const core::new_message& message) override;

    [[nodiscard]] std::expected<core::message_record, store_error>
    update_status(core::message_id id, core::message_status status) override;

    [[nodiscard]] std::expected<core::message_record, store_error>
    update_payload(core::message_id id, const std::string& text,
                   const core::param_map& params) override;

    [[nodiscard]] std::expected<core::message_record, store_error>
    get_message(core::message_id id) const override;

    [[nodiscard]] std::expected<std::vector<core::message_record>, store_error>
    find_by_status(core::message_status status) const override;

    [[nodiscard]] std::expected<core::connection, store_error>
    get_or_create(std::string_view backend, std::string_view identity) override;

    /**
     * @brief Snapshot of every message, ordered by identifier
     */
    [[nodiscard]] std::vector<core::message_record> messages() const;

    /**
     * @brief Messages answering @p source, ordered by identifier
     */
    [[nodiscard]] std::vector<core::message_record> responses_to(
        core::message_id source) const;

    [[nodiscard]] size_t connection_count() const;

private:
    mutable std::mutex mutex_;
    std::map<core::message_id, core::message_record> messages_;
    std::map<std::pair<std::string, std::string>, core::connection> connections_;
    core::message_id next_message_id_ = 1;
    core::connection_id next_connection_id_ = 1;
};

}  // namespace sms::relay::storage

#endif  // SMS_RELAY_STORAGE_MEMORY_MESSAGE_STORE_H
