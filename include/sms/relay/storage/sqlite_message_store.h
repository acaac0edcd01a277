#ifndef SMS_RELAY_STORAGE_SQLITE_MESSAGE_STORE_H
#define SMS_RELAY_STORAGE_SQLITE_MESSAGE_STORE_H

/**
 * @file sqlite_message_store.h
 * @brief Durable message store backed by SQLite
 *
 * Schema:
 *   connections(id, backend, identity, UNIQUE(backend, identity))
 *   messages(id, connection_id, text, direction, status, created_at,
 *            in_response_to)
 *   message_params(message_id, name, value, PRIMARY KEY(message_id, name))
 *
 * Direction and status are stored as their one-character codes. The
 * database is opened with SQLITE_OPEN_FULLMUTEX and every statement runs
 * under a connection mutex, so each create/update is atomic per record.
 */

#include "sms/relay/storage/message_store.h"

#include <memory>

namespace sms::relay::storage {

class sqlite_message_store final : public message_store,
                                   public connection_resolver {
public:
    /**
     * @brief Open (or create) the database described by @p config
     */
    [[nodiscard]] static std::expected<std::unique_ptr<sqlite_message_store>, store_error>
    open(const store_config& config);

    ~sqlite_message_store() override;

    sqlite_message_store(const sqlite_message_store&) = delete;
    sqlite_message_store& operator=(const sqlite_message_store&) = delete;

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

    [[nodiscard]] const store_config& config() const noexcept;

private:
    class impl;
    explicit sqlite_message_store(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> pimpl_;
};

}  // namespace sms::relay::storage

#endif  // SMS_RELAY_STORAGE_SQLITE_MESSAGE_STORE_H
