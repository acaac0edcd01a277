/**
 * @file memory_message_store.cpp
 * @brief In-memory message store implementation
 */

#include "sms/relay/storage/memory_message_store.h"

namespace sms::relay::storage {

std::expected<core::message_record, store_error>
memory_message_store::create_message(const core::new_message& message) {
    if (message.connection.backend.empty() || message.connection.identity.empty()) {
        return std::unexpected(store_error::invalid_message);
    }

    std::lock_guard lock(mutex_);

    if (message.in_response_to && !messages_.contains(*message.in_response_to)) {
        return std::unexpected(store_error::message_not_found);
    }

    core::message_record record;
    record.id = next_message_id_++;
    record.connection = message.connection;
    record.text = message.text;
    record.direction = message.direction;
    record.status = message.status;
    record.timestamp = std::chrono::system_clock::now();
    record.in_response_to = message.in_response_to;
    record.params = message.params;

    messages_.emplace(record.id, record);
    return record;
}

std::expected<core::message_record, store_error>
memory_message_store::update_status(core::message_id id,
                                    core::message_status status) {
    std::lock_guard lock(mutex_);

    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::unexpected(store_error::message_not_found);
    }

    if (!core::can_transition(it->second.status, status)) {
        return std::unexpected(store_error::invalid_transition);
    }

    it->second.status = status;
    return it->second;
}

std::expected<core::message_record, store_error>
memory_message_store::update_payload(core::message_id id, const std::string& text,
                                     const core::param_map& params) {
    std::lock_guard lock(mutex_);

    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::unexpected(store_error::message_not_found);
    }

    auto& record = it->second;
    if (record.direction != core::message_direction::outbound ||
        record.status != core::message_status::pending) {
        return std::unexpected(store_error::invalid_transition);
    }

    record.text = text;
    record.params = params;
    return record;
}

std::expected<core::message_record, store_error>
memory_message_store::get_message(core::message_id id) const {
    std::lock_guard lock(mutex_);

    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::unexpected(store_error::message_not_found);
    }
    return it->second;
}

std::expected<std::vector<core::message_record>, store_error>
memory_message_store::find_by_status(core::message_status status) const {
    std::lock_guard lock(mutex_);

    std::vector<core::message_record> result;
    for (const auto& [_, record] : messages_) {
        if (record.status == status) {
            result.push_back(record);
        }
    }
    return result;
}

std::expected<core::connection, store_error>
memory_message_store::get_or_create(std::string_view backend,
                                    std::string_view identity) {
    if (backend.empty() || identity.empty()) {
        return std::unexpected(store_error::invalid_message);
    }

    std::lock_guard lock(mutex_);

    auto key = std::make_pair(std::string(backend), std::string(identity));
    auto it = connections_.find(key);
    if (it != connections_.end()) {
        return it->second;
    }

    core::connection conn;
    conn.id = next_connection_id_++;
    conn.backend = key.first;
    conn.identity = key.second;
    connections_.emplace(std::move(key), conn);
    return conn;
}

std::vector<core::message_record> memory_message_store::messages() const {
    std::lock_guard lock(mutex_);

    std::vector<core::message_record> result;
    result.reserve(messages_.size());
    for (const auto& [_, record] : messages_) {
        result.push_back(record);
    }
    return result;
}

std::vector<core::message_record> memory_message_store::responses_to(
    core::message_id source) const {
    std::lock_guard lock(mutex_);

    std::vector<core::message_record> result;
    for (const auto& [_, record] : messages_) {
        if (record.in_response_to == source) {
            result.push_back(record);
        }
    }
    return result;
}

size_t memory_message_store::connection_count() const {
    std::lock_guard lock(mutex_);
    return connections_.size();
}

}  // namespace sms::relay::storage
