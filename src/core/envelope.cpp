/**
 * @file envelope.cpp
 * @brief Transient envelope implementation
 */

#include "sms/relay/core/envelope.h"

namespace sms::relay::core {

incoming_message::incoming_message(message_record record)
    : record_(std::move(record)), text_(record_.text) {}

void incoming_message::respond(std::string text, param_map params) {
    respond_to(record_.connection, std::move(text), std::move(params));
}

void incoming_message::respond_to(const core::connection& target,
                                  std::string text, param_map params) {
    outgoing_message reply;
    reply.connection = target;
    reply.text = std::move(text);
    reply.in_response_to = record_.id;
    reply.params = std::move(params);
    responses_.push_back(std::move(reply));
}

std::optional<outgoing_message> incoming_message::pop_response() {
    if (responses_.empty()) {
        return std::nullopt;
    }
    outgoing_message front = std::move(responses_.front());
    responses_.pop_front();
    return front;
}

void incoming_message::annotate(std::string key, std::string value) {
    annotations_[std::move(key)] = std::move(value);
}

std::optional<std::string> incoming_message::annotation(std::string_view key) const {
    auto it = annotations_.find(std::string(key));
    if (it == annotations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace sms::relay::core
