/**
 * @file memory_message_store_test.cpp
 * @brief Unit tests for the in-memory message store
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sms/relay/storage/memory_message_store.h"

#include "utils/test_helpers.h"

#include <thread>

namespace sms::relay::storage {
namespace {

using namespace ::testing;
using namespace sms::relay::test;

class MemoryMessageStoreTest : public sms_relay_test {
protected:
    core::connection connect(std::string_view identity = "+15550001111") {
        auto conn = store_.get_or_create("carrier", identity);
        EXPECT_TRUE(conn.has_value());
        return conn.value_or(core::connection{});
    }

    core::new_message inbound(std::string text) {
        core::new_message msg;
        msg.connection = connect();
        msg.text = std::move(text);
        msg.direction = core::message_direction::inbound;
        msg.status = core::message_status::received;
        return msg;
    }

    memory_message_store store_;
};

TEST_F(MemoryMessageStoreTest, ErrorCodeValues) {
    EXPECT_EQ(to_error_code(store_error::database_error), -910);
    EXPECT_EQ(to_error_code(store_error::message_not_found), -911);
    EXPECT_EQ(to_error_code(store_error::invalid_transition), -914);
    EXPECT_EQ(to_error_code(store_error::not_open), -916);
    EXPECT_STREQ(to_string(store_error::invalid_transition), "Status transition not allowed");
}

TEST_F(MemoryMessageStoreTest, CreateAssignsIncreasingIds) {
    auto first = store_.create_message(inbound("a"));
    auto second = store_.create_message(inbound("b"));
    ASSERT_TRUE(first && second);

    EXPECT_EQ(first->id, 1);
    EXPECT_EQ(second->id, 2);
    EXPECT_EQ(first->text, "a");
    EXPECT_EQ(first->status, core::message_status::received);
    EXPECT_NE(first->timestamp, std::chrono::system_clock::time_point{});
}

TEST_F(MemoryMessageStoreTest, CreateRejectsMissingConnection) {
    core::new_message msg;
    msg.text = "orphan";
    auto result = store_.create_message(msg);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_message);
}

TEST_F(MemoryMessageStoreTest, CreateRejectsUnknownSource) {
    auto msg = inbound("reply");
    msg.direction = core::message_direction::outbound;
    msg.status = core::message_status::pending;
    msg.in_response_to = 99;

    auto result = store_.create_message(msg);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::message_not_found);
}

TEST_F(MemoryMessageStoreTest, UpdateStatusFollowsLifecycle) {
    auto created = store_.create_message(inbound("hello"));
    ASSERT_EXPECTED_OK(created);

    auto handled = store_.update_status(created->id, core::message_status::handled);
    ASSERT_EXPECTED_OK(handled);
    EXPECT_EQ(handled->status, core::message_status::handled);

    auto again = store_.update_status(created->id, core::message_status::received);
    ASSERT_EXPECTED_ERROR(again);
    EXPECT_EQ(again.error(), store_error::invalid_transition);

    auto stored = store_.get_message(created->id);
    ASSERT_EXPECTED_OK(stored);
    EXPECT_EQ(stored->status, core::message_status::handled);
}

TEST_F(MemoryMessageStoreTest, UpdatePayloadOnlyWhilePending) {
    auto msg = inbound("draft");
    msg.direction = core::message_direction::outbound;
    msg.status = core::message_status::pending;
    auto created = store_.create_message(msg);
    ASSERT_EXPECTED_OK(created);

    auto rewritten = store_.update_payload(created->id, "final", {{"smsc", "bulk"}});
    ASSERT_EXPECTED_OK(rewritten);
    EXPECT_EQ(rewritten->text, "final");
    EXPECT_EQ(rewritten->params.at("smsc"), "bulk");

    ASSERT_TRUE(store_.update_status(created->id, core::message_status::queued));
    auto late = store_.update_payload(created->id, "too late", {});
    ASSERT_EXPECTED_ERROR(late);
    EXPECT_EQ(late.error(), store_error::invalid_transition);

    auto incoming = store_.create_message(inbound("hello"));
    ASSERT_EXPECTED_OK(incoming);
    EXPECT_FALSE(store_.update_payload(incoming->id, "x", {}).has_value());
}

TEST_F(MemoryMessageStoreTest, UpdateUnknownMessage) {
    auto result = store_.update_status(123, core::message_status::sent);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::message_not_found);
}

TEST_F(MemoryMessageStoreTest, FindByStatus) {
    auto a = store_.create_message(inbound("a"));
    auto b = store_.create_message(inbound("b"));
    ASSERT_TRUE(a && b);
    ASSERT_TRUE(store_.update_status(b->id, core::message_status::handled));

    auto received = store_.find_by_status(core::message_status::received);
    ASSERT_EXPECTED_OK(received);
    ASSERT_EQ(received->size(), 1u);
    EXPECT_EQ(received->front().id, a->id);
}

TEST_F(MemoryMessageStoreTest, ConnectionsAreUnique) {
    auto first = store_.get_or_create("carrier", "+1000");
    auto second = store_.get_or_create("carrier", "+1000");
    auto other_backend = store_.get_or_create("other", "+1000");
    ASSERT_TRUE(first && second && other_backend);

    EXPECT_EQ(first->id, second->id);
    EXPECT_NE(first->id, other_backend->id);
    EXPECT_EQ(store_.connection_count(), 2u);
}

TEST_F(MemoryMessageStoreTest, ConnectionRequiresBackendAndIdentity) {
    auto result = store_.get_or_create("", "+1000");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_message);
}

TEST_F(MemoryMessageStoreTest, ResponsesTo) {
    auto source = store_.create_message(inbound("question"));
    ASSERT_EXPECTED_OK(source);

    core::new_message reply;
    reply.connection = source->connection;
    reply.text = "answer";
    reply.direction = core::message_direction::outbound;
    reply.status = core::message_status::pending;
    reply.in_response_to = source->id;
    ASSERT_TRUE(store_.create_message(reply));

    auto replies = store_.responses_to(source->id);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies.front().text, "answer");
    EXPECT_EQ(store_.messages().size(), 2u);
}

TEST_F(MemoryMessageStoreTest, ConcurrentCreatesGetDistinctIds) {
    auto conn = connect();
    constexpr int threads = 4;
    constexpr int per_thread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < per_thread; ++i) {
                core::new_message msg;
                msg.connection = conn;
                msg.text = "x";
                auto created = store_.create_message(msg);
                EXPECT_TRUE(created.has_value());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    auto all = store_.messages();
    ASSERT_EQ(all.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(all.back().id, threads * per_thread);
}

}  // namespace
}  // namespace sms::relay::storage
