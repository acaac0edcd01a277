/**
 * @file message_router_test.cpp
 * @brief Unit tests for router startup, entry points and the outgoing backlog
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sms/relay/delivery/delivery_client.h"
#include "sms/relay/handlers/blocklist_handler.h"
#include "sms/relay/handlers/echo_handler.h"
#include "sms/relay/router/message_router.h"
#include "sms/relay/storage/memory_message_store.h"

#include "utils/test_helpers.h"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>

namespace sms::relay::router {
namespace {

using namespace ::testing;
using namespace sms::relay::test;
using handler::handler_settings;
using handler::send_decision;

/**
 * @brief Memory store that fails chosen writes with database_error
 */
class flaky_store final : public storage::message_store {
public:
    explicit flaky_store(std::shared_ptr<storage::memory_message_store> inner)
        : inner_(std::move(inner)) {}

    std::expected<core::message_record, storage::store_error> create_message(
        const core::new_message& message) override {
        if (++creates_ == fail_create_number) {
            return std::unexpected(storage::store_error::database_error);
        }
        return inner_->create_message(message);
    }

    std::expected<core::message_record, storage::store_error> update_status(
        core::message_id id, core::message_status status) override {
        if (fail_updates_for.contains(id)) {
            return std::unexpected(storage::store_error::database_error);
        }
        return inner_->update_status(id, status);
    }

    std::expected<core::message_record, storage::store_error> update_payload(
        core::message_id id, const std::string& text,
        const core::param_map& params) override {
        return inner_->update_payload(id, text, params);
    }

    std::expected<core::message_record, storage::store_error> get_message(
        core::message_id id) const override {
        return inner_->get_message(id);
    }

    std::expected<std::vector<core::message_record>, storage::store_error>
    find_by_status(core::message_status status) const override {
        return inner_->find_by_status(status);
    }

    /** 1-based create_message call that fails; 0 never fails */
    int fail_create_number = 0;
    std::set<core::message_id> fail_updates_for;

private:
    std::shared_ptr<storage::memory_message_store> inner_;
    int creates_ = 0;
};

class MessageRouterTest : public sms_relay_test {
protected:
    void SetUp() override {
        sms_relay_test::SetUp();
        store_ = std::make_shared<storage::memory_message_store>();
        registry_ = std::make_shared<handler::handler_registry>();
        handler::register_builtin_handlers(*registry_);
        delivery_ = std::make_shared<scripted_delivery_client>();
        journal_ = std::make_shared<std::vector<std::string>>();
    }

    /**
     * @brief Register a recording handler; @p configure runs on each instance
     */
    void register_recording(std::string name,
                            std::function<void(recording_handler&)> configure = {}) {
        auto journal = journal_;
        auto counter = instantiations_;
        ASSERT_TRUE(registry_->register_factory(
            name, [name, journal, counter, configure](const handler_settings&) {
                ++*counter;
                auto handler = std::make_unique<recording_handler>(name, journal);
                if (configure) configure(*handler);
                return handler;
            }));
    }

    std::unique_ptr<message_router> make_router(std::vector<std::string> names,
                                                router_config config = {}) {
        config.handler_names = std::move(names);
        return std::make_unique<message_router>(std::move(config), store_, store_,
                                                registry_, delivery_);
    }

    core::message_record seed_queued(std::string text) {
        auto conn = store_->get_or_create("carrier", "+15557770000");
        EXPECT_TRUE(conn.has_value());
        core::new_message fields;
        fields.connection = conn.value_or(core::connection{});
        fields.text = std::move(text);
        fields.direction = core::message_direction::outbound;
        fields.status = core::message_status::pending;
        auto created = store_->create_message(fields);
        EXPECT_TRUE(created.has_value());
        auto queued = store_->update_status(created.value_or(core::message_record{}).id,
                                            core::message_status::queued);
        EXPECT_TRUE(queued.has_value());
        return queued.value_or(core::message_record{});
    }

    std::shared_ptr<storage::memory_message_store> store_;
    std::shared_ptr<handler::handler_registry> registry_;
    std::shared_ptr<scripted_delivery_client> delivery_;
    std::shared_ptr<std::vector<std::string>> journal_;
    std::shared_ptr<std::atomic<int>> instantiations_ = std::make_shared<std::atomic<int>>(0);
};

TEST_F(MessageRouterTest, ErrorCodeValues) {
    EXPECT_EQ(to_error_code(router_error::startup_failed), -930);
    EXPECT_EQ(to_error_code(router_error::unknown_handler), -931);
    EXPECT_EQ(to_error_code(router_error::invalid_argument), -936);
    EXPECT_STREQ(to_string(router_error::unknown_handler), "Unknown handler name");
}

// =============================================================================
// Scenarios
// =============================================================================

TEST_F(MessageRouterTest, EchoRepliesToSender) {
    auto router = make_router({"echo"});

    auto result = router->process_incoming("carrier", "+15550001111", "hello");
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->message.status, core::message_status::handled);
    EXPECT_EQ(result->message.text, "hello");
    ASSERT_EQ(result->replies.size(), 1u);
    const auto& reply = result->replies[0];
    EXPECT_EQ(reply.text, "hello");
    EXPECT_EQ(reply.status, core::message_status::sent);
    EXPECT_EQ(reply.connection.identity, "+15550001111");
    EXPECT_EQ(reply.in_response_to, result->message.id);

    EXPECT_EQ(store_->messages().size(), 2u);
}

TEST_F(MessageRouterTest, BlocklistVetoesBeforeEcho) {
    router_config config;
    config.handler_options["blocklist"] = {{"addresses", "+15550009999"}};
    auto router = make_router({"blocklist", "echo"}, config);

    auto blocked = router->process_incoming("carrier", "+15550009999", "spam");
    ASSERT_EXPECTED_OK(blocked);
    EXPECT_TRUE(blocked->vetoed);
    EXPECT_TRUE(blocked->replies.empty());
    EXPECT_EQ(blocked->message.status, core::message_status::handled);

    auto allowed = router->process_incoming("carrier", "+15550001111", "hi");
    ASSERT_EXPECTED_OK(allowed);
    EXPECT_FALSE(allowed->vetoed);
    EXPECT_EQ(allowed->replies.size(), 1u);
}

TEST_F(MessageRouterTest, LaterHandlerCancelsBeforeEarlierSeesOutgoing) {
    register_recording("a");
    register_recording("b", [](recording_handler& h) {
        h.on_outgoing = [](core::outgoing_message&) { return send_decision::cancel; };
    });
    auto router = make_router({"a", "b"});

    core::connection target;
    target.backend = "carrier";
    target.identity = "+15550002222";
    auto result = router->send_outgoing(target, "promo");
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->status, core::message_status::cancelled);
    EXPECT_THAT(*journal_, Contains("b:outgoing"));
    EXPECT_THAT(*journal_, Not(Contains("a:outgoing")));
    EXPECT_TRUE(delivery_->calls().empty());
}

TEST_F(MessageRouterTest, HandleIncomingReturnsRecord) {
    auto router = make_router({"echo"});

    auto record = router->handle_incoming("carrier", "+1555", "ping");
    ASSERT_EXPECTED_OK(record);
    EXPECT_EQ(record->direction, core::message_direction::inbound);
    EXPECT_EQ(record->status, core::message_status::handled);
}

TEST_F(MessageRouterTest, IncomingRequiresBackendAndSender) {
    auto router = make_router({});

    auto result = router->process_incoming("", "+1555", "hi");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), router_error::invalid_argument);
}

TEST_F(MessageRouterTest, SendOutgoingResolvesConnection) {
    auto router = make_router({});

    core::connection target;
    target.backend = "carrier";
    target.identity = "+15550003333";
    auto result = router->send_outgoing(target, "hello", std::nullopt, {{"smsc", "x"}});
    ASSERT_EXPECTED_OK(result);

    EXPECT_GT(result->connection.id, 0);
    EXPECT_EQ(result->status, core::message_status::sent);
    auto calls = delivery_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].params.at("smsc"), "x");
}

// =============================================================================
// Startup
// =============================================================================

TEST_F(MessageRouterTest, StartupIsLazy) {
    register_recording("a");
    auto router = make_router({"a"});

    EXPECT_FALSE(router->is_started());
    EXPECT_EQ(instantiations_->load(), 0);

    ASSERT_EXPECTED_OK(router->ensure_started());
    EXPECT_TRUE(router->is_started());
    EXPECT_THAT(*journal_, ElementsAre("a:start"));
}

TEST_F(MessageRouterTest, ConcurrentStartupRunsOnce) {
    register_recording("a");
    register_recording("b");
    auto router = make_router({"a", "b"});

    constexpr int thread_count = 8;
    std::atomic<bool> go{false};
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (router->ensure_started()) {
                ++successes;
            }
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), thread_count);
    EXPECT_EQ(instantiations_->load(), 2);
    EXPECT_THAT(*journal_, ElementsAre("a:start", "b:start"));
    EXPECT_EQ(router->get_statistics().handler_count, 2u);
}

TEST_F(MessageRouterTest, UnknownHandlerFailsStartup) {
    auto router = make_router({"echo", "missing"});

    auto started = router->ensure_started();
    ASSERT_EXPECTED_ERROR(started);
    EXPECT_EQ(started.error(), router_error::unknown_handler);
    EXPECT_FALSE(router->is_started());

    auto incoming = router->process_incoming("carrier", "+1555", "hi");
    ASSERT_EXPECTED_ERROR(incoming);
    EXPECT_EQ(incoming.error(), router_error::unknown_handler);
    EXPECT_TRUE(store_->messages().empty());
}

TEST_F(MessageRouterTest, FailedStartCanBeRetried) {
    auto attempts = std::make_shared<int>(0);
    register_recording("flaky", [attempts](recording_handler& h) {
        h.on_start = [attempts] {
            if ((*attempts)++ == 0) {
                throw std::runtime_error("warming up");
            }
        };
    });
    auto router = make_router({"flaky"});

    auto first = router->ensure_started();
    ASSERT_EXPECTED_ERROR(first);
    EXPECT_EQ(first.error(), router_error::handler_start_failed);
    EXPECT_FALSE(router->is_started());
    EXPECT_TRUE(logger().contains("warming up"));

    ASSERT_EXPECTED_OK(router->ensure_started());
    EXPECT_TRUE(router->is_started());
    EXPECT_EQ(instantiations_->load(), 2);
}

TEST_F(MessageRouterTest, MissingCollaboratorFailsStartup) {
    message_router router({}, store_, nullptr, registry_, delivery_);

    auto started = router.ensure_started();
    ASSERT_EXPECTED_ERROR(started);
    EXPECT_EQ(started.error(), router_error::startup_failed);
}

// =============================================================================
// Backlog
// =============================================================================

TEST_F(MessageRouterTest, BacklogLoadedFromStoreOnStart) {
    auto first = seed_queued("one");
    auto second = seed_queued("two");
    auto router = make_router({});

    auto backlog = router->outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    ASSERT_EQ(backlog->size(), 2u);
    EXPECT_EQ((*backlog)[0].id, first.id);
    EXPECT_EQ((*backlog)[1].id, second.id);
    EXPECT_EQ(router->get_statistics().backlog_size, 2u);
}

TEST_F(MessageRouterTest, QueuedSendJoinsBacklog) {
    delivery_->succeed = false;
    auto router = make_router({});

    core::connection target{0, "carrier", "+15550004444"};
    auto result = router->send_outgoing(target, "later");
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->status, core::message_status::queued);

    auto backlog = router->outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    ASSERT_EQ(backlog->size(), 1u);
    EXPECT_EQ((*backlog)[0].id, result->id);
}

TEST_F(MessageRouterTest, MarkSentLeavesBacklog) {
    auto queued = seed_queued("receipt pending");
    auto router = make_router({});

    auto sent = router->mark_sent(queued.id);
    ASSERT_EXPECTED_OK(sent);
    EXPECT_EQ(sent->status, core::message_status::sent);

    auto backlog = router->outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    EXPECT_TRUE(backlog->empty());

    // A second receipt is a no-op
    auto again = router->mark_sent(queued.id);
    ASSERT_EXPECTED_OK(again);
    EXPECT_EQ(again->status, core::message_status::sent);
}

TEST_F(MessageRouterTest, MarkSentRejections) {
    register_recording("stopper", [](recording_handler& h) {
        h.on_outgoing = [](core::outgoing_message&) { return send_decision::cancel; };
    });
    auto router = make_router({"stopper"});

    auto unknown = router->mark_sent(4242);
    ASSERT_EXPECTED_ERROR(unknown);
    EXPECT_EQ(unknown.error(), router_error::message_not_found);

    core::connection target{0, "carrier", "+1555"};
    auto cancelled = router->send_outgoing(target, "nope");
    ASSERT_EXPECTED_OK(cancelled);
    auto rejected = router->mark_sent(cancelled->id);
    ASSERT_EXPECTED_ERROR(rejected);
    EXPECT_EQ(rejected.error(), router_error::invalid_transition);
}

TEST_F(MessageRouterTest, RetryQueued) {
    seed_queued("one");
    seed_queued("two");
    delivery_->succeed = false;
    auto router = make_router({});

    auto failed = router->retry_queued();
    ASSERT_EXPECTED_OK(failed);
    EXPECT_EQ(failed->attempted, 2u);
    EXPECT_EQ(failed->sent, 0u);
    EXPECT_EQ(failed->still_queued, 2u);
    EXPECT_EQ(router->get_statistics().backlog_size, 2u);

    delivery_->succeed = true;
    auto retried = router->retry_queued();
    ASSERT_EXPECTED_OK(retried);
    EXPECT_EQ(retried->attempted, 2u);
    EXPECT_EQ(retried->sent, 2u);
    EXPECT_EQ(retried->still_queued, 0u);

    auto backlog = router->outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    EXPECT_TRUE(backlog->empty());
    EXPECT_EQ(delivery_->calls().size(), 4u);
}

TEST_F(MessageRouterTest, RetrySendsRewrittenPayload) {
    register_recording("premium", [](recording_handler& h) {
        h.on_outgoing = [](core::outgoing_message& msg) {
            msg.text = "REWRITTEN";
            msg.params["smsc"] = "premium";
            return send_decision::proceed;
        };
    });

    auto status = std::make_shared<std::atomic<int>>(500);
    auto urls = std::make_shared<std::vector<std::string>>();
    delivery::gateway_config gateway;
    gateway.url = "http://gw/send?to={recipient}&text={text}&smsc={smsc}";
    auto gateway_client = std::make_shared<delivery::gateway_delivery_client>(
        gateway, std::make_unique<delivery::callback_http_client>(
                     [status, urls](const delivery::http_request& request)
                         -> std::expected<delivery::http_response, delivery::http_error> {
                         urls->push_back(request.url);
                         delivery::http_response response;
                         response.status_code = status->load();
                         return response;
                     }));

    router_config config;
    config.handler_names = {"premium"};
    message_router first(config, store_, store_, registry_, gateway_client);

    core::connection target{0, "carrier", "+1555"};
    auto queued = first.send_outgoing(target, "original");
    ASSERT_EXPECTED_OK(queued);
    EXPECT_EQ(queued->status, core::message_status::queued);
    EXPECT_EQ(queued->text, "REWRITTEN");

    auto stored = store_->get_message(queued->id);
    ASSERT_EXPECTED_OK(stored);
    EXPECT_EQ(stored->text, "REWRITTEN");
    EXPECT_THAT(stored->params, ElementsAre(Pair("smsc", "premium")));

    // A fresh router rebuilds its backlog from the store alone
    status->store(200);
    message_router second(config, store_, store_, registry_, gateway_client);
    auto retried = second.retry_queued();
    ASSERT_EXPECTED_OK(retried);
    EXPECT_EQ(retried->sent, 1u);

    ASSERT_EQ(urls->size(), 2u);
    EXPECT_EQ((*urls)[0], "http://gw/send?to=%2B1555&text=REWRITTEN&smsc=premium");
    EXPECT_EQ((*urls)[1], (*urls)[0]);
}

TEST_F(MessageRouterTest, FailedReplyDoesNotDropOthers) {
    register_recording("chatty", [](recording_handler& h) {
        h.on_handle = [](core::incoming_message& msg) {
            msg.respond("one");
            msg.respond("two");
            msg.respond("three");
            return true;
        };
    });

    // Creates: inbound, "one", "two" (fails), "three"
    auto flaky = std::make_shared<flaky_store>(store_);
    flaky->fail_create_number = 3;
    router_config config;
    config.handler_names = {"chatty"};
    message_router router(config, flaky, store_, registry_, nullptr);

    auto result = router.process_incoming("carrier", "+15550001111", "hi");
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->message.status, core::message_status::handled);
    EXPECT_EQ(result->failed_replies, 1u);
    ASSERT_EQ(result->replies.size(), 2u);
    EXPECT_EQ(result->replies[0].text, "one");
    EXPECT_EQ(result->replies[1].text, "three");
    EXPECT_TRUE(logger().contains("dropped"));

    auto stored = store_->responses_to(result->message.id);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].status, core::message_status::queued);

    auto backlog = router.outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    ASSERT_EQ(backlog->size(), 2u);
    EXPECT_EQ((*backlog)[0].text, "one");
    EXPECT_EQ((*backlog)[1].text, "three");
}

TEST_F(MessageRouterTest, RetryContinuesPastStoreFailure) {
    auto stuck = seed_queued("stuck");
    seed_queued("fine");

    auto flaky = std::make_shared<flaky_store>(store_);
    flaky->fail_updates_for.insert(stuck.id);
    router_config config;
    message_router router(config, flaky, store_, registry_, delivery_);

    auto summary = router.retry_queued();
    ASSERT_EXPECTED_OK(summary);
    EXPECT_EQ(summary->attempted, 2u);
    EXPECT_EQ(summary->sent, 1u);
    EXPECT_EQ(summary->failed, 1u);
    EXPECT_TRUE(logger().contains("retry failed"));

    auto backlog = router.outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    ASSERT_EQ(backlog->size(), 1u);
    EXPECT_EQ((*backlog)[0].id, stuck.id);
}

TEST_F(MessageRouterTest, StatisticsBeforeAndAfterStart) {
    auto router = make_router({"echo"});
    auto before = router->get_statistics();
    EXPECT_FALSE(before.started);
    EXPECT_EQ(before.handler_count, 0u);

    ASSERT_EXPECTED_OK(router->process_incoming("carrier", "+1555", "hi"));
    auto after = router->get_statistics();
    EXPECT_TRUE(after.started);
    EXPECT_EQ(after.handler_count, 1u);
    EXPECT_EQ(after.dispatch_stats.inbound_messages, 1u);
    EXPECT_EQ(after.dispatch_stats.sent_messages, 1u);
}

}  // namespace
}  // namespace sms::relay::router
