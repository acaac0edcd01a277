/**
 * @file relay_service_test.cpp
 * @brief Unit tests for assembling a relay from configuration
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sms/relay/relay_service.h"

#include "utils/test_helpers.h"

namespace sms::relay {
namespace {

using namespace ::testing;
using namespace sms::relay::test;

class RelayServiceTest : public sms_relay_test {
protected:
    config::relay_config memory_config() {
        auto config = config::config_loader::get_default_config();
        config.server.name = "UNIT_RELAY";
        config.store.type = storage::store_type::memory;
        config.routing.handlers = {"echo"};
        config.handler_options["echo"]["prefix"] = "re: ";
        return config;
    }

    std::unique_ptr<delivery::http_client_adapter> recording_transport(int status = 200) {
        return std::make_unique<delivery::callback_http_client>(
            [this, status](const delivery::http_request& request)
                -> std::expected<delivery::http_response, delivery::http_error> {
                urls_.push_back(request.url);
                delivery::http_response response;
                response.status_code = status;
                return response;
            });
    }

    std::vector<std::string> urls_;
};

TEST_F(RelayServiceTest, ErrorCodeValues) {
    EXPECT_EQ(to_error_code(service_error::invalid_configuration), -800);
    EXPECT_EQ(to_error_code(service_error::store_open_failed), -802);
    EXPECT_STREQ(to_string(service_error::config_load_failed),
                 "Failed to load configuration");
}

TEST_F(RelayServiceTest, AccessorsReflectConfiguration) {
    auto service = relay_service::create(memory_config());
    ASSERT_EXPECTED_OK(service);

    EXPECT_EQ((*service)->name(), "UNIT_RELAY");
    EXPECT_THAT((*service)->config().routing.handlers, ElementsAre("echo"));
    EXPECT_NE((*service)->store().messages, nullptr);
    EXPECT_NE((*service)->store().connections, nullptr);
    EXPECT_FALSE((*service)->get_router().is_started());
}

TEST_F(RelayServiceTest, NullRegistryGetsBuiltins) {
    auto service = relay_service::create(memory_config());
    ASSERT_EXPECTED_OK(service);

    auto& registry = (*service)->registry();
    EXPECT_TRUE(registry.has_factory("echo"));
    EXPECT_TRUE(registry.has_factory("blocklist"));
    EXPECT_TRUE(registry.has_factory("default_reply"));
}

TEST_F(RelayServiceTest, EchoRoundTripThroughGateway) {
    auto config = memory_config();
    config.delivery.gateway_url = "http://gw/send?to={recipient}&text={text}";

    auto service = relay_service::create(config, nullptr, recording_transport(202));
    ASSERT_EXPECTED_OK(service);

    auto result = (*service)->get_router().process_incoming("carrier", "+15550001111", "ping");
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->message.status, core::message_status::handled);
    ASSERT_EQ(result->replies.size(), 1u);
    EXPECT_EQ(result->replies[0].text, "re: ping");
    EXPECT_EQ(result->replies[0].status, core::message_status::sent);
    EXPECT_EQ(result->replies[0].in_response_to, result->message.id);

    ASSERT_EQ(urls_.size(), 1u);
    EXPECT_EQ(urls_[0], "http://gw/send?to=%2B15550001111&text=re%3A+ping");
}

TEST_F(RelayServiceTest, MissingGatewayQueuesReplies) {
    auto service = relay_service::create(memory_config(), nullptr, recording_transport());
    ASSERT_EXPECTED_OK(service);
    EXPECT_TRUE(logger().contains("no gateway configured"));

    auto& router = (*service)->get_router();
    auto result = router.process_incoming("carrier", "+15550001111", "ping");
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->replies.size(), 1u);
    EXPECT_EQ(result->replies[0].status, core::message_status::queued);
    EXPECT_TRUE(urls_.empty());

    auto backlog = router.outgoing_backlog();
    ASSERT_EXPECTED_OK(backlog);
    EXPECT_EQ(backlog->size(), 1u);
}

TEST_F(RelayServiceTest, InvalidConfigurationRejected) {
    auto config = memory_config();
    config.delivery.gateway_url = "ftp://gw/";
    config.routing.handlers = {"echo", "echo"};

    auto service = relay_service::create(config);
    ASSERT_EXPECTED_ERROR(service);
    EXPECT_EQ(service.error(), service_error::invalid_configuration);
    EXPECT_TRUE(logger().contains("delivery.gateway_url"));
}

TEST_F(RelayServiceTest, UnopenableStoreRejected) {
    auto config = memory_config();
    config.store.type = storage::store_type::sqlite;
    config.store.database_path = "/nonexistent-dir/sub/relay.db";

    auto service = relay_service::create(config);
    ASSERT_EXPECTED_ERROR(service);
    EXPECT_EQ(service.error(), service_error::store_open_failed);
}

TEST_F(RelayServiceTest, SqliteStoreFromConfiguration) {
    temp_path db;
    auto config = memory_config();
    config.store.type = storage::store_type::sqlite;
    config.store.database_path = db.string();

    auto service = relay_service::create(config, nullptr, recording_transport());
    ASSERT_EXPECTED_OK(service);

    auto message = (*service)->get_router().handle_incoming("carrier", "+1555", "hi");
    ASSERT_EXPECTED_OK(message);

    auto stored = (*service)->store().messages->get_message(message->id);
    ASSERT_EXPECTED_OK(stored);
    EXPECT_EQ(stored->text, "hi");
}

TEST_F(RelayServiceTest, CreateFromMissingFile) {
    auto service = relay_service::create_from_file("/nonexistent/sms_relay.yaml");
    ASSERT_EXPECTED_ERROR(service);
    EXPECT_EQ(service.error(), service_error::config_load_failed);
}

TEST_F(RelayServiceTest, CreateFromFileWithInvalidValues) {
    temp_path file(".yaml");
    file.write("storage:\n  type: postgres\n");

    auto service = relay_service::create_from_file(file.path());
    ASSERT_EXPECTED_ERROR(service);
    EXPECT_EQ(service.error(), service_error::invalid_configuration);
}

TEST_F(RelayServiceTest, CreateFromFile) {
    temp_path file(".yaml");
    file.write(R"(
server:
  name: FILE_RELAY
router:
  handlers: [default_reply]
handler_options:
  default_reply:
    text: "Unknown command"
storage:
  type: memory
logging:
  level: debug
)");

    auto service = relay_service::create_from_file(file.path());
    ASSERT_EXPECTED_OK(service);
    EXPECT_EQ((*service)->name(), "FILE_RELAY");
    EXPECT_EQ(integration::get_logger().get_level(), integration::log_level::debug);

    auto result = (*service)->get_router().process_incoming("carrier", "+1555", "???");
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->replies.size(), 1u);
    EXPECT_EQ(result->replies[0].text, "Unknown command");
}

}  // namespace
}  // namespace sms::relay
