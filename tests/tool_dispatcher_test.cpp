#include <chrono>
#include <string>

#include <glaze/glaze.hpp>
#include <gtest/gtest.h>

#include "fake_store.hpp"
#include "mcp/tool_dispatcher.hpp"

using namespace mailbridge;
using mailbridge::fakes::at_minute;

namespace {
    glz::json_t json(const std::string& text) {
        glz::json_t value;
        EXPECT_FALSE(glz::read_json(value, text)) << text;
        return value;
    }

    class ToolDispatcherTest : public ::testing::Test {
    protected:
        ToolDispatcherTest()
            : host{connector, cache, search::search_engine{search::search_options{}}, pool,
                   hosts::host_options{true, "Operations"}},
              dispatcher{host, views::format_options{19, 5}, mail::search_scope::inbox_only, 500} {}

        fakes::fake_world world;
        fakes::fake_store store{world};
        mail::connector connector{store, mail::connector_options{2, std::chrono::milliseconds{1}, std::chrono::minutes{1}},
                                  [](std::chrono::milliseconds) {}};
        cache::result_cache cache{100, std::chrono::hours{1}};
        helpers::worker_pool pool{2, "test-mailboxes"};
        hosts::mailbox_host host;
        mcp::tool_dispatcher dispatcher;
    };
}

TEST_F(ToolDispatcherTest, CheckMailboxAccess) {
    auto reply = dispatcher.call("check_mailbox_access", json("{}"));

    ASSERT_FALSE(reply.is_error);
    auto payload = json(reply.text);
    EXPECT_EQ(payload["status"].get_string(), "success");
    EXPECT_TRUE(payload["connection"]["connected"].get<bool>());
    EXPECT_TRUE(payload["shared_mailbox"]["accessible"].get<bool>());
}

TEST_F(ToolDispatcherTest, MissingSearchTextIsAValidationError) {
    auto reply = dispatcher.call("get_email_chain", json(R"({"include_shared":false})"));

    ASSERT_TRUE(reply.is_error);
    auto payload = json(reply.text);
    EXPECT_EQ(payload["status"].get_string(), "error");
    EXPECT_EQ(payload["tool"].get_string(), "get_email_chain");
    EXPECT_NE(payload["error"].get_string().find("search_text"), std::string::npos);
    EXPECT_FALSE(payload["troubleshooting"].get_array().empty());
    EXPECT_EQ(world.total_calls(), 0u);
}

TEST_F(ToolDispatcherTest, WrongArgumentTypesAreRejected) {
    EXPECT_TRUE(dispatcher.call("get_email_chain", json(R"({"search_text":42})")).is_error);
    EXPECT_TRUE(dispatcher.call("get_email_chain", json(R"({"search_text":"x","include_shared":"no"})")).is_error);
    EXPECT_TRUE(dispatcher.call("get_email_chain", json(R"(["x"])")).is_error);
    EXPECT_EQ(world.total_calls(), 0u);
}

TEST_F(ToolDispatcherTest, UnknownToolIsReported) {
    auto reply = dispatcher.call("delete_everything", json("{}"));

    ASSERT_TRUE(reply.is_error);
    EXPECT_NE(json(reply.text)["error"].get_string().find("Unknown tool"), std::string::npos);
}

TEST_F(ToolDispatcherTest, EmailChainAppliesDisplayLimits) {
    world.add(mail::mailbox_kind::personal, {.subject = "Deploy failed", .body = "Rollback started on every node of the cluster",
                                             .received = at_minute(1)});
    world.add(mail::mailbox_kind::shared, {.subject = "RE: Deploy failed", .body = "ack", .received = at_minute(4)});

    auto reply = dispatcher.call("get_email_chain", json(R"({"search_text":"deploy"})"));

    ASSERT_FALSE(reply.is_error) << reply.text;
    auto payload = json(reply.text);
    EXPECT_EQ(payload["status"].get_string(), "success");
    EXPECT_EQ(payload["summary"]["total_emails"].get_number(), 2.0);
    auto& conversation = payload["conversations"].get_array()[0];
    auto& first = conversation["messages"].get_array()[0];
    EXPECT_EQ(first["body"].get_string(), "Rollback started on [truncated]");
}

TEST_F(ToolDispatcherTest, PersonalOnlySearchSkipsSharedMailbox) {
    world.add(mail::mailbox_kind::personal, {.subject = "Deploy failed", .received = at_minute(1)});

    auto reply = dispatcher.call("get_email_chain", json(R"({"search_text":"deploy","include_shared":false})"));

    ASSERT_FALSE(reply.is_error);
    EXPECT_EQ(world.count("resolve:shared"), 0);
}

TEST_F(ToolDispatcherTest, PartialFailureIsAnnotated) {
    world.add(mail::mailbox_kind::personal, {.subject = "Deploy failed", .received = at_minute(1)});
    world.resolve_errors[mail::mailbox_kind::shared] = "access revoked";

    auto reply = dispatcher.call("get_email_chain", json(R"({"search_text":"deploy"})"));

    ASSERT_FALSE(reply.is_error);
    auto payload = json(reply.text);
    EXPECT_EQ(payload["status"].get_string(), "partial");
    auto& failed = payload["summary"]["failed_mailboxes"].get_array();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]["mailbox"].get_string(), "shared");
}

TEST_F(ToolDispatcherTest, TotalFailureIsAnError) {
    world.resolve_errors[mail::mailbox_kind::personal] = "down";
    world.resolve_errors[mail::mailbox_kind::shared] = "down";

    auto reply = dispatcher.call("get_email_chain", json(R"({"search_text":"deploy"})"));

    ASSERT_TRUE(reply.is_error);
    EXPECT_EQ(json(reply.text)["search_text"].get_string(), "deploy");
}

TEST_F(ToolDispatcherTest, UnreachableStoreIsAConnectionError) {
    world.failing_opens = 10;

    auto reply = dispatcher.call("check_mailbox_access", json("{}"));

    ASSERT_TRUE(reply.is_error);
    auto payload = json(reply.text);
    EXPECT_NE(payload["troubleshooting"].get_array()[0].get_string().find("reachable"), std::string::npos);
}

TEST_F(ToolDispatcherTest, AnalyzeAlerts) {
    world.add(mail::mailbox_kind::shared, {.subject = "ALERT disk full", .received = at_minute(0)});
    world.add(mail::mailbox_kind::shared, {.subject = "ALERT disk full", .received = at_minute(20)});

    auto reply = dispatcher.call("analyze_alerts", json(R"({"alert_pattern":"alert"})"));

    ASSERT_FALSE(reply.is_error) << reply.text;
    auto payload = json(reply.text);
    auto& alerts = payload["alerts"].get_array();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0]["occurrences"].get_number(), 2.0);
    EXPECT_EQ(alerts[0]["state"].get_string(), "active");
}
