#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include <glaze/glaze.hpp>
#include <gtest/gtest.h>

#include "fake_store.hpp"
#include "mcp/stdio_server.hpp"

using namespace mailbridge;
using mailbridge::fakes::at_minute;

namespace {
    class StdioServerTest : public ::testing::Test {
    protected:
        StdioServerTest()
            : host{connector, cache, search::search_engine{search::search_options{}}, mailbox_pool,
                   hosts::host_options{true, "Operations"}},
              dispatcher{host, views::format_options{}, mail::search_scope::inbox_only, 500} {}

        // Runs the server over the given lines and returns every reply
        std::vector<glz::json_t> exchange(const std::vector<std::string>& lines) {
            std::string input;
            for (auto const& line : lines) {
                input += line + "\n";
            }
            std::istringstream in{input};
            std::ostringstream out;
            mcp::stdio_server server{dispatcher, request_pool, "imap_url = imaps://mail.corp.test/\n", in, out};
            EXPECT_EQ(server.run(), 0);

            std::vector<glz::json_t> replies;
            std::istringstream written{out.str()};
            for (std::string line; std::getline(written, line);) {
                glz::json_t reply;
                EXPECT_FALSE(glz::read_json(reply, line)) << line;
                replies.push_back(std::move(reply));
            }
            return replies;
        }

        static glz::json_t* by_id(std::vector<glz::json_t>& replies, double id) {
            for (auto& reply : replies) {
                if (reply.contains("id") && reply["id"].is_number() && reply["id"].get_number() == id) {
                    return &reply;
                }
            }
            return nullptr;
        }

        fakes::fake_world world;
        fakes::fake_store store{world};
        mail::connector connector{store, mail::connector_options{2, std::chrono::milliseconds{1}, std::chrono::minutes{1}},
                                  [](std::chrono::milliseconds) {}};
        cache::result_cache cache{100, std::chrono::hours{1}};
        helpers::worker_pool mailbox_pool{4, "test-mailboxes"};
        helpers::worker_pool request_pool{2, "test-requests"};
        hosts::mailbox_host host;
        mcp::tool_dispatcher dispatcher;
    };
}

TEST_F(StdioServerTest, InitializeNegotiatesProtocolVersion) {
    auto replies = exchange({
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})",
        R"({"jsonrpc":"2.0","id":2,"method":"initialize","params":{"protocolVersion":"1999-01-01"}})",
    });

    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0]["result"]["protocolVersion"].get_string(), "2024-11-05");
    EXPECT_EQ(replies[0]["result"]["serverInfo"]["name"].get_string(), "mailbridge");
    EXPECT_TRUE(replies[0]["result"]["capabilities"].contains("tools"));
    EXPECT_EQ(replies[1]["result"]["protocolVersion"].get_string(), "2025-06-18");
}

TEST_F(StdioServerTest, NotificationsGetNoReply) {
    auto replies = exchange({
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
        R"({"jsonrpc":"2.0","id":"p","method":"ping"})",
    });

    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["id"].get_string(), "p");
    EXPECT_TRUE(replies[0]["result"].is_object());
}

TEST_F(StdioServerTest, ToolsListDescribesEveryTool) {
    auto replies = exchange({R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"});

    ASSERT_EQ(replies.size(), 1u);
    auto& tools = replies[0]["result"]["tools"].get_array();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"].get_string(), "check_mailbox_access");
    EXPECT_EQ(tools[1]["name"].get_string(), "get_email_chain");
    EXPECT_EQ(tools[2]["name"].get_string(), "analyze_alerts");
    EXPECT_TRUE(tools[1]["inputSchema"]["properties"].contains("search_text"));
}

TEST_F(StdioServerTest, ProtocolErrors) {
    auto replies = exchange({
        "{not json",
        R"([1,2,3])",
        R"({"jsonrpc":"2.0","id":3})",
        R"({"jsonrpc":"2.0","id":4,"method":"bogus/method"})",
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{}})",
    });

    ASSERT_EQ(replies.size(), 5u);
    EXPECT_EQ(replies[0]["error"]["code"].get_number(), -32700.0);
    EXPECT_TRUE(replies[0]["id"].is_null());
    EXPECT_EQ(replies[1]["error"]["code"].get_number(), -32600.0);
    EXPECT_EQ(replies[2]["error"]["code"].get_number(), -32600.0);
    EXPECT_EQ(replies[3]["error"]["code"].get_number(), -32601.0);
    EXPECT_EQ(replies[4]["error"]["code"].get_number(), -32602.0);
}

TEST_F(StdioServerTest, ToolCallsAnswerBeforeShutdown) {
    world.add(mail::mailbox_kind::personal, {.subject = "Deploy failed", .received = at_minute(1)});

    auto replies = exchange({
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_email_chain","arguments":{"search_text":"deploy"}}})",
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"get_email_chain","arguments":{}}})",
    });

    ASSERT_EQ(replies.size(), 2u);

    auto* ok = by_id(replies, 1);
    ASSERT_NE(ok, nullptr);
    EXPECT_FALSE((*ok)["result"]["isError"].get<bool>());
    auto& content = (*ok)["result"]["content"].get_array();
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"].get_string(), "text");

    glz::json_t payload;
    ASSERT_FALSE(glz::read_json(payload, content[0]["text"].get_string()));
    EXPECT_EQ(payload["summary"]["total_emails"].get_number(), 1.0);

    auto* failed = by_id(replies, 2);
    ASSERT_NE(failed, nullptr);
    EXPECT_TRUE((*failed)["result"]["isError"].get<bool>());
}

TEST_F(StdioServerTest, ConfigurationResource) {
    auto replies = exchange({
        R"({"jsonrpc":"2.0","id":1,"method":"resources/list"})",
        R"({"jsonrpc":"2.0","id":2,"method":"resources/read","params":{"uri":"mailbridge://config"}})",
        R"({"jsonrpc":"2.0","id":3,"method":"resources/read","params":{"uri":"mailbridge://other"}})",
    });

    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[0]["result"]["resources"].get_array()[0]["uri"].get_string(), "mailbridge://config");
    auto& contents = replies[1]["result"]["contents"].get_array();
    EXPECT_NE(contents[0]["text"].get_string().find("imap_url"), std::string::npos);
    EXPECT_EQ(replies[2]["error"]["code"].get_number(), -32602.0);
}
