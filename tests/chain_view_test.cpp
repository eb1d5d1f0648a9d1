#include <string>
#include <vector>

#include <glaze/glaze.hpp>
#include <gtest/gtest.h>

#include "fake_store.hpp"
#include "views/chain_view.hpp"

using namespace mailbridge;
using mailbridge::fakes::at_minute;

namespace {
    mail::email_record record(std::string id, std::string subject, int minute,
                              mail::mailbox_kind mailbox = mail::mailbox_kind::personal) {
        mail::email_record r;
        r.id = std::move(id);
        r.subject = std::move(subject);
        r.received = at_minute(minute);
        r.mailbox = mailbox;
        r.folder = "Inbox";
        r.sender_name = "Alice";
        r.sender_email = "alice@corp.test";
        r.recipients = {"Bob", "Carol", "Dave"};
        r.body = "The quick brown fox jumps over the lazy dog";
        return r;
    }

    hosts::chain_result chain_of(std::vector<mail::email_record> records) {
        hosts::chain_result chain;
        chain.result.records = std::move(records);
        chain.result.strategy = mail::strategy_kind::index;
        chain.conversations = views::group_conversations(chain.result.records);
        return chain;
    }
}

TEST(ChainView, IsoTimestampsAreUtc) {
    EXPECT_EQ(views::iso_time(at_minute(90)), "2024-03-01T01:30:00Z");
}

TEST(ChainView, TruncationHappensAtFormatTime) {
    auto chain = chain_of({record("1", "Issue", 1)});

    auto full = views::format_chain("issue", chain, {0, 10});
    auto trimmed = views::format_chain("issue", chain, {9, 2});

    auto const& full_message = full.conversations[0].messages[0];
    EXPECT_EQ(full_message.body, "The quick brown fox jumps over the lazy dog");
    EXPECT_FALSE(full_message.body_truncated);
    EXPECT_EQ(full_message.recipients.size(), 3u);

    auto const& short_message = trimmed.conversations[0].messages[0];
    EXPECT_EQ(short_message.body, "The quick [truncated]");
    EXPECT_TRUE(short_message.body_truncated);
    EXPECT_EQ(short_message.recipients, (std::vector<std::string>{"Bob", "Carol"}));
    EXPECT_EQ(short_message.total_recipients, 3u);

    // the source records keep full fidelity
    EXPECT_EQ(chain.result.records[0].recipients.size(), 3u);
}

TEST(ChainView, ConversationStatistics) {
    auto chain = chain_of({
        record("1", "Issue A", 0),
        record("2", "RE: Issue A", 120, mail::mailbox_kind::shared),
        record("3", "Issue B", 60),
    });

    auto payload = views::format_chain("issue", chain, {});

    ASSERT_EQ(payload.conversations.size(), 2u);
    auto const& first = payload.conversations[0];
    EXPECT_EQ(first.stats.message_count, 2u);
    EXPECT_DOUBLE_EQ(first.stats.span_hours, 2.0);
    EXPECT_EQ(first.stats.first_message, "2024-03-01T00:00:00Z");
    EXPECT_EQ(first.stats.last_message, "2024-03-01T02:00:00Z");
    EXPECT_EQ(first.stats.mailbox_distribution.at("personal"), 1u);
    EXPECT_EQ(first.stats.mailbox_distribution.at("shared"), 1u);
    EXPECT_EQ(first.timeline.size(), 2u);
    // Alice plus three recipients, deduplicated across both messages
    EXPECT_EQ(first.participants.size(), 4u);
    EXPECT_EQ(first.participants[0], "Alice <alice@corp.test>");

    EXPECT_EQ(payload.summary.total_emails, 3u);
    EXPECT_EQ(payload.summary.conversations, 2u);
    ASSERT_TRUE(payload.summary.date_range.has_value());
    EXPECT_EQ(payload.summary.date_range->first, "2024-03-01T00:00:00Z");
    EXPECT_EQ(payload.summary.strategy, "index");
    EXPECT_EQ(payload.status, "success");
}

TEST(ChainView, FailuresAreAnnotated) {
    auto chain = chain_of({record("1", "Issue", 1)});
    chain.result.failures.push_back({mail::mailbox_kind::shared, "permission denied"});

    auto payload = views::format_chain("issue", chain, {});

    EXPECT_EQ(payload.status, "partial");
    ASSERT_EQ(payload.summary.failures.size(), 1u);
    EXPECT_EQ(payload.summary.failures[0].mailbox, "shared");
    EXPECT_FALSE(payload.summary.failures[0].folder.has_value());
}

TEST(ChainView, FolderFailuresNameTheFolder) {
    auto chain = chain_of({record("1", "Issue", 1)});
    chain.result.failures.push_back({mail::mailbox_kind::personal, "SEARCH timed out", "INBOX"});

    auto payload = views::format_chain("issue", chain, {});
    std::string json;
    ASSERT_FALSE(glz::write_json(payload, json));

    glz::json_t parsed;
    ASSERT_FALSE(glz::read_json(parsed, json));
    EXPECT_EQ(parsed["status"].get_string(), "partial");
    auto& failed = parsed["summary"]["failed_mailboxes"].get_array();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]["mailbox"].get_string(), "personal");
    EXPECT_EQ(failed[0]["folder"].get_string(), "INBOX");
    EXPECT_EQ(failed[0]["reason"].get_string(), "SEARCH timed out");
}

TEST(ChainView, BodyLimitCountsCharactersNotBytes) {
    auto message = record("1", "Issue", 1);
    // "caf" + e-acute + "s": five characters in six bytes
    message.body = "caf\xC3\xA9s";
    auto chain = chain_of({message});

    auto exact = views::format_chain("issue", chain, {5, 10});
    EXPECT_EQ(exact.conversations[0].messages[0].body, "caf\xC3\xA9s");
    EXPECT_FALSE(exact.conversations[0].messages[0].body_truncated);

    auto cut = views::format_chain("issue", chain, {4, 10});
    EXPECT_EQ(cut.conversations[0].messages[0].body, "caf\xC3\xA9 [truncated]");
    EXPECT_TRUE(cut.conversations[0].messages[0].body_truncated);
}

TEST(ChainView, SerializesToExpectedShape) {
    auto payload = views::format_chain("issue", chain_of({record("1", "Issue", 1)}), {});
    std::string json;
    ASSERT_FALSE(glz::write_json(payload, json));

    glz::json_t parsed;
    ASSERT_FALSE(glz::read_json(parsed, json));
    ASSERT_TRUE(parsed.contains("conversations"));
    ASSERT_TRUE(parsed.contains("summary"));
    auto& conversation = parsed["conversations"].get_array()[0];
    EXPECT_TRUE(conversation.contains("participants"));
    EXPECT_TRUE(conversation.contains("timeline"));
    EXPECT_TRUE(conversation.contains("messages"));
    EXPECT_TRUE(conversation.contains("stats"));
    EXPECT_EQ(parsed["summary"]["total_emails"].get_number(), 1.0);
}

TEST(ChainView, AccessPayloadForUnconfiguredSharedMailbox) {
    hosts::access_report report;
    report.connected = true;
    report.personal = {true, "me@corp.test", true, 6, {}};
    report.shared.configured = false;
    report.shared.name = "Operations";

    auto payload = views::format_access(report);
    std::string json;
    ASSERT_FALSE(glz::write_json(payload, json));

    glz::json_t parsed;
    ASSERT_FALSE(glz::read_json(parsed, json));
    EXPECT_EQ(parsed["status"].get_string(), "success");
    EXPECT_FALSE(parsed["shared_mailbox"]["configured"].get<bool>());
    EXPECT_FALSE(parsed["personal_mailbox"].contains("configured"));
    EXPECT_EQ(parsed["personal_mailbox"]["retention_months"].get_number(), 6.0);
    EXPECT_FALSE(parsed.contains("errors"));
}
