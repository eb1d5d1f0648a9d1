#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "models/mail/message.hpp"

using namespace mailbridge;
using namespace std::chrono;

TEST(Message, HeaderLookupIsCaseInsensitiveAndUnfolds) {
    std::string header =
        "From: Alice <alice@corp.test>\r\n"
        "subject: Quarterly\r\n"
        "  numbers\r\n"
        "To: bob@corp.test\r\n";

    EXPECT_EQ(mail::message::get_header_field(header, "Subject"), "Quarterly numbers");
    EXPECT_EQ(mail::message::get_header_field(header, "TO"), "bob@corp.test");
    EXPECT_EQ(mail::message::get_header_field(header, "Cc"), "");
}

TEST(Message, DecodesEncodedWords) {
    EXPECT_EQ(mail::message::decode_header("=?UTF-8?B?SGVsbG8gV29ybGQ=?="), "Hello World");
    EXPECT_EQ(mail::message::decode_header("=?iso-8859-1?Q?Caf=E9_au_lait?="), "Caf\xE9 au lait");
    EXPECT_EQ(mail::message::decode_header("Re: =?UTF-8?Q?a?= =?UTF-8?Q?b?= end"), "Re: ab end");
    EXPECT_EQ(mail::message::decode_header("plain text"), "plain text");
}

TEST(Message, DecodesTransferEncodings) {
    EXPECT_EQ(mail::message::decode_quoted_printable("caf=C3=A9 =\r\nsoft"), "caf\xC3\xA9 soft");
    EXPECT_EQ(mail::message::decode_base64("SGVs\r\nbG8="), "Hello");
}

TEST(Message, ParsesAddresses) {
    auto a = mail::message::parse_address("\"Doe, Jane\" <jane@corp.test>");
    EXPECT_EQ(a.name, "Doe, Jane");
    EXPECT_EQ(a.email, "jane@corp.test");

    auto list = mail::message::parse_address_list("\"Doe, Jane\" <jane@corp.test>, bob@corp.test");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1].email, "bob@corp.test");
    EXPECT_EQ(list[1].display(), "bob@corp.test");
}

TEST(Message, ParsesDatesWithZones) {
    auto expected = sys_days{year{2025} / 7 / 1} + 8h + 15min;

    EXPECT_EQ(mail::message::parse_date("Tue, 1 Jul 2025 10:15:00 +0200"), expected);
    EXPECT_EQ(mail::message::parse_date("1 Jul 2025 08:15 GMT"), expected);
    EXPECT_EQ(mail::message::parse_date("Tue, 01 Jul 2025 04:15:00 -0400 (EDT)"), expected);
    EXPECT_FALSE(mail::message::parse_date("yesterday").has_value());
    EXPECT_FALSE(mail::message::parse_date("31 Feb 2025 10:00:00 +0000").has_value());
}

TEST(Message, ThreadKeyPrefersReferencesRoot) {
    EXPECT_EQ(mail::message::thread_key("Message-ID: <c@x>\r\nIn-Reply-To: <b@x>\r\nReferences: <a@x> <b@x>\r\n"), "<a@x>");
    EXPECT_EQ(mail::message::thread_key("Message-ID: <c@x>\r\nIn-Reply-To: <b@x>\r\n"), "<b@x>");
    EXPECT_EQ(mail::message::thread_key("Message-ID: <c@x>\r\n"), "<c@x>");
    EXPECT_EQ(mail::message::thread_key("Subject: none\r\n"), "");
}

TEST(Message, Importance) {
    EXPECT_EQ(mail::message::importance("Importance: High\r\n"), 2);
    EXPECT_EQ(mail::message::importance("X-Priority: 5 (Lowest)\r\n"), 0);
    EXPECT_EQ(mail::message::importance("Subject: x\r\n"), 1);
}

TEST(Message, PrefersPlainTextPart) {
    std::string header = "Content-Type: multipart/alternative; boundary=\"b1\"\r\n";
    std::string body =
        "--b1\r\n"
        "Content-Type: text/html\r\n\r\n"
        "<p>html</p>\r\n"
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Transfer-Encoding: quoted-printable\r\n\r\n"
        "plain =3D text\r\n"
        "--b1--\r\n";

    auto text = mail::message::extract_text(header, body, true);
    EXPECT_NE(text.find("plain = text"), std::string::npos);
    EXPECT_EQ(text.find("html"), std::string::npos);
}

TEST(Message, FallsBackToCleanedHtml) {
    std::string header = "Content-Type: text/html; charset=utf-8\r\n";
    std::string body = "<html><style>p{color:red}</style><p>Disk&nbsp;full &amp; slow</p></html>";

    EXPECT_EQ(mail::message::extract_text(header, body, true), "Disk full & slow");
}

TEST(Message, BuildsRecordWithDefaults) {
    std::string header =
        "From: =?UTF-8?Q?Z=C3=BCrich_Ops?= <ops@corp.test>\r\n"
        "To: Bob <bob@corp.test>, carol@corp.test\r\n"
        "Cc: Dave <dave@corp.test>\r\n"
        "Date: Fri, 1 Mar 2024 09:30:00 +0000\r\n"
        "Message-ID: <m1@corp.test>\r\n"
        "Importance: low\r\n";

    auto record = mail::message::to_record(header, "body text", true);

    EXPECT_EQ(record.subject, "No Subject");
    EXPECT_EQ(record.sender_name, "Z\xC3\xBCrich Ops");
    EXPECT_EQ(record.sender_email, "ops@corp.test");
    EXPECT_EQ(record.recipients, (std::vector<std::string>{"Bob", "carol@corp.test", "Dave"}));
    EXPECT_EQ(record.received, sys_days{year{2024} / 3 / 1} + 9h + 30min);
    EXPECT_EQ(record.message_id, "<m1@corp.test>");
    EXPECT_EQ(record.thread_key, "<m1@corp.test>");
    EXPECT_EQ(record.importance, 0);
    EXPECT_EQ(record.body, "body text");
}

TEST(Message, UnknownSenderWhenFromIsMissing) {
    auto record = mail::message::to_record("Subject: hi\r\n", "", false);
    EXPECT_EQ(record.sender_name, "Unknown");
    EXPECT_EQ(record.subject, "hi");
}

TEST(Message, TextPrefixDecodesTransferEncodings) {
    std::string base64_header = "Content-Type: text/plain; charset=utf-8\r\nContent-Transfer-Encoding: base64\r\n";
    // "Disk full on db01" with the tail of the section cut off
    EXPECT_EQ(mail::message::text_prefix(base64_header, "RGlzayBmdWxsIG9uIGRiMD", 9, false), "Disk full");

    std::string qp_header = "Content-Type: text/plain\r\nContent-Transfer-Encoding: quoted-printable\r\n";
    EXPECT_EQ(mail::message::text_prefix(qp_header, "caf=C3=A9 au =\r\nlait", 100, false), "caf\xC3\xA9 au lait");
    EXPECT_EQ(mail::message::text_prefix(qp_header, "caf=C3=A9 au lait", 4, false), "caf\xC3\xA9");
}

TEST(Message, TextPrefixSkipsMimeStructure) {
    std::string header = "Content-Type: multipart/alternative; boundary=\"b1\"\r\n";
    // the section ends inside the html part
    std::string body =
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Transfer-Encoding: base64\r\n\r\n"
        "UmVwbGljYSBsYWcgb24gZGIwMg==\r\n"
        "--b1\r\n"
        "Content-Type: text/html\r\n\r\n"
        "<p>Replica";

    auto prefix = mail::message::text_prefix(header, body, 50, true);
    EXPECT_EQ(helpers::StringHelper::trim(prefix), "Replica lag on db02");
    EXPECT_EQ(prefix.find("--b1"), std::string::npos);
}
