#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "helpers/string_helper.hpp"

using mailbridge::helpers::StringHelper;

TEST(StringHelper, CaseInsensitiveMatching) {
    EXPECT_TRUE(StringHelper::contains_case_insensitive("Disk FULL on db01", "full"));
    EXPECT_FALSE(StringHelper::contains_case_insensitive("Disk", "disk full"));
    EXPECT_TRUE(StringHelper::contains_case_insensitive("anything", ""));
    EXPECT_TRUE(StringHelper::starts_with_case_insensitive("INBOX/Alerts", "inbox"));
    EXPECT_TRUE(StringHelper::equals_case_insensitive("\\Sent", "\\sent"));
    EXPECT_FALSE(StringHelper::equals_case_insensitive("Sent", "Sent Items"));
}

TEST(StringHelper, TrimAndCollapse) {
    EXPECT_EQ(StringHelper::trim("  \t text \r\n"), "text");
    EXPECT_EQ(StringHelper::collapse_whitespace("  a \n\n b\t c  "), "a b c");
    EXPECT_EQ(StringHelper::collapse_whitespace(""), "");
}

TEST(StringHelper, Truncate) {
    EXPECT_EQ(StringHelper::truncate("short", 10), "short");
    EXPECT_EQ(StringHelper::truncate("a long body", 0), "a long body");
    EXPECT_EQ(StringHelper::truncate("a long body", 6), "a long [truncated]");
}

TEST(StringHelper, TruncateCountsUtf8Characters) {
    // "caf" followed by the two byte encoding of e-acute
    EXPECT_EQ(StringHelper::truncate("caf\xC3\xA9s", 4, "..."), "caf\xC3\xA9...");
    EXPECT_EQ(StringHelper::truncate("caf\xC3\xA9", 4, "..."), "caf\xC3\xA9");

    // five Cyrillic letters, two bytes each
    std::string word = "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5";
    EXPECT_EQ(StringHelper::truncate(word, 5), word);
    EXPECT_EQ(StringHelper::truncate(word, 2, ""), "\xD0\xBF\xD1\x80");
}

TEST(StringHelper, Utf8Length) {
    EXPECT_EQ(StringHelper::utf8_length(""), 0u);
    EXPECT_EQ(StringHelper::utf8_length("ascii"), 5u);
    EXPECT_EQ(StringHelper::utf8_length("caf\xC3\xA9"), 4u);
    EXPECT_EQ(StringHelper::utf8_length("\xE2\x82\xAC 5"), 3u);
}

TEST(StringHelper, NormalizeSubject) {
    EXPECT_EQ(StringHelper::normalize_subject("RE: Fwd:  Disk Alert"), "disk alert");
    EXPECT_EQ(StringHelper::normalize_subject("Re[2]: status"), "status");
    EXPECT_EQ(StringHelper::normalize_subject("AW: WG: Bericht"), "bericht");
    EXPECT_EQ(StringHelper::normalize_subject("Report: weekly"), "report: weekly");
    EXPECT_EQ(StringHelper::normalize_subject("   "), "");
}

TEST(StringHelper, StripHtml) {
    EXPECT_EQ(StringHelper::strip_html("<div>Hello<br>&lt;world&gt;</div>"), "Hello <world>");
    EXPECT_EQ(StringHelper::strip_html("<script>alert(1)</script>text"), "text");
}

TEST(StringHelper, Split) {
    EXPECT_EQ(StringHelper::split(" a, b ,,c ", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(StringHelper::split("", ',').empty());
}
