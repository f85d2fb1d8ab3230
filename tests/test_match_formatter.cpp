#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../src/io/match_formatter.hpp"

using Matcher::AhoCorasick;

TEST(MatchFormatterTest, JsonWithoutPositionsListsPatterns) {
    AhoCorasick ac({"cat", "dog"});
    auto hits = ac.match_positions("the cat scaty on the dog");
    auto j = MatchFormatter::hits_to_json_object("<text>", hits, false);

    EXPECT_EQ(j["source"], "<text>");
    EXPECT_EQ(j["match_count"], 3);
    ASSERT_TRUE(j["matches"].is_array());
    ASSERT_EQ(j["matches"].size(), 3u);
    EXPECT_EQ(j["matches"][0], "cat");
    EXPECT_EQ(j["matches"][1], "cat");
    EXPECT_EQ(j["matches"][2], "dog");
}

TEST(MatchFormatterTest, JsonWithPositionsListsObjects) {
    AhoCorasick ac({"he", "she"});
    auto hits = ac.match_positions("ushe");
    auto parsed = nlohmann::json::parse(
        MatchFormatter::format_hits_as_json("in.txt", hits, true));

    ASSERT_EQ(parsed["matches"].size(), 2u);
    EXPECT_EQ(parsed["matches"][0]["pattern"], "she");
    EXPECT_EQ(parsed["matches"][0]["start"], 1);
    EXPECT_EQ(parsed["matches"][0]["end"], 4);
    EXPECT_EQ(parsed["matches"][1]["pattern"], "he");
    EXPECT_EQ(parsed["matches"][1]["start"], 2);
}

TEST(MatchFormatterTest, JsonForNoMatchesHasEmptyArray) {
    auto j = MatchFormatter::hits_to_json_object("empty", {}, false);
    EXPECT_EQ(j["match_count"], 0);
    EXPECT_TRUE(j["matches"].is_array());
    EXPECT_TRUE(j["matches"].empty());
}

TEST(MatchFormatterTest, JsonDumpSurvivesInvalidUtf8) {
    AhoCorasick ac({"\xff"});
    auto hits = ac.match_positions("a\xff");
    EXPECT_NO_THROW(MatchFormatter::format_hits_as_json("bin", hits, false));
}

TEST(MatchFormatterTest, TextFormats) {
    AhoCorasick ac({"a", "ab"});
    auto hits = ac.match_positions("xab");
    EXPECT_EQ(MatchFormatter::format_hits_as_text("f", hits, false), "a\nab\n");
    EXPECT_EQ(MatchFormatter::format_hits_as_text("f", hits, true),
              "f:1-2\ta\nf:1-3\tab\n");
}
