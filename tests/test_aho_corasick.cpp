#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "../src/matcher/aho_corasick.hpp"

using Matcher::AhoCorasick;
using Matcher::DuplicatePolicy;
using Matcher::MatchHit;
using Matcher::TransitionMode;

namespace {

using Occurrence = std::pair<std::string, size_t>; // (pattern, end)

std::vector<Occurrence> brute_force(const std::vector<std::string> &patterns,
                                    const std::string &text) {
    std::vector<Occurrence> out;
    for (const auto &p : patterns)
        for (size_t pos = text.find(p); pos != std::string::npos;
             pos = text.find(p, pos + 1))
            out.emplace_back(p, pos + p.size());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<Occurrence> occurrences(const AhoCorasick &ac,
                                    const std::string &text) {
    std::vector<Occurrence> out;
    for (const auto &hit : ac.match_positions(text))
        out.emplace_back(std::string(hit.pattern), hit.end);
    std::sort(out.begin(), out.end());
    return out;
}

AhoCorasick built(const std::vector<std::string> &patterns,
                  TransitionMode mode = TransitionMode::SPARSE) {
    return AhoCorasick(patterns, DuplicatePolicy::PRESERVE, mode);
}

} // namespace

TEST(AhoCorasickTest, FindsRepeatedPatternsInScanOrder) {
    auto ac = built({"cat", "dog"});
    std::vector<std::string> expected = {"cat", "cat", "dog"};
    EXPECT_EQ(ac.match("the cat scaty on the dog"), expected);
}

TEST(AhoCorasickTest, ReportsOverlappingSuffixPatterns) {
    auto ac = built({"he", "she", "hers"});
    std::vector<std::string> expected = {"she", "he", "hers"};
    EXPECT_EQ(ac.match("ushers"), expected);

    auto hits = ac.match_positions("ushers");
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].pattern, "she");
    EXPECT_EQ(hits[0].start, 1u);
    EXPECT_EQ(hits[0].end, 4u);
    EXPECT_EQ(hits[1].pattern, "he");
    EXPECT_EQ(hits[1].start, 2u);
    EXPECT_EQ(hits[1].end, 4u);
    EXPECT_EQ(hits[2].pattern, "hers");
    EXPECT_EQ(hits[2].start, 2u);
    EXPECT_EQ(hits[2].end, 6u);
}

TEST(AhoCorasickTest, MergesOwnPatternBeforeFallbackPattern) {
    auto ac = built({"a", "aa"});
    std::vector<std::string> expected = {"a", "aa", "a", "aa", "a"};
    auto result = ac.match("aaa");
    EXPECT_EQ(result, expected);

    std::sort(result.begin(), result.end());
    std::vector<std::string> as_multiset = {"a", "a", "a", "aa", "aa"};
    EXPECT_EQ(result, as_multiset);
}

TEST(AhoCorasickTest, EmptyTextYieldsNothing) {
    auto ac = built({"abc"});
    EXPECT_TRUE(ac.match("").empty());
    EXPECT_FALSE(ac.contains_any(""));
    EXPECT_EQ(ac.count_matches(""), 0u);
}

TEST(AhoCorasickTest, NoPatternsYieldsNothing) {
    AhoCorasick ac;
    ac.build();
    EXPECT_TRUE(ac.match("anything at all").empty());
    EXPECT_EQ(ac.node_count(), 1u);
}

TEST(AhoCorasickTest, UnmatchedSymbolsResetToRoot) {
    auto ac = built({"abc"});
    EXPECT_TRUE(ac.match("abxbcab").empty());
    std::vector<std::string> expected = {"abc"};
    EXPECT_EQ(ac.match("ababc"), expected);
}

TEST(AhoCorasickTest, RejectsEmptyPattern) {
    AhoCorasick ac;
    EXPECT_THROW(ac.add_pattern(""), Matcher::InvalidPatternError);
    // The automaton stays usable after a rejected insertion
    EXPECT_EQ(ac.add_pattern("ok"), 0u);
    ac.build();
    EXPECT_EQ(ac.count_matches("ok ok"), 2u);
}

TEST(AhoCorasickTest, ConvenienceConstructorRejectsEmptyPattern) {
    EXPECT_THROW(AhoCorasick ac(std::vector<std::string>{"a", ""}),
                 Matcher::InvalidPatternError);
}

TEST(AhoCorasickTest, MatchBeforeBuildThrows) {
    AhoCorasick ac;
    ac.add_pattern("x");
    EXPECT_THROW(ac.match("x"), Matcher::NotBuiltError);
    EXPECT_THROW(ac.match_positions("x"), Matcher::NotBuiltError);
    EXPECT_THROW(ac.contains_any("x"), Matcher::NotBuiltError);
    EXPECT_FALSE(ac.is_built());
}

TEST(AhoCorasickTest, FrozenAutomatonRejectsMutation) {
    auto ac = built({"x"});
    EXPECT_TRUE(ac.is_built());
    EXPECT_THROW(ac.add_pattern("y"), Matcher::AlreadyBuiltError);
    EXPECT_THROW(ac.build(), Matcher::AlreadyBuiltError);

    std::vector<std::string> expected = {"x"};
    EXPECT_EQ(ac.match("x"), expected);
    EXPECT_EQ(ac.pattern_count(), 1u);
}

TEST(AhoCorasickTest, ErrorsDeriveFromMatcherError) {
    AhoCorasick ac;
    try {
        ac.add_pattern("");
        FAIL() << "expected InvalidPatternError";
    } catch (const Matcher::MatcherError &e) {
        EXPECT_STRNE(e.what(), "");
    }
}

TEST(AhoCorasickTest, PreservePolicyReportsDuplicatesPerInsertion) {
    AhoCorasick ac(DuplicatePolicy::PRESERVE);
    EXPECT_EQ(ac.add_pattern("ab"), 0u);
    EXPECT_EQ(ac.add_pattern("ab"), 1u);
    ac.build();
    std::vector<std::string> expected = {"ab", "ab"};
    EXPECT_EQ(ac.match("xab"), expected);
    EXPECT_EQ(ac.pattern_count(), 2u);
}

TEST(AhoCorasickTest, DeduplicatePolicyIgnoresRepeatedLiteral) {
    AhoCorasick ac(DuplicatePolicy::DEDUPLICATE);
    EXPECT_EQ(ac.add_pattern("ab"), 0u);
    EXPECT_EQ(ac.add_pattern("b"), 1u);
    EXPECT_EQ(ac.add_pattern("ab"), 0u);
    ac.build();
    std::vector<std::string> expected = {"ab", "b"};
    EXPECT_EQ(ac.match("xab"), expected);
    EXPECT_EQ(ac.pattern_count(), 2u);
    EXPECT_EQ(ac.duplicate_policy(), DuplicatePolicy::DEDUPLICATE);
}

TEST(AhoCorasickTest, FallbackLinksPointToLongestProperSuffix) {
    auto ac = built({"he", "she", "his", "hers"});
    EXPECT_EQ(ac.fallback_of(AhoCorasick::ROOT), AhoCorasick::ROOT);

    int she = ac.find_node("she");
    int he = ac.find_node("he");
    int hers = ac.find_node("hers");
    int s = ac.find_node("s");
    int hi = ac.find_node("hi");
    ASSERT_GT(she, 0);
    ASSERT_GT(he, 0);
    EXPECT_EQ(ac.fallback_of(she), he);
    EXPECT_EQ(ac.fallback_of(hers), s);
    EXPECT_EQ(ac.fallback_of(hi), AhoCorasick::ROOT);
    EXPECT_EQ(ac.find_node("xyz"), -1);
}

TEST(AhoCorasickTest, FallbackChainsAreShallowerAndOutputsMonotonic) {
    auto ac = built({"abcd", "bcd", "cd", "d", "abab", "bab", "ba", "aab"});
    for (int node = 1; node < static_cast<int>(ac.node_count()); ++node) {
        int fallback = ac.fallback_of(node);
        EXPECT_LT(ac.depth_of(fallback), ac.depth_of(node)) << "node " << node;

        const auto &own = ac.matched_patterns_of(node);
        for (size_t id : ac.matched_patterns_of(fallback))
            EXPECT_NE(std::find(own.begin(), own.end(), id), own.end())
                << "node " << node << " misses pattern " << id;
    }
}

TEST(AhoCorasickTest, AgreesWithBruteForce) {
    std::vector<std::string> patterns = {"abra", "bra",  "a",     "cad",
                                         "abracadabra", "dab", "rac", "zzz"};
    std::string text = "abracadabra abracadabra cadabra brab";
    auto ac = built(patterns);
    EXPECT_EQ(occurrences(ac, text), brute_force(patterns, text));
}

TEST(AhoCorasickTest, OccurrencesIndependentOfInsertionOrder) {
    std::vector<std::string> patterns = {"ana", "nan", "banana", "na", "b"};
    std::string text = "bananarama banana nana";
    auto reversed = patterns;
    std::reverse(reversed.begin(), reversed.end());

    EXPECT_EQ(occurrences(built(patterns), text),
              occurrences(built(reversed), text));
}

TEST(AhoCorasickTest, DenseTableMatchesSparseWalk) {
    std::vector<std::string> patterns = {"he", "she", "his", "hers", "a",
                                         "aa", "\xff\x01",
                                         std::string("ab\0c", 4)};
    std::vector<std::string> texts = {"ushers", "ahishers", "aaaa", "",
                                      std::string("\xff\x01\xff\x01", 4),
                                      std::string("xab\0cab\0", 8)};
    auto sparse = built(patterns, TransitionMode::SPARSE);
    auto dense = built(patterns, TransitionMode::DENSE);
    EXPECT_EQ(dense.transition_mode(), TransitionMode::DENSE);

    for (const auto &text : texts) {
        EXPECT_EQ(sparse.match(text), dense.match(text)) << text;
        EXPECT_EQ(occurrences(sparse, text), occurrences(dense, text));
    }
}

TEST(AhoCorasickTest, RepeatedMatchIsStable) {
    auto ac = built({"ab", "b", "abc"});
    auto first = ac.match("abcabcab");
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(ac.match("abcabcab"), first);
}

TEST(AhoCorasickTest, VisitorCanStopEarly) {
    auto ac = built({"a"});
    size_t seen = 0;
    bool finished = ac.for_each_match("aaaa", [&](const MatchHit &) {
        return ++seen < 2;
    });
    EXPECT_FALSE(finished);
    EXPECT_EQ(seen, 2u);

    EXPECT_TRUE(ac.contains_any("xxa"));
    EXPECT_FALSE(ac.contains_any("xxx"));
    EXPECT_EQ(ac.count_matches("aaaa"), 4u);
}

TEST(AhoCorasickTest, MatchesMultiByteUtf8Patterns) {
    auto ac = built({"h\xc3\xa9llo", "\xc3\xa9"});
    std::vector<std::string> expected = {"\xc3\xa9", "h\xc3\xa9llo"};
    EXPECT_EQ(ac.match("say h\xc3\xa9llo"), expected);
}

TEST(AhoCorasickTest, ConcurrentMatchingOnFrozenAutomaton) {
    auto ac = built({"he", "she", "his", "hers"}, TransitionMode::SPARSE);
    std::string text;
    for (int i = 0; i < 200; ++i)
        text += "ushers and his hers she ";
    const auto expected = ac.match(text);

    std::vector<std::vector<std::string>> results(4);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < results.size(); ++t)
        workers.emplace_back([&, t] { results[t] = ac.match(text); });
    for (auto &w : workers)
        w.join();

    for (const auto &r : results)
        EXPECT_EQ(r, expected);
}
