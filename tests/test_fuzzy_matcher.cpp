#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/DamerauFuzzyMatcher.hpp"
#include "processing/Lexicon.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace processing;
using Catch::Matchers::WithinAbs;

TEST_CASE("DamerauFuzzyMatcher - distance counts single edits", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;

    REQUIRE(matcher.distance("shit", "shit") == 0);
    REQUIRE(matcher.distance("", "abc") == 3);
    REQUIRE(matcher.distance("abc", "") == 3);
    REQUIRE(matcher.distance("kitten", "sitting") == 3);
    REQUIRE(matcher.distance("damn", "dam") == 1);
}

TEST_CASE("DamerauFuzzyMatcher - adjacent transposition costs one", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;

    REQUIRE(matcher.distance("ab", "ba") == 1);
    REQUIRE(matcher.distance("shti", "shit") == 1);
    REQUIRE(matcher.distance("fcuk", "fuck") == 1);
}

TEST_CASE("DamerauFuzzyMatcher - distance works on code points", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;
    REQUIRE(matcher.distance("caf\xC3\xA9", "cafe") == 1);
}

TEST_CASE("DamerauFuzzyMatcher - similarity scoring tiers", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;

    SECTION("Exact equality scores 1.0")
    {
        REQUIRE(matcher.similarity("damn", "damn") == 1.0);
    }

    SECTION("Equal after leet-unmask and punctuation strip scores 0.98")
    {
        REQUIRE_THAT(matcher.similarity("sh1t", "shit"), WithinAbs(0.98, 1e-9));
        REQUIRE_THAT(matcher.similarity("fck", "f*ck"), WithinAbs(0.98, 1e-9));
        REQUIRE_THAT(matcher.similarity("d@mn", "damn"), WithinAbs(0.98, 1e-9));
    }

    SECTION("Otherwise one minus normalized distance")
    {
        REQUIRE_THAT(matcher.similarity("shti", "shit"), WithinAbs(0.75, 1e-9));
        REQUIRE_THAT(matcher.similarity("motherfuckr", "motherfucker"), WithinAbs(1.0 - 1.0 / 12.0, 1e-9));
    }

    SECTION("Completely different strings score 0")
    {
        REQUIRE(matcher.similarity("abc", "xyz") == 0.0);
    }
}

TEST_CASE("DamerauFuzzyMatcher - punctuation-only inputs", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;

    REQUIRE(matcher.similarity("!!!", "!!!") == 1.0);
    REQUIRE(matcher.similarity("!!!", "???") == 0.0);
    REQUIRE(matcher.similarity("", "") == 1.0);
    REQUIRE(matcher.similarity("", "?") == 0.0);
}

TEST_CASE("DamerauFuzzyMatcher - every lexicon entry matches itself perfectly", "[fuzzy][lexicon]")
{
    DamerauFuzzyMatcher matcher;
    for (const auto& entry : Lexicon::builtin()->entries())
    {
        INFO("entry: " << entry.term);
        REQUIRE(matcher.similarity(entry.normalized, entry.normalized) == 1.0);
        REQUIRE(matcher.similarity(entry.term, entry.term) == 1.0);
    }
}

TEST_CASE("DamerauFuzzyMatcher - similarity is symmetric", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;
    const std::vector<std::pair<std::string, std::string>> pairs = {
        { "sh1t", "shit" },
        { "shti", "shit" },
        { "f*ck", "fuck" },
        { "what the hell", "the hell" },
        { "!!!", "???" },
        { "", "damn" },
        { "bass", "ass" },
        { "caf\xC3\xA9", "cafe" },
        { "5tfu", "stfu" },
    };

    for (const auto& [a, b] : pairs)
    {
        INFO(a << " <-> " << b);
        REQUIRE(matcher.similarity(a, b) == matcher.similarity(b, a));
    }
}

TEST_CASE("DamerauFuzzyMatcher - scores stay within [0, 1]", "[fuzzy]")
{
    DamerauFuzzyMatcher matcher;
    const std::vector<std::string> words = { "", "a", "ass", "assassin", "f u", "$$$", "what the fuck", "zzzz" };
    for (const auto& a : words)
    {
        for (const auto& b : words)
        {
            double s = matcher.similarity(a, b);
            REQUIRE(s >= 0.0);
            REQUIRE(s <= 1.0);
        }
    }
}
