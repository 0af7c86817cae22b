#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/TopicAdherenceScorer.hpp"
#include "processing/TextUtils.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace processing;
using namespace text_processing;
using Catch::Matchers::WithinAbs;

namespace
{

Segment seg(const std::string& speaker, const std::string& text, double start, double end)
{
    return Segment{ speaker, text, start, end, std::nullopt };
}

bool has(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

TEST_CASE("TopicAdherenceScorer - empty transcript is fully on topic", "[topic]")
{
    auto result = TopicAdherenceScorer::analyze({}, "t-1");

    REQUIRE(result.score == 1.0);
    REQUIRE(result.off_topic_segments.empty());
    REQUIRE(result.detected_keywords.empty());
    REQUIRE(result.off_topic_indicators.empty());
}

TEST_CASE("TopicAdherenceScorer - one on-topic and one off-topic segment", "[topic]")
{
    std::vector<Segment> segments = {
        seg("A", "let's discuss the topic", 0.0, 2.0),
        seg("B", "I'm so bored, let's play a game", 2.5, 5.0),
    };

    auto result = TopicAdherenceScorer::analyze(segments, "t-1");

    REQUIRE_THAT(result.score, WithinAbs(0.5, 1e-9));
    REQUIRE(result.off_topic_segments.size() == 1);

    const auto& flag = result.off_topic_segments[0];
    REQUIRE(flag.transcript_id == "t-1");
    REQUIRE(flag.flagged_word == "off_topic");
    REQUIRE(flag.flag_type == FlagType::OffTopic);
    REQUIRE(flag.speaker == "B");
    REQUIRE(flag.context == "I'm so bored, let's play a game");
    REQUIRE(flag.timestamp_ms == 2500);

    REQUIRE(has(result.detected_keywords, "discuss"));
    REQUIRE(has(result.detected_keywords, "topic"));
    REQUIRE(has(result.off_topic_indicators, "bored"));
    REQUIRE(has(result.off_topic_indicators, "play"));
    REQUIRE(has(result.off_topic_indicators, "game"));
}

TEST_CASE("TopicAdherenceScorer - classification rules", "[topic]")
{
    SECTION("Segment with neither keywords nor indicators is on topic")
    {
        auto result = TopicAdherenceScorer::analyze({ seg("A", "the weather is nice", 0.0, 1.0) }, "t");
        REQUIRE(result.score == 1.0);
    }

    SECTION("A keyword outweighs indicators")
    {
        auto result = TopicAdherenceScorer::analyze({ seg("A", "let's play a game and discuss the question", 0.0, 1.0) }, "t");
        REQUIRE(result.score == 1.0);
        REQUIRE(result.off_topic_segments.empty());
    }

    SECTION("Keywords need an exact word, punctuation aside")
    {
        auto exact = TopicAdherenceScorer::analyze({ seg("A", "Game? DISCUSS!", 0.0, 1.0) }, "t");
        REQUIRE(exact.score == 1.0);

        auto partial = TopicAdherenceScorer::analyze({ seg("A", "game discussing", 0.0, 1.0) }, "t");
        REQUIRE(partial.score == 0.0);
    }

    SECTION("Indicators seen earlier match later segments as substrings")
    {
        std::vector<Segment> segments = {
            seg("A", "that game was fun", 0.0, 1.0),
            seg("B", "games everywhere", 1.0, 2.0),
        };

        auto result = TopicAdherenceScorer::analyze(segments, "t");
        REQUIRE(result.off_topic_segments.size() == 2);
        REQUIRE(result.off_topic_indices == std::vector<std::size_t>{ 0, 1 });
        REQUIRE(result.score == 0.0);
    }

    SECTION("Substring alone does not register an indicator")
    {
        auto result = TopicAdherenceScorer::analyze({ seg("A", "gameplay all day", 0.0, 1.0) }, "t");
        REQUIRE(result.score == 1.0);
        REQUIRE(result.off_topic_indicators.empty());
    }
}

TEST_CASE("TopicAdherenceScorer - custom lists replace the defaults", "[topic][config]")
{
    TopicConfig config;
    config.topic_keywords = { "Photosynthesis" };
    config.off_topic_indicators = { "football" };

    std::vector<Segment> segments = {
        seg("A", "football after class", 0.0, 1.0),
        seg("B", "photosynthesis and football", 1.0, 2.0),
        seg("C", "I am bored", 2.0, 3.0),
    };

    auto result = TopicAdherenceScorer::analyze(segments, "t", config);

    REQUIRE(result.off_topic_segments.size() == 1);
    REQUIRE(result.off_topic_segments[0].speaker == "A");
    REQUIRE_THAT(result.score, WithinAbs(2.0 / 3.0, 1e-9));
    REQUIRE(result.detected_keywords == std::vector<std::string>{ "photosynthesis" });
}

TEST_CASE("TopicAdherenceScorer - flag details", "[topic]")
{
    SECTION("Context is cut to 150 characters")
    {
        std::string text = std::string(200, 'x') + " game";
        auto result = TopicAdherenceScorer::analyze({ seg("A", text, 0.0, 1.0) }, "t");

        REQUIRE(result.off_topic_segments.size() == 1);
        REQUIRE(utf8Length(result.off_topic_segments[0].context) == 150);
    }

    SECTION("Timestamp is floored milliseconds")
    {
        auto result = TopicAdherenceScorer::analyze({ seg("A", "music", 1.2345, 2.0) }, "t");

        REQUIRE(result.off_topic_segments.size() == 1);
        REQUIRE(result.off_topic_segments[0].timestamp_ms == 1234);
    }
}

TEST_CASE("TopicAdherenceScorer - cleanWord", "[topic]")
{
    REQUIRE(TopicAdherenceScorer::cleanWord("Let's") == "lets");
    REQUIRE(TopicAdherenceScorer::cleanWord("game,") == "game");
    REQUIRE(TopicAdherenceScorer::cleanWord("snake_case1") == "snake_case1");
    REQUIRE(TopicAdherenceScorer::cleanWord("!!!").empty());
}
