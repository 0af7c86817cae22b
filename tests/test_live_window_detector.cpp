#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/LiveWindowDetector.hpp"
#include "processing/Lexicon.hpp"
#include "processing/LexiconMatcher.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace processing;
using namespace text_processing;
using Catch::Matchers::WithinAbs;

namespace
{

std::shared_ptr<const LexiconMatcher> matcherFor(std::vector<std::string> terms)
{
    return std::make_shared<const LexiconMatcher>(
        std::make_shared<const Lexicon>(terms, std::vector<std::string>{}));
}

} // namespace

TEST_CASE("LiveWindowDetector - phrase completes across chunks", "[live]")
{
    LiveWindowDetector live(matcherFor({ "what the hell", "damn" }), 8);

    REQUIRE(live.ingest("what ").empty());
    REQUIRE(live.ingest("the ").empty());

    auto detections = live.ingest("hell");

    REQUIRE(detections.size() == 1);
    REQUIRE(detections[0].phrase == "what the hell");
    REQUIRE(detections[0].match == "what the hell");
    REQUIRE(detections[0].score == 1.0);
    REQUIRE(detections[0].severity == Severity::High);
}

TEST_CASE("LiveWindowDetector - shortest suffix wins", "[live]")
{
    LiveWindowDetector live(std::make_shared<const LexiconMatcher>(Lexicon::builtin()));

    auto detections = live.ingest("what the hell");

    REQUIRE(detections.size() == 1);
    REQUIRE(detections[0].phrase == "hell");
    REQUIRE(detections[0].match == "hell");
}

TEST_CASE("LiveWindowDetector - one detection per token at most", "[live]")
{
    LiveWindowDetector live(matcherFor({ "damn", "crap" }));

    auto detections = live.ingest("damn this crap");

    REQUIRE(detections.size() == 2);
    REQUIRE(detections[0].phrase == "damn");
    REQUIRE(detections[1].phrase == "crap");
}

TEST_CASE("LiveWindowDetector - window eviction", "[live]")
{
    SECTION("Evicted token is no longer part of any phrase")
    {
        LiveWindowDetector live(matcherFor({ "go to hell" }), 2);

        REQUIRE(live.ingest("go").empty());
        REQUIRE(live.ingest("to").empty());
        REQUIRE(live.ingest("hell").empty());

        REQUIRE(live.tokens().size() == 2);
        REQUIRE(live.tokens().front() == "to");
        REQUIRE(live.tokens().back() == "hell");
    }

    SECTION("Same sequence fits a larger window")
    {
        LiveWindowDetector live(matcherFor({ "go to hell" }), 3);

        REQUIRE(live.ingest("go").empty());
        REQUIRE(live.ingest("to").empty());
        auto detections = live.ingest("hell");

        REQUIRE(detections.size() == 1);
        REQUIRE(detections[0].phrase == "go to hell");
    }

    SECTION("Window never exceeds its size")
    {
        LiveWindowDetector live(matcherFor({ "damn" }), 8);
        for (int i = 0; i < 20; ++i)
        {
            (void)live.ingest("word" + std::to_string(i));
        }
        REQUIRE(live.tokens().size() == 8);
        REQUIRE(live.tokens().front() == "word12");
    }
}

TEST_CASE("LiveWindowDetector - whitespace-only chunks add nothing", "[live]")
{
    LiveWindowDetector live(matcherFor({ "damn" }));

    REQUIRE(live.ingest("").empty());
    REQUIRE(live.ingest("  \t\n").empty());
    REQUIRE(live.tokens().empty());
}

TEST_CASE("LiveWindowDetector - reset clears the window", "[live]")
{
    LiveWindowDetector live(matcherFor({ "what the hell" }));

    REQUIRE(live.ingest("what the").empty());
    REQUIRE(live.tokens().size() == 2);

    live.reset();
    REQUIRE(live.tokens().empty());
    REQUIRE(live.ingest("hell").empty());
}

TEST_CASE("LiveWindowDetector - severity", "[live]")
{
    REQUIRE(LiveWindowDetector::severityFor(1.0) == Severity::High);
    REQUIRE(LiveWindowDetector::severityFor(0.95) == Severity::High);
    REQUIRE(LiveWindowDetector::severityFor(0.9) == Severity::Medium);

    SECTION("Fuzzy long-word hit is medium")
    {
        LiveWindowDetector live(matcherFor({ "motherfucker" }));
        auto detections = live.ingest("motherfuckr");

        REQUIRE(detections.size() == 1);
        REQUIRE_THAT(detections[0].score, WithinAbs(1.0 - 1.0 / 12.0, 1e-9));
        REQUIRE(detections[0].severity == Severity::Medium);
    }
}

TEST_CASE("LiveWindowDetector - window size", "[live]")
{
    REQUIRE(LiveWindowDetector(matcherFor({ "damn" })).windowSize() == LiveWindowDetector::kDefaultWindowSize);
    REQUIRE(LiveWindowDetector(matcherFor({ "damn" }), 0).windowSize() == 1);
    REQUIRE_THROWS_AS(LiveWindowDetector(nullptr), std::invalid_argument);
}
