#include <catch2/catch_test_macros.hpp>
#include "moderation/FlagJson.hpp"

#include <stdexcept>

using namespace text_processing;
using json = nlohmann::json;

TEST_CASE("Flag JSON shapes", "[moderation][json]") {

    SECTION("FlagRecord uses camelCase keys") {
        FlagRecord flag{ "t-1", "damn", "well damn it", 1500, "A", FlagType::LanguagePolicy };
        json j = flag;

        REQUIRE(j["transcriptId"] == "t-1");
        REQUIRE(j["flaggedWord"] == "damn");
        REQUIRE(j["context"] == "well damn it");
        REQUIRE(j["timestampMs"] == 1500);
        REQUIRE(j["speaker"] == "A");
        REQUIRE(j["flagType"] == "language_policy");
    }

    SECTION("FlagRecord reads fractional timestamps") {
        auto j = json::parse(R"({"transcriptId":"t","flaggedWord":"x","context":"c",
                                 "timestampMs":1500.9,"speaker":"s","flagType":"off_topic"})");
        auto flag = j.get<FlagRecord>();

        REQUIRE(flag.timestamp_ms == 1500);
        REQUIRE(flag.flag_type == FlagType::OffTopic);
    }

    SECTION("Unknown flag type is rejected") {
        auto j = json::parse(R"({"transcriptId":"t","flaggedWord":"x","context":"c",
                                 "timestampMs":1,"speaker":"s","flagType":"spam"})");
        REQUIRE_THROWS_AS(j.get<FlagRecord>(), std::invalid_argument);
    }

    SECTION("Segment language is optional") {
        Segment plain{ "A", "hi", 0.5, 1.0, std::nullopt };
        json j = plain;
        REQUIRE_FALSE(j.contains("language"));
        REQUIRE(j["startTime"] == 0.5);

        auto parsed = json::parse(R"({"speaker":"B","text":"hola","startTime":1,"endTime":2,"language":"es"})")
                          .get<Segment>();
        REQUIRE(parsed.language == std::optional<std::string>("es"));
        REQUIRE(parsed.end_time == 2.0);

        auto blank = json::parse(R"({"speaker":"B","text":"x","language":""})").get<Segment>();
        REQUIRE_FALSE(blank.language.has_value());
        REQUIRE(blank.start_time == 0.0);
    }

    SECTION("FlagSet requires all three arrays") {
        REQUIRE_NOTHROW(json::parse(R"({"profanity":[],"languagePolicy":[],"offTopic":[]})").get<FlagSet>());
        REQUIRE_THROWS(json::parse(R"({"profanity":[],"languagePolicy":[]})").get<FlagSet>());
        REQUIRE_THROWS(json::parse(R"({"profanity":{},"languagePolicy":[],"offTopic":[]})").get<FlagSet>());
    }

    SECTION("Match and highlight spans") {
        Match m{ "sh1t", 4, 4, 1.0, "shit" };
        json jm = m;
        REQUIRE(jm["word"] == "sh1t");
        REQUIRE(jm["offset"] == 4);
        REQUIRE(jm["match"] == "shit");

        json plain = HighlightSpan{ "hello ", false, std::nullopt };
        REQUIRE(plain["isProfanity"] == false);
        REQUIRE_FALSE(plain.contains("score"));

        json hit = HighlightSpan{ "sh1t", true, 1.0 };
        REQUIRE(hit["score"] == 1.0);
    }
}

TEST_CASE("Flag JSON text replaces invalid UTF-8", "[moderation][json]") {
    json j = { { "text", std::string("ok \xC3 bad") } };

    std::string compact;
    REQUIRE_NOTHROW(compact = moderation::toJsonText(j));
    REQUIRE(json::parse(compact)["text"] == "ok \xEF\xBF\xBD bad");

    REQUIRE(moderation::toJsonText(json{ { "a", 1 } }) == "{\"a\":1}");
    REQUIRE(moderation::toJsonText(json{ { "a", 1 } }, 2) == "{\n  \"a\": 1\n}");
}
