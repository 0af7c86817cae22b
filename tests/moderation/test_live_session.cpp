#include <catch2/catch_test_macros.hpp>
#include "moderation/LiveModerationSession.hpp"
#include "processing/Lexicon.hpp"
#include "processing/LexiconMatcher.hpp"

#include <memory>
#include <sstream>
#include <vector>

using namespace moderation;
using json = nlohmann::json;

namespace {

class RecordingSink : public IAlertSink {
public:
    void publish(const AlertEvent& event) override { events.push_back(event); }

    std::vector<AlertEvent> events;
};

std::shared_ptr<const processing::LexiconMatcher> phraseMatcher() {
    auto lexicon = std::make_shared<const processing::Lexicon>(std::vector<std::string>{ "what the hell", "damn" },
                                                               std::vector<std::string>{});
    return std::make_shared<const processing::LexiconMatcher>(lexicon);
}

SessionInfo info() {
    return SessionInfo{ "device-7", "t-42", "Instructor" };
}

} // namespace

TEST_CASE("Live moderation session", "[moderation][live]") {
    auto sink = std::make_shared<RecordingSink>();
    LiveModerationSession session(phraseMatcher(), sink, info());

    SECTION("Publishes one alert per detection") {
        REQUIRE(session.ingest("what ", 1000).empty());
        REQUIRE(session.ingest("the ", 1100).empty());
        auto detections = session.ingest("hell", 1234);

        REQUIRE(detections.size() == 1);
        REQUIRE(sink->events.size() == 1);
        REQUIRE(session.alertCount() == 1);

        const auto& event = sink->events[0];
        REQUIRE(event.type == "alert");
        REQUIRE(event.device_id == "device-7");
        REQUIRE(event.transcript_id == "t-42");
        REQUIRE(event.speaker == "Instructor");
        REQUIRE(event.flagged_word == "what the hell");
        REQUIRE(event.context == "what the hell");
        REQUIRE(event.timestamp_ms == 1234);
        REQUIRE(event.flag_type == text_processing::FlagType::Profanity);
    }

    SECTION("Several detections in one chunk") {
        session.ingest("damn it damn", 10);
        REQUIRE(sink->events.size() == 2);
        REQUIRE(session.alertCount() == 2);
    }

    SECTION("End clears the window") {
        session.ingest("what the", 1);
        session.end();
        REQUIRE(session.alertCount() == 0);
        REQUIRE(session.ingest("hell", 2).empty());
        REQUIRE(sink->events.empty());
    }
}

TEST_CASE("Live moderation session without a sink", "[moderation][live]") {
    LiveModerationSession session(phraseMatcher(), nullptr, info());

    REQUIRE(session.ingest("damn", 5).size() == 1);
    REQUIRE(session.alertCount() == 1);
}

TEST_CASE("Alert events as JSON lines", "[moderation][live]") {
    std::ostringstream out;
    auto sink = std::make_shared<JsonLinesAlertSink>(out);
    LiveModerationSession session(phraseMatcher(), sink, info());

    session.ingest("damn", 77);
    session.ingest("damn", 78);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> docs;
    while (std::getline(lines, line))
        docs.push_back(json::parse(line));

    REQUIRE(docs.size() == 2);
    REQUIRE(docs[0]["type"] == "alert");
    REQUIRE(docs[0]["deviceId"] == "device-7");
    REQUIRE(docs[0]["transcriptId"] == "t-42");
    REQUIRE(docs[0]["flaggedWord"] == "damn");
    REQUIRE(docs[0]["timestampMs"] == 77);
    REQUIRE(docs[0]["speaker"] == "Instructor");
    REQUIRE(docs[0]["flagType"] == "profanity");
    REQUIRE(docs[1]["timestampMs"] == 78);
}

TEST_CASE("Alert events with invalid UTF-8 still publish", "[moderation][live]") {
    std::ostringstream out;
    JsonLinesAlertSink sink(out);

    AlertEvent event;
    event.device_id = "device-7";
    event.transcript_id = "t-42";
    event.flagged_word = "damn\xFF";
    event.context = "damn\xFF";
    event.timestamp_ms = 9;

    REQUIRE_NOTHROW(sink.publish(event));

    auto doc = json::parse(out.str());
    REQUIRE(doc["flaggedWord"] == "damn\xEF\xBF\xBD");
    REQUIRE(doc["timestampMs"] == 9);
}
