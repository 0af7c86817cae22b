#include <catch2/catch_test_macros.hpp>
#include "processing/LanguagePolicyDetector.hpp"
#include "processing/ScriptClassifier.hpp"
#include "processing/TextUtils.hpp"
#include <string>
#include <vector>

using namespace processing;
using namespace text_processing;

namespace
{

std::string joinSpans(const std::vector<LanguageSpan>& spans)
{
    std::string out;
    for (const auto& span : spans)
        out += span.text;
    return out;
}

} // namespace

TEST_CASE("ScriptClassifier - classifyScript", "[language][script]")
{
    REQUIRE(classifyScript(U'a') == ScriptTag::Latin);
    REQUIRE(classifyScript(U'Z') == ScriptTag::Latin);
    REQUIRE(classifyScript(U'é') == ScriptTag::Latin);
    REQUIRE(classifyScript(U'क') == ScriptTag::Devanagari);
    REQUIRE(classifyScript(U'ب') == ScriptTag::Arabic);
    REQUIRE(classifyScript(U'中') == ScriptTag::CJK);
    REQUIRE(classifyScript(U'あ') == ScriptTag::CJK);
    REQUIRE(classifyScript(U'カ') == ScriptTag::CJK);
    REQUIRE(classifyScript(U'한') == ScriptTag::Hangul);
    REQUIRE(classifyScript(U'1') == ScriptTag::Other);
    REQUIRE(classifyScript(U' ') == ScriptTag::Other);
    REQUIRE(classifyScript(U'Ж') == ScriptTag::Other);
}

TEST_CASE("ScriptClassifier - foreign scripts", "[language][script]")
{
    REQUIRE_FALSE(isForeignScript(ScriptTag::Latin));
    REQUIRE_FALSE(isForeignScript(ScriptTag::Other));
    REQUIRE(isForeignScript(ScriptTag::Devanagari));
    REQUIRE(isForeignScript(ScriptTag::Arabic));
    REQUIRE(isForeignScript(ScriptTag::CJK));
    REQUIRE(isForeignScript(ScriptTag::Hangul));
}

TEST_CASE("ScriptClassifier - mergeScriptRuns", "[language][script]")
{
    auto runs = mergeScriptRuns(tagCodepoints("ab中文cd"));

    REQUIRE(runs.size() == 3);
    REQUIRE(runs[0].tag == ScriptTag::Latin);
    REQUIRE(runs[0].text == U"ab");
    REQUIRE(runs[1].tag == ScriptTag::CJK);
    REQUIRE(runs[1].text == U"中文");
    REQUIRE(runs[2].tag == ScriptTag::Latin);
    REQUIRE(runs[2].text == U"cd");

    REQUIRE(mergeScriptRuns({}).empty());
}

TEST_CASE("LanguagePolicyDetector - detect", "[language]")
{
    std::vector<Segment> segments = {
        Segment{ "A", "hello everyone", 0.0, 1.0, std::string("en") },
        Segment{ "B", "hola a todos", 1.5, 2.0, std::string("es") },
        Segment{ "C", "no language tag", 2.0, 3.0, std::nullopt },
        Segment{ "D", "HELLO", 3.0, 4.0, std::string("EN") },
    };

    auto flags = LanguagePolicyDetector::detect(segments, "t-1", "en");

    REQUIRE(flags.size() == 1);
    REQUIRE(flags[0].transcript_id == "t-1");
    REQUIRE(flags[0].speaker == "B");
    REQUIRE(flags[0].flagged_word == "es");
    REQUIRE(flags[0].context == "hola a todos");
    REQUIRE(flags[0].timestamp_ms == 1500);
    REQUIRE(flags[0].flag_type == FlagType::LanguagePolicy);

    SECTION("Context is cut to 100 characters")
    {
        Segment long_segment{ "E", std::string(300, 'a'), 0.0, 1.0, std::string("fr") };
        auto flag = LanguagePolicyDetector::detectSegment(long_segment, "t-1", "en");

        REQUIRE(flag.has_value());
        REQUIRE(utf8Length(flag->context) == 100);
    }

    SECTION("Another allowed language")
    {
        auto es_flags = LanguagePolicyDetector::detect(segments, "t-1", "es");
        REQUIRE(es_flags.size() == 2);
        REQUIRE(es_flags[0].speaker == "A");
        REQUIRE(es_flags[1].speaker == "D");
    }
}

TEST_CASE("LanguagePolicyDetector - isAllowed", "[language]")
{
    REQUIRE(LanguagePolicyDetector::isAllowed(std::nullopt, "en"));
    REQUIRE(LanguagePolicyDetector::isAllowed(std::string(""), "en"));
    REQUIRE(LanguagePolicyDetector::isAllowed(std::string("En"), "en"));
    REQUIRE_FALSE(LanguagePolicyDetector::isAllowed(std::string("hi"), "en"));
}

TEST_CASE("LanguagePolicyDetector - highlightViolations", "[language][highlight]")
{
    const std::string mixed = "hello नमस्ते friend";

    SECTION("Allowed or absent language gives one clean span")
    {
        for (const auto& language : { std::optional<std::string>{}, std::optional<std::string>{ "en" } })
        {
            auto spans = LanguagePolicyDetector::highlightViolations(mixed, language, "en");
            REQUIRE(spans.size() == 1);
            REQUIRE(spans[0].text == mixed);
            REQUIRE_FALSE(spans[0].is_violation);
        }
    }

    SECTION("Foreign-script run is marked")
    {
        auto spans = LanguagePolicyDetector::highlightViolations(mixed, std::string("hi"), "en");

        REQUIRE(spans.size() == 3);
        REQUIRE(spans[0].text == "hello ");
        REQUIRE_FALSE(spans[0].is_violation);
        REQUIRE(spans[1].text == "नमस्ते");
        REQUIRE(spans[1].is_violation);
        REQUIRE(spans[2].text == " friend");
        REQUIRE_FALSE(spans[2].is_violation);
    }

    SECTION("Latin-only text in a disallowed language stays one span")
    {
        auto spans = LanguagePolicyDetector::highlightViolations("hola amigos", std::string("es"), "en");
        REQUIRE(spans.size() == 1);
        REQUIRE_FALSE(spans[0].is_violation);
    }

    SECTION("Spans concatenate back to the text")
    {
        const std::vector<std::string> samples = {
            "",
            mixed,
            "你好 world 안녕 مرحبا",
            "only latin here",
            "漢字",
        };

        for (const auto& text : samples)
        {
            INFO("text: " << text);
            REQUIRE(joinSpans(LanguagePolicyDetector::highlightViolations(text, std::string("zh"), "en")) == text);
        }
    }
}
