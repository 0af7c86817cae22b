#include "FlagJson.hpp"

#include <stdexcept>

using nlohmann::json;

namespace text_processing
{

void to_json(json& j, const FlagType& type)
{
    j = flagTypeToString(type);
}

void from_json(const json& j, FlagType& type)
{
    auto parsed = flagTypeFromString(j.get<std::string>());
    if (!parsed)
        throw std::invalid_argument("unknown flagType: " + j.get<std::string>());
    type = *parsed;
}

void to_json(json& j, const FlagRecord& flag)
{
    j = json{
        { "transcriptId", flag.transcript_id },
        { "flaggedWord", flag.flagged_word },
        { "context", flag.context },
        { "timestampMs", flag.timestamp_ms },
        { "speaker", flag.speaker },
        { "flagType", flag.flag_type },
    };
}

void from_json(const json& j, FlagRecord& flag)
{
    flag.transcript_id = j.value("transcriptId", std::string());
    flag.flagged_word = j.at("flaggedWord").get<std::string>();
    flag.context = j.value("context", std::string());
    flag.speaker = j.value("speaker", std::string());

    const auto& ts = j.at("timestampMs");
    // Models occasionally answer with 1234.0
    flag.timestamp_ms = ts.is_number_float() ? static_cast<std::int64_t>(ts.get<double>()) : ts.get<std::int64_t>();

    flag.flag_type = j.at("flagType").get<FlagType>();
}

void to_json(json& j, const Segment& segment)
{
    j = json{
        { "speaker", segment.speaker },
        { "text", segment.text },
        { "startTime", segment.start_time },
        { "endTime", segment.end_time },
    };
    if (segment.language)
        j["language"] = *segment.language;
}

void from_json(const json& j, Segment& segment)
{
    segment.speaker = j.value("speaker", std::string());
    segment.text = j.at("text").get<std::string>();
    segment.start_time = j.value("startTime", 0.0);
    segment.end_time = j.value("endTime", 0.0);
    segment.language.reset();
    auto it = j.find("language");
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty())
        segment.language = it->get<std::string>();
}

void to_json(json& j, const FlagSet& flags)
{
    j = json{
        { "profanity", flags.profanity },
        { "languagePolicy", flags.language_policy },
        { "offTopic", flags.off_topic },
    };
}

void from_json(const json& j, FlagSet& flags)
{
    // get<std::vector<...>> rejects non-array members with json::type_error
    flags.profanity = j.at("profanity").get<std::vector<FlagRecord>>();
    flags.language_policy = j.at("languagePolicy").get<std::vector<FlagRecord>>();
    flags.off_topic = j.at("offTopic").get<std::vector<FlagRecord>>();
}

void to_json(json& j, const Match& match)
{
    j = json{
        { "word", match.source_text },
        { "offset", match.offset },
        { "length", match.length },
        { "score", match.score },
        { "match", match.lexicon_entry },
    };
}

void to_json(json& j, const HighlightSpan& span)
{
    j = json{ { "text", span.text }, { "isProfanity", span.is_profanity } };
    if (span.score)
        j["score"] = *span.score;
}

void to_json(json& j, const LiveDetection& detection)
{
    j = json{
        { "phrase", detection.phrase },
        { "match", detection.match },
        { "score", detection.score },
        { "severity", severityToString(detection.severity) },
    };
}

void to_json(json& j, const TopicAdherenceResult& result)
{
    j = json{
        { "score", result.score },
        { "offTopicSegments", result.off_topic_segments },
        { "detectedKeywords", result.detected_keywords },
        { "offTopicIndicators", result.off_topic_indicators },
    };
}

void to_json(json& j, const SpeakerParticipation& speaker)
{
    j = json{
        { "speakerId", speaker.speaker_id },
        { "talkTime", speaker.talk_time },
        { "segmentCount", speaker.segment_count },
        { "percentage", speaker.percentage },
    };
}

void to_json(json& j, const ParticipationBalance& balance)
{
    j = json{
        { "speakers", balance.speakers },
        { "isBalanced", balance.is_balanced },
        { "silentSpeakers", balance.silent_speakers },
    };
    if (balance.dominant_speaker)
        j["dominantSpeaker"] = *balance.dominant_speaker;
    if (balance.imbalance_reason)
        j["imbalanceReason"] = *balance.imbalance_reason;
}

} // namespace text_processing

namespace processing
{

void to_json(json& j, const LanguageSpan& span)
{
    j = json{ { "text", span.text }, { "isLanguageViolation", span.is_violation } };
}

} // namespace processing

namespace moderation
{

std::string toJsonText(const json& j, int indent)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace moderation
