#include "TextProcessingTypes.hpp"

namespace text_processing {

bool operator==(const FlagRecord& a, const FlagRecord& b)
{
    return a.transcript_id == b.transcript_id && a.flagged_word == b.flagged_word && a.context == b.context &&
           a.timestamp_ms == b.timestamp_ms && a.speaker == b.speaker && a.flag_type == b.flag_type;
}

bool operator!=(const FlagRecord& a, const FlagRecord& b) { return !(a == b); }

bool operator==(const FlagSet& a, const FlagSet& b)
{
    return a.profanity == b.profanity && a.language_policy == b.language_policy && a.off_topic == b.off_topic;
}

bool operator!=(const FlagSet& a, const FlagSet& b) { return !(a == b); }

const char* flagTypeToString(FlagType type)
{
    switch (type)
    {
    case FlagType::Profanity:
        return "profanity";
    case FlagType::LanguagePolicy:
        return "language_policy";
    case FlagType::OffTopic:
        return "off_topic";
    case FlagType::Participation:
        return "participation";
    }
    return "profanity";
}

std::optional<FlagType> flagTypeFromString(const std::string& value)
{
    if (value == "profanity")
        return FlagType::Profanity;
    if (value == "language_policy")
        return FlagType::LanguagePolicy;
    if (value == "off_topic")
        return FlagType::OffTopic;
    if (value == "participation")
        return FlagType::Participation;
    return std::nullopt;
}

const char* severityToString(Severity severity)
{
    return severity == Severity::High ? "high" : "medium";
}

} // namespace text_processing
