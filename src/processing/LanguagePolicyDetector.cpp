#include "LanguagePolicyDetector.hpp"
#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>

using text_processing::FlagRecord;
using text_processing::FlagType;
using text_processing::Segment;

namespace processing
{

bool LanguagePolicyDetector::isAllowed(const std::optional<std::string>& language, const std::string& allowed_language)
{
    if (!language || language->empty())
        return true;
    return toLowerUtf8(*language) == toLowerUtf8(allowed_language);
}

std::optional<FlagRecord> LanguagePolicyDetector::detectSegment(const Segment& segment,
                                                               const std::string& transcript_id,
                                                               const std::string& allowed_language)
{
    if (isAllowed(segment.language, allowed_language))
        return std::nullopt;

    FlagRecord flag;
    flag.transcript_id = transcript_id;
    flag.flagged_word = *segment.language;
    flag.context = utf8Prefix(segment.text, kContextChars);
    flag.timestamp_ms = static_cast<std::int64_t>(std::floor(segment.start_time * 1000.0));
    flag.speaker = segment.speaker;
    flag.flag_type = FlagType::LanguagePolicy;
    return flag;
}

std::vector<FlagRecord> LanguagePolicyDetector::detect(const std::vector<Segment>& segments,
                                                       const std::string& transcript_id,
                                                       const std::string& allowed_language)
{
    std::vector<FlagRecord> violations;
    for (const auto& segment : segments)
    {
        if (auto flag = detectSegment(segment, transcript_id, allowed_language))
            violations.push_back(std::move(*flag));
    }
    return violations;
}

std::vector<LanguageSpan> LanguagePolicyDetector::highlightViolations(const std::string& text,
                                                                      const std::optional<std::string>& segment_language,
                                                                      const std::string& allowed_language)
{
    if (isAllowed(segment_language, allowed_language))
        return { LanguageSpan{ text, false } };

    std::vector<LanguageSpan> spans;
    for (const auto& run : mergeScriptRuns(tagCodepoints(text)))
    {
        const bool violation = isForeignScript(run.tag);
        std::string piece = utf32ToUtf8(run.text);
        // Neighbouring runs of different foreign scripts (or Latin next to Other) share one span
        if (!spans.empty() && spans.back().is_violation == violation)
            spans.back().text += piece;
        else
            spans.push_back(LanguageSpan{ std::move(piece), violation });
    }

    bool any_violation = std::any_of(spans.begin(), spans.end(),
                                     [](const LanguageSpan& s) { return s.is_violation; });
    if (!any_violation)
        return { LanguageSpan{ text, false } };
    return spans;
}

} // namespace processing
