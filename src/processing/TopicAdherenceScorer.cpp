#include "TopicAdherenceScorer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>

using text_processing::FlagRecord;
using text_processing::FlagType;
using text_processing::Segment;
using text_processing::TopicAdherenceResult;

namespace processing
{

namespace
{

std::vector<std::string> lowered(const std::vector<std::string>& words)
{
    std::vector<std::string> out;
    out.reserve(words.size());
    for (const auto& w : words)
        out.push_back(toLowerUtf8(w));
    return out;
}

bool contains(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}

// Insertion-ordered set add
void addUnique(std::vector<std::string>& list, const std::string& value)
{
    if (!contains(list, value))
        list.push_back(value);
}

} // namespace

const std::vector<std::string>& TopicAdherenceScorer::defaultTopicKeywords()
{
    static const std::vector<std::string> keywords = {
        "discuss", "discussion", "topic", "question", "answer", "think", "opinion",
        "agree", "disagree", "why", "how", "what", "explain", "understand",
        "learn", "study", "class", "lesson", "subject", "idea", "point",
    };
    return keywords;
}

const std::vector<std::string>& TopicAdherenceScorer::defaultOffTopicIndicators()
{
    static const std::vector<std::string> indicators = {
        "game", "play", "fun", "bored", "tired", "hungry", "lunch", "break",
        "homework", "test", "exam", "grade", "teacher", "school", "friend",
        "phone", "video", "movie", "music", "song", "dance",
    };
    return indicators;
}

std::string TopicAdherenceScorer::cleanWord(std::string_view word)
{
    std::string out;
    out.reserve(word.size());
    for (char c : word)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if ((uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9') || uc == '_')
            out.push_back(c);
        else if (uc >= 'A' && uc <= 'Z')
            out.push_back(static_cast<char>(uc - 'A' + 'a'));
    }
    return out;
}

TopicAdherenceResult TopicAdherenceScorer::analyze(const std::vector<Segment>& segments,
                                                   const std::string& transcript_id,
                                                   const TopicConfig& config)
{
    TopicAdherenceResult result;
    if (segments.empty())
        return result;

    const std::vector<std::string> keywords =
        lowered(config.topic_keywords.empty() ? defaultTopicKeywords() : config.topic_keywords);
    const std::vector<std::string> indicators =
        lowered(config.off_topic_indicators.empty() ? defaultOffTopicIndicators() : config.off_topic_indicators);

    std::size_t on_topic = 0;
    for (std::size_t index = 0; index < segments.size(); ++index)
    {
        const Segment& segment = segments[index];
        const std::string text = toLowerUtf8(segment.text);

        bool has_keyword = false;
        std::size_t pos = 0;
        while (pos < text.size())
        {
            while (pos < text.size() && isAsciiSpace(text[pos]))
                ++pos;
            std::size_t end = pos;
            while (end < text.size() && !isAsciiSpace(text[end]))
                ++end;
            if (end == pos)
                break;

            std::string word = cleanWord(std::string_view(text).substr(pos, end - pos));
            pos = end;
            if (word.empty())
                continue;

            if (contains(keywords, word))
            {
                addUnique(result.detected_keywords, word);
                has_keyword = true;
            }
            if (contains(indicators, word))
                addUnique(result.off_topic_indicators, word);
        }

        // Indicators accumulate across the batch and are matched as substrings
        bool has_indicator = std::any_of(result.off_topic_indicators.begin(), result.off_topic_indicators.end(),
                                         [&text](const std::string& ind) { return text.find(ind) != std::string::npos; });

        if (has_keyword || !has_indicator)
        {
            ++on_topic;
            continue;
        }

        FlagRecord flag;
        flag.transcript_id = transcript_id;
        flag.flagged_word = kFlaggedWord;
        flag.context = utf8Prefix(segment.text, kContextChars);
        flag.timestamp_ms = static_cast<std::int64_t>(std::floor(segment.start_time * 1000.0));
        flag.speaker = segment.speaker;
        flag.flag_type = FlagType::OffTopic;
        result.off_topic_segments.push_back(std::move(flag));
        result.off_topic_indices.push_back(index);
    }

    result.score = static_cast<double>(on_topic) / static_cast<double>(segments.size());
    return result;
}

} // namespace processing
