#pragma once

#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

struct TopicConfig
{
    std::vector<std::string> topic_keywords;        // empty -> defaultTopicKeywords()
    std::optional<std::string> topic_prompt;        // free-text topic line for the validator prompt
    std::vector<std::string> off_topic_indicators;  // empty -> defaultOffTopicIndicators()
};

/**
 * @brief Keyword-based on/off-topic classification over a batch of segments.
 *
 * Words are lower-cased, split on whitespace and stripped of everything but [A-Za-z0-9_].
 * A segment is off-topic when it has no topic keyword (exact stripped-word match) and one
 * of the indicators seen so far in the batch occurs as a substring of its lower-cased text.
 * The indicator check is deliberately substring-based while the keyword check is exact.
 */
class TopicAdherenceScorer
{
public:
    static constexpr std::size_t kContextChars = 150;
    static constexpr const char* kFlaggedWord = "off_topic";

    static text_processing::TopicAdherenceResult analyze(const std::vector<text_processing::Segment>& segments,
                                                         const std::string& transcript_id,
                                                         const TopicConfig& config = {});

    static const std::vector<std::string>& defaultTopicKeywords();
    static const std::vector<std::string>& defaultOffTopicIndicators();

    // Lower-case word with every non-word character removed
    static std::string cleanWord(std::string_view word);
};

} // namespace processing
