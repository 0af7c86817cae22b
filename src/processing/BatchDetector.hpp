#pragma once

#include "TextProcessingTypes.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

class LexiconMatcher;

/**
 * @brief Whole-text profanity detection on top of a LexiconMatcher.
 *
 * Tokens are whitespace-delimited; offsets and lengths are byte positions in the
 * original text. The detector keeps no state between calls.
 */
class BatchDetector
{
public:
    explicit BatchDetector(std::shared_ptr<const LexiconMatcher> matcher);

    // Matches in ascending offset order, never overlapping
    std::vector<text_processing::Match> detect(std::string_view text) const;

    // Stops at the first qualifying token
    bool hasProfanity(std::string_view text) const;

    // Spans that partition text exactly; profane spans carry their score
    std::vector<text_processing::HighlightSpan> highlight(std::string_view text) const;

    // Per-word profanity flags for transcript segments, with surrounding-word context and an
    // interpolated timestamp
    std::vector<text_processing::FlagRecord> flagSegments(const std::vector<text_processing::Segment>& segments,
                                                          const std::string& transcript_id) const;

    // Whitespace tokenization with byte offsets, each token searched forward from the end of
    // the previous one
    static std::vector<text_processing::Candidate> tokenize(std::string_view text);

    static constexpr std::size_t kContextWordsBefore = 3;
    static constexpr std::size_t kContextWordsAfter = 3;

private:
    std::shared_ptr<const LexiconMatcher> matcher_;
};

} // namespace processing
