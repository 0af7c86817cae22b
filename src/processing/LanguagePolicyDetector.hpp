#pragma once

#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace processing
{

// Piece of a segment text; violating pieces are runs of a non-allowed script.
struct LanguageSpan
{
    std::string text;
    bool is_violation = false;
};

class LanguagePolicyDetector
{
public:
    static constexpr std::size_t kContextChars = 100;
    static constexpr const char* kDefaultAllowedLanguage = "en";

    // One language_policy flag per segment whose reported language differs (case-insensitive)
    // from allowed_language. Segments without a language are never flagged.
    static std::vector<text_processing::FlagRecord> detect(const std::vector<text_processing::Segment>& segments,
                                                           const std::string& transcript_id,
                                                           const std::string& allowed_language = kDefaultAllowedLanguage);

    static std::optional<text_processing::FlagRecord> detectSegment(const text_processing::Segment& segment,
                                                                    const std::string& transcript_id,
                                                                    const std::string& allowed_language);

    // Splits text at boundaries between foreign-script runs and everything else. Returns a single
    // non-violating span when the segment language is allowed or absent, or when the text has no
    // foreign-script characters. Spans always concatenate back to text.
    static std::vector<LanguageSpan> highlightViolations(const std::string& text,
                                                         const std::optional<std::string>& segment_language,
                                                         const std::string& allowed_language = kDefaultAllowedLanguage);

    static bool isAllowed(const std::optional<std::string>& language, const std::string& allowed_language);
};

} // namespace processing
