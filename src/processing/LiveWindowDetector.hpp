#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

class LexiconMatcher;

/**
 * @brief Sliding-window phrase detector for one text stream.
 *
 * Holds the most recent window_size tokens. After every token pushed by ingest(), the
 * suffixes of the window ending at that token are scored shortest first and the first one
 * that passes its threshold is emitted. A stream instance is not thread-safe; callers
 * serialize ingest() per stream and use one instance per stream.
 *
 * Example:
 * @code
 * // matcher over a lexicon of {"what the hell", "damn"}
 * LiveWindowDetector live(matcher);
 * live.ingest("what ");   // {}
 * live.ingest("the ");    // {}
 * live.ingest("hell");    // { {"what the hell", "what the hell", 1.0, High} }
 * // With Lexicon::builtin() the shorter suffix "hell" is reported instead.
 * @endcode
 */
class LiveWindowDetector
{
public:
    static constexpr std::size_t kDefaultWindowSize = 8;
    static constexpr double kHighSeverityScore = 0.95;

    // A window_size of 0 is treated as 1
    explicit LiveWindowDetector(std::shared_ptr<const LexiconMatcher> matcher,
                                std::size_t window_size = kDefaultWindowSize);

    std::vector<text_processing::LiveDetection> ingest(std::string_view chunk);

    void reset();

    std::size_t windowSize() const { return window_size_; }
    const std::deque<std::string>& tokens() const { return tokens_; }

    static text_processing::Severity severityFor(double score);

private:
    void push(std::string token);
    bool scanSuffixes(text_processing::LiveDetection& out) const;

    std::shared_ptr<const LexiconMatcher> matcher_;
    std::size_t window_size_;
    std::deque<std::string> tokens_;
};

} // namespace processing
