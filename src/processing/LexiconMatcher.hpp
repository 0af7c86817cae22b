#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace processing
{

class Lexicon;
class ITextNormalizer;
class IFuzzyMatcher;

struct LexiconScore
{
    double score = 0.0;
    std::optional<std::string> entry;   // configured term of the best-scoring entry
};

/**
 * @brief Scores a raw candidate (word or phrase) against the whole lexicon.
 *
 * Scoring order:
 * - candidate containing a whitelist word (substring of the normalized form) -> 0, no entry
 * - phrase entry contained verbatim in the normalized candidate -> 1.0, that entry
 * - otherwise the best similarity against every entry; ties keep the earlier entry and the
 *   scan stops once a score reaches kNearCertainScore
 */
class LexiconMatcher
{
public:
    static constexpr std::size_t kShortWordMaxLength = 6;
    static constexpr double kShortWordThreshold = 0.95;
    static constexpr double kLongWordThreshold = 0.85;
    static constexpr double kNearCertainScore = 0.98;

    explicit LexiconMatcher(std::shared_ptr<const Lexicon> lexicon);
    LexiconMatcher(std::shared_ptr<const Lexicon> lexicon,
                   std::unique_ptr<ITextNormalizer> normalizer,
                   std::unique_ptr<IFuzzyMatcher> fuzzy);
    ~LexiconMatcher();

    LexiconMatcher(const LexiconMatcher&) = delete;
    LexiconMatcher& operator=(const LexiconMatcher&) = delete;
    LexiconMatcher(LexiconMatcher&&) noexcept;
    LexiconMatcher& operator=(LexiconMatcher&&) noexcept;

    [[nodiscard]] LexiconScore match(std::string_view raw_candidate) const;

    // Score and entry only when the score reaches decisionThreshold(raw_candidate)
    [[nodiscard]] std::optional<LexiconScore> detect(std::string_view raw_candidate) const;

    // 0.95 for words of at most 6 code points, 0.85 for longer ones
    [[nodiscard]] static double decisionThreshold(std::string_view word);
    [[nodiscard]] static bool passes(std::string_view word, double score);

    const Lexicon& lexicon() const { return *lexicon_; }
    std::shared_ptr<const Lexicon> sharedLexicon() const { return lexicon_; }
    const ITextNormalizer& normalizer() const { return *normalizer_; }

private:
    std::shared_ptr<const Lexicon> lexicon_;
    std::unique_ptr<ITextNormalizer> normalizer_;
    std::unique_ptr<IFuzzyMatcher> fuzzy_;
};

} // namespace processing
