#include "LexiconMatcher.hpp"
#include "Lexicon.hpp"
#include "NFKCTextNormalizer.hpp"
#include "DamerauFuzzyMatcher.hpp"
#include "TextUtils.hpp"

#include <stdexcept>

namespace processing
{

LexiconMatcher::LexiconMatcher(std::shared_ptr<const Lexicon> lexicon)
    : LexiconMatcher(std::move(lexicon), std::make_unique<NFKCTextNormalizer>(),
                     std::make_unique<DamerauFuzzyMatcher>())
{
}

LexiconMatcher::LexiconMatcher(std::shared_ptr<const Lexicon> lexicon,
                               std::unique_ptr<ITextNormalizer> normalizer,
                               std::unique_ptr<IFuzzyMatcher> fuzzy)
    : lexicon_(std::move(lexicon))
    , normalizer_(std::move(normalizer))
    , fuzzy_(std::move(fuzzy))
{
    if (!lexicon_ || !normalizer_ || !fuzzy_)
        throw std::invalid_argument("LexiconMatcher requires a lexicon, a normalizer and a fuzzy matcher");
}

LexiconMatcher::~LexiconMatcher() = default;
LexiconMatcher::LexiconMatcher(LexiconMatcher&&) noexcept = default;
LexiconMatcher& LexiconMatcher::operator=(LexiconMatcher&&) noexcept = default;

LexiconScore LexiconMatcher::match(std::string_view raw_candidate) const
{
    LexiconScore best;

    const std::string norm = normalizer_->collapseRepeats(normalizer_->normalize(raw_candidate));
    if (norm.empty())
        return best;

    for (const auto& safe : lexicon_->whitelist())
    {
        if (norm.find(safe) != std::string::npos)
            return best;
    }

    const std::string letters = normalizer_->stripPunct(normalizer_->leetUnmask(norm));

    for (const auto& entry : lexicon_->entries())
    {
        if (entry.is_phrase && norm.find(entry.normalized) != std::string::npos)
        {
            best.score = 1.0;
            best.entry = entry.term;
            return best;
        }

        double s = fuzzy_->similarity(letters, entry.normalized);
        if (s > best.score)
        {
            best.score = s;
            best.entry = entry.term;
        }
        if (best.score >= kNearCertainScore)
            break;
    }
    return best;
}

std::optional<LexiconScore> LexiconMatcher::detect(std::string_view raw_candidate) const
{
    LexiconScore result = match(raw_candidate);
    if (!result.entry || !passes(raw_candidate, result.score))
        return std::nullopt;
    return result;
}

double LexiconMatcher::decisionThreshold(std::string_view word)
{
    return utf8Length(word) <= kShortWordMaxLength ? kShortWordThreshold : kLongWordThreshold;
}

bool LexiconMatcher::passes(std::string_view word, double score)
{
    return score >= decisionThreshold(word);
}

} // namespace processing
