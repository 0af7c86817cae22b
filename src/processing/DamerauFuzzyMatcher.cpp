#include "DamerauFuzzyMatcher.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <rapidfuzz/distance/OSA.hpp>
#include <algorithm>

namespace processing
{

std::size_t DamerauFuzzyMatcher::distance(std::string_view a, std::string_view b) const
{
    if (a.empty())
        return utf8Length(b);
    if (b.empty())
        return utf8Length(a);

    // Compare code points, not bytes, so a multi-byte letter counts as one edit
    const std::u32string wide_a = utf8ToUtf32(a);
    const std::u32string wide_b = utf8ToUtf32(b);
    return static_cast<std::size_t>(rapidfuzz::osa_distance(wide_a, wide_b));
}

double DamerauFuzzyMatcher::similarity(std::string_view token, std::string_view entry) const
{
    if (token == entry)
        return 1.0;

    const std::string stripped_token = strip_punct(leet_unmask(token));
    const std::string stripped_entry = strip_punct(leet_unmask(entry));

    if (stripped_token == stripped_entry)
    {
        // Both sides reduced to nothing: they only matched through punctuation
        return stripped_token.empty() ? 0.0 : kUnmaskedMatchScore;
    }

    const std::size_t longest = std::max(stripped_token.size(), stripped_entry.size());
    const double d = static_cast<double>(distance(stripped_token, stripped_entry));
    return std::max(0.0, 1.0 - d / static_cast<double>(longest));
}

} // namespace processing
