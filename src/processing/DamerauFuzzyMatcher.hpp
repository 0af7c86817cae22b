#pragma once

#include "IFuzzyMatcher.hpp"

namespace processing
{

/**
 * @brief Damerau-Levenshtein scorer with leet-speak tolerance.
 *
 * distance() is the optimal-string-alignment variant: insert, delete, substitute and
 * swapping two adjacent characters each cost 1.
 *
 * similarity() scoring:
 * - identical inputs -> 1.0
 * - identical after leet_unmask + strip_punct on both sides -> 0.98
 * - otherwise max(0, 1 - distance / longer_length) over the stripped forms
 *
 * Example:
 * @code
 * DamerauFuzzyMatcher matcher;
 * matcher.similarity("sh1t", "shit"); // 0.98
 * matcher.similarity("shti", "shit"); // 0.75, one transposition
 * @endcode
 */
class DamerauFuzzyMatcher : public IFuzzyMatcher
{
public:
    static constexpr double kUnmaskedMatchScore = 0.98;

    DamerauFuzzyMatcher() = default;
    ~DamerauFuzzyMatcher() override = default;

    std::size_t distance(std::string_view a, std::string_view b) const override;
    double similarity(std::string_view token, std::string_view entry) const override;
};

} // namespace processing
