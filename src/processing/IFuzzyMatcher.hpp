#pragma once

#include <cstddef>
#include <string_view>

namespace processing
{

/**
 * @brief Abstract interface for edit-distance based string scorers.
 *
 * Implementations must be pure: no state changes between calls, safe to share
 * read-only across threads.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Edit distance between two strings, counted in code points.
     */
    virtual std::size_t distance(std::string_view a, std::string_view b) const = 0;

    /**
     * @brief Similarity between a candidate token and a lexicon entry.
     *
     * @return Score normalized to [0.0, 1.0]; 1.0 only for identical inputs.
     */
    virtual double similarity(std::string_view token, std::string_view entry) const = 0;
};

} // namespace processing
