#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Unicode NFKC + zero-width stripping + lower-casing. Idempotent.
    [[nodiscard]] virtual std::string normalize(std::string_view text) const = 0;

    // Limits runs of identical characters to max_run
    [[nodiscard]] virtual std::string collapseRepeats(std::string_view text, std::size_t max_run = 2) const = 0;

    // Maps leet characters (4 @ 3 1 ! | 0 5 $ 7 8) back to letters
    [[nodiscard]] virtual std::string leetUnmask(std::string_view text) const = 0;

    // Removes everything except ASCII letters, digits and whitespace
    [[nodiscard]] virtual std::string stripPunct(std::string_view text) const = 0;
};

} // namespace processing
