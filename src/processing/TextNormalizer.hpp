#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Stateless text stages shared by the normalizer, the similarity scorer and the matcher.
// All of them are total: any input, including empty or malformed UTF-8, yields a string.

// Removes U+200B-U+200F and U+FEFF
[[nodiscard]] std::string strip_zero_width(std::string_view text);

// Collapses every run of 3+ identical code points to exactly max_run copies ("loooool" -> "lool")
[[nodiscard]] std::string collapse_repeats(std::string_view text, std::size_t max_run = 2);

// Replaces leet characters with the letter they imitate; unmapped characters pass through
[[nodiscard]] std::string leet_unmask(std::string_view text);

// Keeps ASCII letters, ASCII digits and ASCII whitespace only
[[nodiscard]] std::string strip_punct(std::string_view text);

[[nodiscard]] char leet_letter(char c);

} // namespace processing
