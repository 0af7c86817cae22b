#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// UTF-8 to UTF-32 conversion. Malformed bytes decode to U+FFFD one byte at a time.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Number of code points in a UTF-8 string (malformed bytes count as one each)
std::size_t utf8Length(std::string_view utf8_str);

/// Leading max_chars code points of a UTF-8 string
std::string utf8Prefix(std::string_view utf8_str, std::size_t max_chars);

/// Simple (1:1) Unicode lower-casing
std::string toLowerUtf8(std::string_view utf8_str);

inline bool isAsciiSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Zero-width and BOM format characters removed by normalization (U+200B-U+200F, U+FEFF)
constexpr char32_t ZERO_WIDTH_FIRST = U'\u200B';
constexpr char32_t ZERO_WIDTH_LAST = U'\u200F';
constexpr char32_t BYTE_ORDER_MARK = U'\uFEFF';

inline bool isZeroWidthChar(char32_t cp)
{
    return (cp >= ZERO_WIDTH_FIRST && cp <= ZERO_WIDTH_LAST) || cp == BYTE_ORDER_MARK;
}

} // namespace processing
