#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

namespace processing
{

std::string strip_zero_width(std::string_view text)
{
    if (text.empty())
        return {};

    std::u32string cps = utf8ToUtf32(text);
    std::u32string kept;
    kept.reserve(cps.size());
    for (char32_t cp : cps)
    {
        if (!isZeroWidthChar(cp))
            kept.push_back(cp);
    }
    if (kept.size() == cps.size())
        return std::string(text);
    return utf32ToUtf8(kept);
}

std::string collapse_repeats(std::string_view text, std::size_t max_run)
{
    if (text.empty())
        return {};

    std::u32string cps = utf8ToUtf32(text);
    std::u32string out;
    out.reserve(cps.size());

    std::size_t i = 0;
    while (i < cps.size())
    {
        std::size_t run_end = i + 1;
        while (run_end < cps.size() && cps[run_end] == cps[i])
            ++run_end;

        const std::size_t run = run_end - i;
        // Runs of one or two are left alone
        const std::size_t keep = run >= 3 ? max_run : run;
        out.append(keep, cps[i]);
        i = run_end;
    }
    return utf32ToUtf8(out);
}

char leet_letter(char c)
{
    switch (c)
    {
    case '4':
    case '@':
        return 'a';
    case '3':
        return 'e';
    case '1':
    case '!':
    case '|':
        return 'i';
    case '0':
        return 'o';
    case '5':
    case '$':
        return 's';
    case '7':
        return 't';
    case '8':
        return 'b';
    default:
        return c;
    }
}

std::string leet_unmask(std::string_view text)
{
    // Every mapped character is ASCII, so multi-byte sequences pass through untouched
    std::string out(text);
    for (char& c : out)
        c = leet_letter(c);
    return out;
}

std::string strip_punct(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        const auto uc = static_cast<unsigned char>(c);
        const bool letter = (uc >= 'a' && uc <= 'z') || (uc >= 'A' && uc <= 'Z');
        const bool digit = uc >= '0' && uc <= '9';
        if (letter || digit || isAsciiSpace(c))
            out.push_back(c);
    }
    return out;
}

} // namespace processing
