#include "NFKCTextNormalizer.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"
#include "Diagnostics.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace processing
{

std::string NFKCTextNormalizer::nfkc(const std::string& text)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (!normalized)
    {
        // Malformed UTF-8: re-encode with U+FFFD replacements and try once more
        PLOG_WARNING_(Diagnostics::kLogInstance) << "NFKC normalization failed, re-encoding input "
                                                 << Diagnostics::Preview(text);
        std::string repaired = utf32ToUtf8(utf8ToUtf32(text));
        normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(repaired.c_str()));
        if (!normalized)
            return repaired;
    }

    std::string out(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return out;
}

std::string NFKCTextNormalizer::normalize(std::string_view text) const
{
    if (text.empty())
        return {};

    std::string compat = nfkc(std::string(text));
    std::string lowered = toLowerUtf8(strip_zero_width(compat));
    // Lower-casing can leave a sequence that NFKC would still rewrite
    return nfkc(lowered);
}

std::string NFKCTextNormalizer::collapseRepeats(std::string_view text, std::size_t max_run) const
{
    return collapse_repeats(text, max_run);
}

std::string NFKCTextNormalizer::leetUnmask(std::string_view text) const
{
    return leet_unmask(text);
}

std::string NFKCTextNormalizer::stripPunct(std::string_view text) const
{
    return strip_punct(text);
}

} // namespace processing
