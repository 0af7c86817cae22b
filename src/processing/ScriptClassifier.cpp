#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

#include <cstdint>

namespace processing {

namespace {

bool isLatin(uint32_t cp)
{
    return (cp >= 0x41u && cp <= 0x5Au) ||
           (cp >= 0x61u && cp <= 0x7Au) ||
           (cp >= 0xC0u && cp <= 0x24Fu && cp != 0xD7u && cp != 0xF7u) ||
           (cp >= 0x1E00u && cp <= 0x1EFFu);
}

bool isDevanagari(uint32_t cp)
{
    return cp >= 0x0900u && cp <= 0x097Fu;
}

bool isArabic(uint32_t cp)
{
    return (cp >= 0x0600u && cp <= 0x06FFu) ||
           (cp >= 0x0750u && cp <= 0x077Fu);
}

bool isKana(uint32_t cp)
{
    return (cp >= 0x3040u && cp <= 0x309Fu) ||
           (cp >= 0x30A0u && cp <= 0x30FFu) ||
           (cp >= 0x31F0u && cp <= 0x31FFu) ||
           (cp >= 0xFF66u && cp <= 0xFF9Fu);
}

bool isCjkUnified(uint32_t cp)
{
    return (cp >= 0x4E00u && cp <= 0x9FFFu) ||
           (cp >= 0x3400u && cp <= 0x4DBFu) ||
           (cp >= 0xF900u && cp <= 0xFAFFu);
}

bool isHangul(uint32_t cp)
{
    return (cp >= 0xAC00u && cp <= 0xD7AFu) ||
           (cp >= 0x1100u && cp <= 0x11FFu) ||
           (cp >= 0x3130u && cp <= 0x318Fu);
}

} // namespace

ScriptTag classifyScript(char32_t cp)
{
    const auto v = static_cast<uint32_t>(cp);
    if (isLatin(v))
        return ScriptTag::Latin;
    if (isDevanagari(v))
        return ScriptTag::Devanagari;
    if (isArabic(v))
        return ScriptTag::Arabic;
    if (isCjkUnified(v) || isKana(v))
        return ScriptTag::CJK;
    if (isHangul(v))
        return ScriptTag::Hangul;
    return ScriptTag::Other;
}

bool isForeignScript(ScriptTag tag)
{
    switch (tag)
    {
    case ScriptTag::Devanagari:
    case ScriptTag::Arabic:
    case ScriptTag::CJK:
    case ScriptTag::Hangul:
        return true;
    default:
        return false;
    }
}

std::vector<TaggedCodepoint> tagCodepoints(std::string_view utf8_text)
{
    std::vector<TaggedCodepoint> tagged;
    const std::u32string cps = utf8ToUtf32(utf8_text);
    tagged.reserve(cps.size());
    for (char32_t cp : cps)
        tagged.emplace_back(cp, classifyScript(cp));
    return tagged;
}

std::vector<ScriptRun> mergeScriptRuns(const std::vector<TaggedCodepoint>& tagged)
{
    std::vector<ScriptRun> runs;
    for (const auto& [cp, tag] : tagged)
    {
        if (runs.empty() || runs.back().tag != tag)
            runs.push_back(ScriptRun{ tag, std::u32string() });
        runs.back().text.push_back(cp);
    }
    return runs;
}

const char* scriptTagToString(ScriptTag tag)
{
    switch (tag)
    {
    case ScriptTag::Latin: return "latin";
    case ScriptTag::Devanagari: return "devanagari";
    case ScriptTag::Arabic: return "arabic";
    case ScriptTag::CJK: return "cjk";
    case ScriptTag::Hangul: return "hangul";
    case ScriptTag::Other: return "other";
    }
    return "other";
}

} // namespace processing
