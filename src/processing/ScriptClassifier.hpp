#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace processing
{

enum class ScriptTag
{
    Latin,
    Devanagari,
    Arabic,
    CJK,        // Han ideographs plus Japanese kana
    Hangul,
    Other       // digits, punctuation, whitespace and unlisted scripts
};

using TaggedCodepoint = std::pair<char32_t, ScriptTag>;

struct ScriptRun
{
    ScriptTag tag = ScriptTag::Other;
    std::u32string text;
};

[[nodiscard]] ScriptTag classifyScript(char32_t cp);

// Scripts that violate an English-only policy
[[nodiscard]] bool isForeignScript(ScriptTag tag);

[[nodiscard]] std::vector<TaggedCodepoint> tagCodepoints(std::string_view utf8_text);

// Merges adjacent entries with the same tag into runs; concatenating the runs gives back the input
[[nodiscard]] std::vector<ScriptRun> mergeScriptRuns(const std::vector<TaggedCodepoint>& tagged);

[[nodiscard]] const char* scriptTagToString(ScriptTag tag);

} // namespace processing
