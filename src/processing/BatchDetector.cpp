#include "BatchDetector.hpp"
#include "LexiconMatcher.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <plog/Log.h>

using text_processing::Candidate;
using text_processing::FlagRecord;
using text_processing::FlagType;
using text_processing::HighlightSpan;
using text_processing::Match;
using text_processing::Segment;

namespace processing
{

BatchDetector::BatchDetector(std::shared_ptr<const LexiconMatcher> matcher)
    : matcher_(std::move(matcher))
{
    if (!matcher_)
        throw std::invalid_argument("BatchDetector requires a matcher");
}

std::vector<Candidate> BatchDetector::tokenize(std::string_view text)
{
    std::vector<Candidate> tokens;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() && isAsciiSpace(text[pos]))
            ++pos;
        if (pos >= text.size())
            break;

        std::size_t end = pos;
        while (end < text.size() && !isAsciiSpace(text[end]))
            ++end;

        Candidate c;
        c.raw = std::string(text.substr(pos, end - pos));
        c.offset = pos;
        c.length = end - pos;
        tokens.push_back(std::move(c));
        pos = end;
    }
    return tokens;
}

std::vector<Match> BatchDetector::detect(std::string_view text) const
{
    std::vector<Match> matches;
    for (auto& token : tokenize(text))
    {
        auto hit = matcher_->detect(token.raw);
        if (!hit)
            continue;

        Match m;
        m.source_text = std::move(token.raw);
        m.offset = token.offset;
        m.length = token.length;
        m.score = hit->score;
        m.lexicon_entry = *hit->entry;
        matches.push_back(std::move(m));
    }

    if (Diagnostics::IsVerbose() && !matches.empty())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[BatchDetector] " << matches.size() << " match(es) in "
                                               << Diagnostics::Preview(text);
    }
    return matches;
}

bool BatchDetector::hasProfanity(std::string_view text) const
{
    for (const auto& token : tokenize(text))
    {
        if (matcher_->detect(token.raw))
            return true;
    }
    return false;
}

std::vector<HighlightSpan> BatchDetector::highlight(std::string_view text) const
{
    std::vector<Match> matches = detect(text);
    if (matches.empty())
        return { HighlightSpan{ std::string(text), false, std::nullopt } };

    std::stable_sort(matches.begin(), matches.end(),
                     [](const Match& a, const Match& b) { return a.offset < b.offset; });

    std::vector<HighlightSpan> spans;
    std::size_t last = 0;
    for (const auto& m : matches)
    {
        // Overlap cannot come out of detect(); skip it rather than duplicate bytes
        if (m.offset < last)
            continue;
        if (m.offset > last)
            spans.push_back(HighlightSpan{ std::string(text.substr(last, m.offset - last)), false, std::nullopt });
        spans.push_back(HighlightSpan{ std::string(text.substr(m.offset, m.length)), true, m.score });
        last = m.offset + m.length;
    }
    if (last < text.size())
        spans.push_back(HighlightSpan{ std::string(text.substr(last)), false, std::nullopt });
    return spans;
}

std::vector<FlagRecord> BatchDetector::flagSegments(const std::vector<Segment>& segments,
                                                    const std::string& transcript_id) const
{
    std::vector<FlagRecord> flags;
    for (const auto& segment : segments)
    {
        auto words = tokenize(segment.text);
        if (words.empty())
            continue;

        const double start_ms = segment.start_time * 1000.0;
        const double ms_per_word = (segment.end_time - segment.start_time) * 1000.0 / static_cast<double>(words.size());

        for (std::size_t i = 0; i < words.size(); ++i)
        {
            if (!matcher_->detect(words[i].raw))
                continue;

            std::size_t from = i >= kContextWordsBefore ? i - kContextWordsBefore : 0;
            std::size_t to = std::min(words.size(), i + kContextWordsAfter + 1);
            std::string context;
            for (std::size_t k = from; k < to; ++k)
            {
                if (!context.empty())
                    context += ' ';
                context += words[k].raw;
            }

            FlagRecord flag;
            flag.transcript_id = transcript_id;
            flag.flagged_word = words[i].raw;
            flag.context = std::move(context);
            flag.timestamp_ms = static_cast<std::int64_t>(std::floor(start_ms + static_cast<double>(i) * ms_per_word));
            flag.speaker = segment.speaker;
            flag.flag_type = FlagType::Profanity;
            flags.push_back(std::move(flag));
        }
    }
    return flags;
}

} // namespace processing
