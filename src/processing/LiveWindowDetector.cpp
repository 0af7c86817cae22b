#include "LiveWindowDetector.hpp"
#include "LexiconMatcher.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <stdexcept>

#include <plog/Log.h>

using text_processing::LiveDetection;
using text_processing::Severity;

namespace processing
{

LiveWindowDetector::LiveWindowDetector(std::shared_ptr<const LexiconMatcher> matcher, std::size_t window_size)
    : matcher_(std::move(matcher))
    , window_size_(std::max<std::size_t>(1, window_size))
{
    if (!matcher_)
        throw std::invalid_argument("LiveWindowDetector requires a matcher");
}

std::vector<LiveDetection> LiveWindowDetector::ingest(std::string_view chunk)
{
    std::vector<LiveDetection> detections;

    std::size_t pos = 0;
    while (pos < chunk.size())
    {
        if (isAsciiSpace(chunk[pos]))
        {
            ++pos;
            continue;
        }

        std::size_t end = pos;
        while (end < chunk.size() && !isAsciiSpace(chunk[end]))
            ++end;

        push(std::string(chunk.substr(pos, end - pos)));
        pos = end;

        LiveDetection detection;
        if (scanSuffixes(detection))
        {
            if (Diagnostics::IsVerbose())
            {
                PLOG_INFO_(Diagnostics::kLogInstance) << "[LiveWindow] " << Diagnostics::Preview(detection.phrase)
                                                      << " -> " << detection.match << " (" << detection.score << ", "
                                                      << text_processing::severityToString(detection.severity) << ")";
            }
            detections.push_back(std::move(detection));
        }
    }
    return detections;
}

void LiveWindowDetector::reset()
{
    tokens_.clear();
}

Severity LiveWindowDetector::severityFor(double score)
{
    return score >= kHighSeverityScore ? Severity::High : Severity::Medium;
}

void LiveWindowDetector::push(std::string token)
{
    tokens_.push_back(std::move(token));
    while (tokens_.size() > window_size_)
        tokens_.pop_front();
}

bool LiveWindowDetector::scanSuffixes(LiveDetection& out) const
{
    std::string phrase;
    for (auto it = tokens_.rbegin(); it != tokens_.rend(); ++it)
    {
        // Grow the suffix one token to the left: "hell" -> "the hell" -> "what the hell"
        phrase = phrase.empty() ? *it : *it + " " + phrase;

        auto hit = matcher_->detect(phrase);
        if (!hit)
            continue;

        out.phrase = phrase;
        out.match = *hit->entry;
        out.score = hit->score;
        out.severity = severityFor(hit->score);
        return true;
    }
    return false;
}

} // namespace processing
