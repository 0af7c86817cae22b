#include "ModerationOrchestrator.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <stdexcept>

using text_processing::FlagRecord;
using text_processing::FlagSet;
using text_processing::Segment;

namespace moderation
{

namespace
{

std::vector<FlagRecord> keepMatching(const std::vector<FlagRecord>& proposed, const std::vector<FlagRecord>& reviewed)
{
    std::vector<bool> kept(proposed.size(), false);
    for (const auto& r : reviewed)
    {
        for (std::size_t i = 0; i < proposed.size(); ++i)
        {
            if (!kept[i] && proposed[i].flagged_word == r.flagged_word && proposed[i].timestamp_ms == r.timestamp_ms)
            {
                kept[i] = true;
                break;
            }
        }
    }

    std::vector<FlagRecord> out;
    for (std::size_t i = 0; i < proposed.size(); ++i)
    {
        if (kept[i])
            out.push_back(proposed[i]);
    }
    return out;
}

} // namespace

ModerationOrchestrator::ModerationOrchestrator(std::shared_ptr<const processing::ContentAnalyzer> analyzer,
                                               std::shared_ptr<IFlagValidator> validator)
    : analyzer_(std::move(analyzer))
    , validator_(std::move(validator))
{
    if (!analyzer_)
        throw std::invalid_argument("ModerationOrchestrator requires a content analyzer");
}

bool ModerationOrchestrator::hasValidator() const
{
    return validator_ && validator_->isReady();
}

FlagSet ModerationOrchestrator::propose(const std::string& transcript_id, const Segment& segment) const
{
    return analyzer_->analyzeSegment(segment, transcript_id);
}

FlagSet ModerationOrchestrator::review(const std::string& transcript_id, const Segment& segment, const FlagSet& proposed)
{
    // Nothing to drop
    if (proposed.empty() || !hasValidator())
        return proposed;

    std::optional<FlagSet> reviewed;
    try
    {
        reviewed = validator_->validate(transcript_id, segment, proposed);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Validation,
                                            "Flag validator unavailable, keeping proposed flags", ex.what());
        return proposed;
    }

    if (!reviewed)
    {
        PLOG_WARNING_(processing::Diagnostics::kLogInstance)
            << "[Orchestrator] transcript=" << transcript_id << " validator unavailable ("
            << validator_->lastError() << ") -> keeping " << proposed.size() << " proposed flag(s)";
        return proposed;
    }

    FlagSet kept = keepProposedOnly(proposed, *reviewed);
    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "[Orchestrator] transcript=" << transcript_id << " proposed=" << proposed.size()
            << " kept=" << kept.size();
    }
    return kept;
}

FlagSet ModerationOrchestrator::moderateSegment(const std::string& transcript_id, const Segment& segment)
{
    return review(transcript_id, segment, propose(transcript_id, segment));
}

TranscriptModeration ModerationOrchestrator::moderateTranscript(const std::string& transcript_id,
                                                                const std::vector<Segment>& segments)
{
    TranscriptModeration result;
    result.analysis = analyzer_->analyzeTranscript(segments, transcript_id);
    result.reviewed.reserve(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
        FlagSet proposed = processing::ContentAnalyzer::flagsForSegment(result.analysis, i);
        result.reviewed.push_back(review(transcript_id, segments[i], proposed));
    }
    return result;
}

FlagSet ModerationOrchestrator::keepProposedOnly(const FlagSet& proposed, const FlagSet& reviewed)
{
    FlagSet kept;
    kept.profanity = keepMatching(proposed.profanity, reviewed.profanity);
    kept.language_policy = keepMatching(proposed.language_policy, reviewed.language_policy);
    kept.off_topic = keepMatching(proposed.off_topic, reviewed.off_topic);
    return kept;
}

} // namespace moderation
