#pragma once

#include "IFlagValidator.hpp"
#include "../processing/ContentAnalyzer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace moderation
{

struct TranscriptModeration
{
    processing::ContentAnalysisResult analysis;
    std::vector<text_processing::FlagSet> reviewed;   // one entry per input segment
};

/**
 * @brief Proposes flags with the content analyzer and passes them through the optional validator.
 *
 * Fail-open: without a ready validator, or when the validator call fails in any way, review()
 * returns the proposed flags unchanged. The validator can only drop flags; reviewed entries
 * that do not correspond to a proposed flag of the same category are discarded.
 */
class ModerationOrchestrator
{
public:
    explicit ModerationOrchestrator(std::shared_ptr<const processing::ContentAnalyzer> analyzer,
                                    std::shared_ptr<IFlagValidator> validator = nullptr);

    text_processing::FlagSet propose(const std::string& transcript_id, const text_processing::Segment& segment) const;

    text_processing::FlagSet review(const std::string& transcript_id, const text_processing::Segment& segment,
                                    const text_processing::FlagSet& proposed);

    // propose() followed by review()
    text_processing::FlagSet moderateSegment(const std::string& transcript_id, const text_processing::Segment& segment);

    // Full analysis, then a review of each segment's profanity, language and off-topic flags
    TranscriptModeration moderateTranscript(const std::string& transcript_id,
                                            const std::vector<text_processing::Segment>& segments);

    // Entries of reviewed that match a proposed flag (same flaggedWord and timestampMs) in the
    // same category, returned as the proposed records
    static text_processing::FlagSet keepProposedOnly(const text_processing::FlagSet& proposed,
                                                     const text_processing::FlagSet& reviewed);

    bool hasValidator() const;

private:
    std::shared_ptr<const processing::ContentAnalyzer> analyzer_;
    std::shared_ptr<IFlagValidator> validator_;
};

} // namespace moderation
