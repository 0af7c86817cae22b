#pragma once

#include "TextProcessingTypes.hpp"
#include "TopicAdherenceScorer.hpp"
#include "ParticipationAnalyzer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace processing
{

class LexiconMatcher;

struct ContentAnalyzerConfig
{
    std::string allowed_language = "en";
    TopicConfig topic;
    ParticipationConfig participation;
};

struct ContentAnalysisResult
{
    std::vector<text_processing::FlagRecord> profanity;
    std::vector<text_processing::FlagRecord> language_policy;
    text_processing::ParticipationBalance participation;
    text_processing::TopicAdherenceResult topic_adherence;
    std::vector<text_processing::FlagRecord> participation_flags;
    // profanity, language policy, off-topic, participation, in that order
    std::vector<text_processing::FlagRecord> all_flagged;
    // One entry per input segment: the profanity, language policy and off-topic flags it produced
    std::vector<text_processing::FlagSet> segment_flags;
};

// Runs the transcript detectors as independent stages; a failing stage contributes no flags.
class ContentAnalyzer
{
public:
    static constexpr double kLowTopicAdherence = 0.7;

    explicit ContentAnalyzer(std::shared_ptr<const LexiconMatcher> matcher, ContentAnalyzerConfig config = {});
    ~ContentAnalyzer();

    // Real-time pass over one segment: profanity and language policy only
    [[nodiscard]] text_processing::FlagSet analyzeSegment(const text_processing::Segment& segment,
                                                          const std::string& transcript_id) const;

    // End-of-session pass over the whole transcript
    [[nodiscard]] ContentAnalysisResult analyzeTranscript(const std::vector<text_processing::Segment>& segments,
                                                          const std::string& transcript_id) const;

    // Flags the segment at `index` of the analyzed transcript produced; empty when out of range
    [[nodiscard]] static text_processing::FlagSet flagsForSegment(const ContentAnalysisResult& analysis,
                                                                  std::size_t index);

    const ContentAnalyzerConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
