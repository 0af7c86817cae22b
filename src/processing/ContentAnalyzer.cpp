#include "ContentAnalyzer.hpp"
#include "BatchDetector.hpp"
#include "LanguagePolicyDetector.hpp"
#include "LexiconMatcher.hpp"
#include "StageRunner.hpp"
#include "Diagnostics.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include <plog/Log.h>

using text_processing::FlagRecord;
using text_processing::FlagSet;
using text_processing::ParticipationBalance;
using text_processing::Segment;
using text_processing::StageResult;
using text_processing::TopicAdherenceResult;

namespace processing
{

namespace
{

template <typename T>
void logStage(const StageResult<T>& stage, const std::string& transcript_id)
{
    if (!stage.succeeded)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "[ContentAnalyzer] transcript=" << transcript_id << " stage=" << stage.stage_name
            << " status=error reason=" << (stage.error ? *stage.error : "unknown") << " -> no flags";
    }
    else if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[ContentAnalyzer] transcript=" << transcript_id
                                              << " stage=" << stage.stage_name << " status=ok duration="
                                              << stage.duration.count() << "us";
    }
}

std::string joinWords(const std::vector<FlagRecord>& flags)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < flags.size(); ++i)
    {
        if (i)
            oss << ", ";
        oss << flags[i].flagged_word;
    }
    return oss.str();
}

void logDecisions(const ContentAnalysisResult& r, const std::string& transcript_id, const std::string& allowed_language)
{
    if (!r.profanity.empty())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[ContentAnalyzer] transcript=" << transcript_id
                                              << " decision=profanity_detected count=" << r.profanity.size()
                                              << " words=[" << joinWords(r.profanity) << "]";
    }
    if (!r.language_policy.empty())
    {
        std::set<std::string> languages;
        for (const auto& v : r.language_policy)
            languages.insert(v.flagged_word);
        std::ostringstream oss;
        for (const auto& lang : languages)
            oss << (oss.tellp() > 0 ? "," : "") << lang;
        PLOG_INFO_(Diagnostics::kLogInstance) << "[ContentAnalyzer] transcript=" << transcript_id
                                              << " decision=language_policy_violation count=" << r.language_policy.size()
                                              << " detected=[" << oss.str() << "] allowed=" << allowed_language;
    }
    if (!r.participation.is_balanced)
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[ContentAnalyzer] transcript=" << transcript_id
                                              << " decision=participation_imbalance reason="
                                              << r.participation.imbalance_reason.value_or("");
    }
    if (r.topic_adherence.score < ContentAnalyzer::kLowTopicAdherence)
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[ContentAnalyzer] transcript=" << transcript_id
                                              << " decision=low_topic_adherence score=" << r.topic_adherence.score
                                              << " off_topic=" << r.topic_adherence.off_topic_segments.size();
    }
}

using PerSegmentFlags = std::vector<std::vector<FlagRecord>>;

std::vector<FlagRecord> flatten(const PerSegmentFlags& per_segment)
{
    std::vector<FlagRecord> out;
    for (const auto& flags : per_segment)
        out.insert(out.end(), flags.begin(), flags.end());
    return out;
}

} // anonymous namespace

struct ContentAnalyzer::Impl
{
    Impl(std::shared_ptr<const LexiconMatcher> m, ContentAnalyzerConfig c)
        : batch(std::move(m))
        , config(std::move(c))
    {
    }

    BatchDetector batch;
    ContentAnalyzerConfig config;
};

ContentAnalyzer::ContentAnalyzer(std::shared_ptr<const LexiconMatcher> matcher, ContentAnalyzerConfig config)
    : impl_(std::make_unique<Impl>(std::move(matcher), std::move(config)))
{
}

ContentAnalyzer::~ContentAnalyzer() = default;

const ContentAnalyzerConfig& ContentAnalyzer::config() const
{
    return impl_->config;
}

FlagSet ContentAnalyzer::analyzeSegment(const Segment& segment, const std::string& transcript_id) const
{
    FlagSet flags;
    const std::vector<Segment> one{ segment };

    auto profanity = run_stage<std::vector<FlagRecord>>("profanity",
                                                        [&]() { return impl_->batch.flagSegments(one, transcript_id); });
    logStage(profanity, transcript_id);
    if (profanity.succeeded)
        flags.profanity = std::move(profanity.result);

    if (auto violation = LanguagePolicyDetector::detectSegment(segment, transcript_id, impl_->config.allowed_language))
        flags.language_policy.push_back(std::move(*violation));

    return flags;
}

ContentAnalysisResult ContentAnalyzer::analyzeTranscript(const std::vector<Segment>& segments,
                                                         const std::string& transcript_id) const
{
    ContentAnalysisResult r;
    const auto& cfg = impl_->config;

    r.segment_flags.resize(segments.size());

    auto profanity = run_stage<PerSegmentFlags>("profanity",
                                                [&]()
                                                {
                                                    PerSegmentFlags per_segment;
                                                    per_segment.reserve(segments.size());
                                                    for (const auto& segment : segments)
                                                        per_segment.push_back(impl_->batch.flagSegments({ segment }, transcript_id));
                                                    return per_segment;
                                                });
    logStage(profanity, transcript_id);
    if (profanity.succeeded)
    {
        r.profanity = flatten(profanity.result);
        for (std::size_t i = 0; i < segments.size(); ++i)
            r.segment_flags[i].profanity = std::move(profanity.result[i]);
    }

    auto language = run_stage<PerSegmentFlags>("language_policy",
                                               [&]()
                                               {
                                                   PerSegmentFlags per_segment(segments.size());
                                                   for (std::size_t i = 0; i < segments.size(); ++i)
                                                   {
                                                       if (auto flag = LanguagePolicyDetector::detectSegment(
                                                               segments[i], transcript_id, cfg.allowed_language))
                                                           per_segment[i].push_back(std::move(*flag));
                                                   }
                                                   return per_segment;
                                               });
    logStage(language, transcript_id);
    if (language.succeeded)
    {
        r.language_policy = flatten(language.result);
        for (std::size_t i = 0; i < segments.size(); ++i)
            r.segment_flags[i].language_policy = std::move(language.result[i]);
    }

    auto participation = run_stage<ParticipationBalance>(
        "participation", [&]() { return ParticipationAnalyzer::analyze(segments, cfg.participation); });
    logStage(participation, transcript_id);
    if (participation.succeeded)
        r.participation = std::move(participation.result);

    auto topic = run_stage<TopicAdherenceResult>(
        "topic_adherence", [&]() { return TopicAdherenceScorer::analyze(segments, transcript_id, cfg.topic); });
    logStage(topic, transcript_id);
    if (topic.succeeded)
    {
        r.topic_adherence = std::move(topic.result);
        const auto& off_topic = r.topic_adherence.off_topic_segments;
        const auto& indices = r.topic_adherence.off_topic_indices;
        for (std::size_t k = 0; k < off_topic.size() && k < indices.size(); ++k)
        {
            if (indices[k] < r.segment_flags.size())
                r.segment_flags[indices[k]].off_topic.push_back(off_topic[k]);
        }
    }

    r.participation_flags = ParticipationAnalyzer::participationFlags(r.participation, segments, transcript_id);

    r.all_flagged.reserve(r.profanity.size() + r.language_policy.size() + r.topic_adherence.off_topic_segments.size() +
                          r.participation_flags.size());
    r.all_flagged.insert(r.all_flagged.end(), r.profanity.begin(), r.profanity.end());
    r.all_flagged.insert(r.all_flagged.end(), r.language_policy.begin(), r.language_policy.end());
    r.all_flagged.insert(r.all_flagged.end(), r.topic_adherence.off_topic_segments.begin(),
                         r.topic_adherence.off_topic_segments.end());
    r.all_flagged.insert(r.all_flagged.end(), r.participation_flags.begin(), r.participation_flags.end());

    logDecisions(r, transcript_id, cfg.allowed_language);
    return r;
}

FlagSet ContentAnalyzer::flagsForSegment(const ContentAnalysisResult& analysis, std::size_t index)
{
    if (index >= analysis.segment_flags.size())
        return {};
    return analysis.segment_flags[index];
}

} // namespace processing
