#include "ParticipationAnalyzer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

using text_processing::FlagRecord;
using text_processing::FlagType;
using text_processing::ParticipationBalance;
using text_processing::Segment;
using text_processing::SpeakerParticipation;

namespace processing
{

namespace
{

const Segment* firstSegmentOf(const std::vector<Segment>& segments, const std::string& speaker)
{
    auto it = std::find_if(segments.begin(), segments.end(),
                           [&speaker](const Segment& s) { return s.speaker == speaker; });
    return it == segments.end() ? nullptr : &*it;
}

FlagRecord makeFlag(const Segment& segment, const std::string& transcript_id, const char* word)
{
    FlagRecord flag;
    flag.transcript_id = transcript_id;
    flag.flagged_word = word;
    flag.context = utf8Prefix(segment.text, ParticipationAnalyzer::kContextChars);
    flag.timestamp_ms = static_cast<std::int64_t>(std::floor(segment.start_time * 1000.0));
    flag.speaker = segment.speaker;
    flag.flag_type = FlagType::Participation;
    return flag;
}

} // namespace

ParticipationBalance ParticipationAnalyzer::analyze(const std::vector<Segment>& segments,
                                                    const ParticipationConfig& config)
{
    ParticipationBalance balance;
    if (segments.empty())
        return balance;

    // First-appearance order keeps ties stable after sorting
    std::vector<SpeakerParticipation> stats;
    for (const auto& segment : segments)
    {
        auto it = std::find_if(stats.begin(), stats.end(),
                               [&segment](const SpeakerParticipation& s) { return s.speaker_id == segment.speaker; });
        if (it == stats.end())
        {
            stats.push_back(SpeakerParticipation{ segment.speaker, 0.0, 0, 0.0 });
            it = std::prev(stats.end());
        }
        it->talk_time += segment.end_time - segment.start_time;
        it->segment_count += 1;
    }

    double total = 0.0;
    for (const auto& s : stats)
        total += s.talk_time;

    for (auto& s : stats)
    {
        s.percentage = total > 0.0 ? s.talk_time / total : 0.0;
        if (s.percentage > config.dominance_threshold)
            balance.dominant_speaker = s.speaker_id;
        if (s.percentage < config.silence_threshold && s.segment_count > 0)
            balance.silent_speakers.push_back(s.speaker_id);
    }

    std::stable_sort(stats.begin(), stats.end(),
                     [](const SpeakerParticipation& a, const SpeakerParticipation& b) { return a.percentage > b.percentage; });
    balance.speakers = std::move(stats);
    balance.is_balanced = !balance.dominant_speaker && balance.silent_speakers.empty();

    if (balance.dominant_speaker)
    {
        auto it = std::find_if(balance.speakers.begin(), balance.speakers.end(),
                               [&balance](const SpeakerParticipation& s) { return s.speaker_id == *balance.dominant_speaker; });
        std::ostringstream oss;
        oss << *balance.dominant_speaker << " dominates with " << (it->percentage * 100.0) << "% of talk time";
        balance.imbalance_reason = oss.str();
    }
    else if (!balance.silent_speakers.empty())
    {
        balance.imbalance_reason = std::to_string(balance.silent_speakers.size()) +
                                   " speaker(s) are silent or barely participating";
    }
    return balance;
}

std::vector<FlagRecord> ParticipationAnalyzer::participationFlags(const ParticipationBalance& balance,
                                                                  const std::vector<Segment>& segments,
                                                                  const std::string& transcript_id)
{
    std::vector<FlagRecord> flags;
    if (balance.is_balanced)
        return flags;

    if (balance.dominant_speaker)
    {
        if (const Segment* seg = firstSegmentOf(segments, *balance.dominant_speaker))
            flags.push_back(makeFlag(*seg, transcript_id, kDominanceWord));
    }
    for (const auto& speaker : balance.silent_speakers)
    {
        if (const Segment* seg = firstSegmentOf(segments, speaker))
            flags.push_back(makeFlag(*seg, transcript_id, kSilenceWord));
    }
    return flags;
}

} // namespace processing
