#pragma once

#include "TextProcessingTypes.hpp"

#include <string>
#include <vector>

namespace processing
{

struct ParticipationConfig
{
    double dominance_threshold = 0.5;   // share above which a speaker dominates
    double silence_threshold = 0.05;    // share below which a speaker counts as silent
};

class ParticipationAnalyzer
{
public:
    static constexpr std::size_t kContextChars = 150;
    static constexpr const char* kDominanceWord = "participation_dominance";
    static constexpr const char* kSilenceWord = "participation_silence";

    // Talk time (end - start) per speaker and its share of the total. Speakers come out sorted
    // by share, largest first; empty input is balanced.
    static text_processing::ParticipationBalance analyze(const std::vector<text_processing::Segment>& segments,
                                                         const ParticipationConfig& config = {});

    // One flag for the dominant speaker and one per silent speaker, anchored on that speaker's
    // first segment
    static std::vector<text_processing::FlagRecord> participationFlags(const text_processing::ParticipationBalance& balance,
                                                                       const std::vector<text_processing::Segment>& segments,
                                                                       const std::string& transcript_id);
};

} // namespace processing
