#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace text_processing {

// Core data contracts shared by the detectors, the content analyzer and the validator client.
// Detectors only read these; none of them keeps a reference past the call.

// One unit of transcript as supplied by the caller. Times are in seconds.
struct Segment {
    std::string speaker;
    std::string text;
    double start_time = 0.0;
    double end_time = 0.0;
    std::optional<std::string> language;      // ISO code reported by the recognizer, if any
};

enum class FlagType {
    Profanity,
    LanguagePolicy,
    OffTopic,
    Participation
};

// Persistence-facing flag: flaggedWord, context, timestampMs, speaker, flagType.
struct FlagRecord {
    std::string transcript_id;
    std::string flagged_word;
    std::string context;
    std::int64_t timestamp_ms = 0;
    std::string speaker;
    FlagType flag_type = FlagType::Profanity;
};

bool operator==(const FlagRecord& a, const FlagRecord& b);
bool operator!=(const FlagRecord& a, const FlagRecord& b);

// Proposed (detector output) or reviewed (validator output) flags for one segment.
struct FlagSet {
    std::vector<FlagRecord> profanity;
    std::vector<FlagRecord> language_policy;
    std::vector<FlagRecord> off_topic;

    bool empty() const { return profanity.empty() && language_policy.empty() && off_topic.empty(); }
    std::size_t size() const { return profanity.size() + language_policy.size() + off_topic.size(); }
};

bool operator==(const FlagSet& a, const FlagSet& b);
bool operator!=(const FlagSet& a, const FlagSet& b);

// Raw substring under evaluation plus its position in the source text.
struct Candidate {
    std::string raw;
    std::string normalized;
    std::size_t offset = 0;
    std::size_t length = 0;
};

// A token or phrase that crossed its decision threshold.
// Invariant: score >= decision_threshold(source_text).
struct Match {
    std::string source_text;
    std::size_t offset = 0;                   // byte offset into the original text
    std::size_t length = 0;                   // byte length
    double score = 0.0;
    std::string lexicon_entry;
};

// Piece of a highlighted text. Concatenating all spans reproduces the input.
struct HighlightSpan {
    std::string text;
    bool is_profanity = false;
    std::optional<double> score;
};

enum class Severity {
    High,
    Medium
};

// Emitted by the live window detector when a phrase completes.
struct LiveDetection {
    std::string phrase;
    std::string match;
    double score = 0.0;
    Severity severity = Severity::Medium;
};

struct TopicAdherenceResult {
    double score = 1.0;                       // on-topic segments / total segments
    std::vector<FlagRecord> off_topic_segments;
    std::vector<std::size_t> off_topic_indices; // input position of each off_topic_segments entry
    std::vector<std::string> detected_keywords;
    std::vector<std::string> off_topic_indicators;
};

struct SpeakerParticipation {
    std::string speaker_id;
    double talk_time = 0.0;                   // seconds
    std::size_t segment_count = 0;
    double percentage = 0.0;                  // share of total talk time [0, 1]
};

struct ParticipationBalance {
    std::vector<SpeakerParticipation> speakers;   // sorted by percentage, descending
    bool is_balanced = true;
    std::optional<std::string> dominant_speaker;
    std::vector<std::string> silent_speakers;
    std::optional<std::string> imbalance_reason;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                               // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};    // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

const char* flagTypeToString(FlagType type);
std::optional<FlagType> flagTypeFromString(const std::string& value);
const char* severityToString(Severity severity);

} // namespace text_processing
