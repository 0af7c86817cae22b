#pragma once

#include "../processing/TextProcessingTypes.hpp"
#include "../processing/LanguagePolicyDetector.hpp"

#include <nlohmann/json.hpp>

#include <string>

// JSON shapes of the data contracts (camelCase keys, as persisted and as exchanged with the
// flag validator). Declared in the types' namespace so nlohmann finds them by ADL.
namespace text_processing
{

void to_json(nlohmann::json& j, const FlagType& type);
void from_json(const nlohmann::json& j, FlagType& type);

void to_json(nlohmann::json& j, const FlagRecord& flag);
void from_json(const nlohmann::json& j, FlagRecord& flag);

// language is omitted when absent; startTime/endTime default to 0
void to_json(nlohmann::json& j, const Segment& segment);
void from_json(const nlohmann::json& j, Segment& segment);

// All three arrays are required; a missing or non-array member throws
void to_json(nlohmann::json& j, const FlagSet& flags);
void from_json(const nlohmann::json& j, FlagSet& flags);

void to_json(nlohmann::json& j, const Match& match);
void to_json(nlohmann::json& j, const HighlightSpan& span);
void to_json(nlohmann::json& j, const LiveDetection& detection);
void to_json(nlohmann::json& j, const TopicAdherenceResult& result);
void to_json(nlohmann::json& j, const SpeakerParticipation& speaker);
void to_json(nlohmann::json& j, const ParticipationBalance& balance);

} // namespace text_processing

namespace processing
{

void to_json(nlohmann::json& j, const LanguageSpan& span);

} // namespace processing

namespace moderation
{

// Serialized text for anything leaving the process. Invalid UTF-8 in transcript strings
// comes out as U+FFFD instead of throwing.
std::string toJsonText(const nlohmann::json& j, int indent = -1);

} // namespace moderation
