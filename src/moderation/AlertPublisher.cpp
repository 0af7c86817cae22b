#include "AlertPublisher.hpp"
#include "FlagJson.hpp"

namespace moderation
{

void to_json(nlohmann::json& j, const AlertEvent& event)
{
    j = nlohmann::json{
        { "type", event.type },
        { "deviceId", event.device_id },
        { "transcriptId", event.transcript_id },
        { "flaggedWord", event.flagged_word },
        { "timestampMs", event.timestamp_ms },
        { "speaker", event.speaker },
        { "context", event.context },
        { "flagType", event.flag_type },
    };
}

void JsonLinesAlertSink::publish(const AlertEvent& event)
{
    nlohmann::json j = event;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << toJsonText(j) << '\n';
    out_.flush();
}

} // namespace moderation
