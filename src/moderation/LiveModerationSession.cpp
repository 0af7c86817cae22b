#include "LiveModerationSession.hpp"
#include "../processing/Diagnostics.hpp"

#include <plog/Log.h>

namespace moderation
{

LiveModerationSession::LiveModerationSession(std::shared_ptr<const processing::LexiconMatcher> matcher,
                                             std::shared_ptr<IAlertSink> sink,
                                             SessionInfo info,
                                             std::size_t window_size)
    : detector_(std::move(matcher), window_size)
    , sink_(sink ? std::move(sink) : std::make_shared<NullAlertSink>())
    , info_(std::move(info))
{
}

std::vector<text_processing::LiveDetection> LiveModerationSession::ingest(std::string_view chunk,
                                                                         std::int64_t timestamp_ms)
{
    auto detections = detector_.ingest(chunk);
    for (const auto& d : detections)
    {
        AlertEvent event;
        event.device_id = info_.device_id;
        event.transcript_id = info_.transcript_id;
        event.flagged_word = d.phrase;
        event.timestamp_ms = timestamp_ms;
        event.speaker = info_.speaker;
        event.context = d.match;
        event.flag_type = text_processing::FlagType::Profanity;
        sink_->publish(event);
        ++alert_count_;
    }
    return detections;
}

void LiveModerationSession::end()
{
    PLOG_INFO_(processing::Diagnostics::kLogInstance) << "[LiveSession] transcript=" << info_.transcript_id
                                                      << " ended after " << alert_count_ << " alert(s)";
    detector_.reset();
    alert_count_ = 0;
}

} // namespace moderation
