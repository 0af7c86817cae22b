#pragma once

#include "AlertPublisher.hpp"
#include "../processing/LiveWindowDetector.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace moderation
{

struct SessionInfo
{
    std::string device_id;
    std::string transcript_id;
    std::string speaker;
};

// One live stream: feeds chunks to its own window detector and publishes an alert per detection.
// Like the detector it wraps, a session must not be shared between threads without external locking.
class LiveModerationSession
{
public:
    LiveModerationSession(std::shared_ptr<const processing::LexiconMatcher> matcher,
                          std::shared_ptr<IAlertSink> sink,
                          SessionInfo info,
                          std::size_t window_size = processing::LiveWindowDetector::kDefaultWindowSize);

    std::vector<text_processing::LiveDetection> ingest(std::string_view chunk, std::int64_t timestamp_ms);

    // Ends the stream; the window is cleared and the session can be reused
    void end();

    const SessionInfo& info() const { return info_; }
    std::size_t alertCount() const { return alert_count_; }

private:
    processing::LiveWindowDetector detector_;
    std::shared_ptr<IAlertSink> sink_;
    SessionInfo info_;
    std::size_t alert_count_ = 0;
};

} // namespace moderation
