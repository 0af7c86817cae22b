#pragma once

#include "../processing/TextProcessingTypes.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace moderation
{

// Real-time broadcast record, one per live detection
struct AlertEvent
{
    std::string type = "alert";
    std::string device_id;
    std::string transcript_id;
    std::string flagged_word;
    std::int64_t timestamp_ms = 0;
    std::string speaker;
    std::string context;
    text_processing::FlagType flag_type = text_processing::FlagType::Profanity;
};

void to_json(nlohmann::json& j, const AlertEvent& event);

class IAlertSink
{
public:
    virtual ~IAlertSink() = default;
    virtual void publish(const AlertEvent& event) = 0;
};

class NullAlertSink : public IAlertSink
{
public:
    void publish(const AlertEvent&) override {}
};

// Writes one JSON document per line
class JsonLinesAlertSink : public IAlertSink
{
public:
    explicit JsonLinesAlertSink(std::ostream& out) : out_(out) {}
    void publish(const AlertEvent& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace moderation
