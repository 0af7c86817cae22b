#include "LlmFlagValidator.hpp"
#include "FlagJson.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <sstream>

using nlohmann::json;
using text_processing::FlagSet;
using text_processing::Segment;

namespace moderation
{

LlmFlagValidator::LlmFlagValidator(ValidatorConfig cfg, PolicyContext policy, utils::PostJsonFn transport)
    : cfg_(std::move(cfg))
    , policy_(std::move(policy))
    , transport_(std::move(transport))
{
}

LlmFlagValidator::~LlmFlagValidator() = default;

bool LlmFlagValidator::isReady() const
{
    return cfg_.enabled && !cfg_.api_key.empty() && !cfg_.base_url.empty() && !cfg_.model.empty() &&
           static_cast<bool>(transport_);
}

std::string LlmFlagValidator::buildSystemPrompt() const
{
    std::string topic_line;
    if (policy_.topic_prompt && !policy_.topic_prompt->empty())
    {
        topic_line = "Primary topic/prompt: \"" + *policy_.topic_prompt + "\".";
    }
    else if (!policy_.topic_keywords.empty())
    {
        std::ostringstream oss;
        for (std::size_t i = 0; i < policy_.topic_keywords.size(); ++i)
            oss << (i ? ", " : "") << policy_.topic_keywords[i];
        topic_line = "Primary topic keywords: " + oss.str() + ".";
    }
    else
    {
        topic_line = "No explicit topic provided.";
    }

    const std::string allowed = policy_.allowed_language.empty() ? std::string("en") : policy_.allowed_language;

    std::ostringstream prompt;
    prompt << "You review automatic content moderation flags raised on live group discussion transcripts. "
           << topic_line << " "
           << "Allowed language code: " << allowed << ". "
           << "For the given segment, decide which of the proposed flags (profanity, language policy, off_topic) are correct. "
           << "Rules: "
           << "- Profanity: keep only explicit offensive words or slurs; ignore markup such as <end>. "
           << "- Language policy: keep only if the spoken language is clearly not the allowed language; loanwords are fine. "
           << "- Off-topic: keep only if the utterance clearly leaves the topic; greetings and transitions are on topic. "
           << "Never add flags that were not proposed. "
           << "Reply with a JSON object with the arrays profanity, languagePolicy and offTopic holding the flags to keep. "
           << "Each item must include transcriptId, flaggedWord, context, timestampMs, speaker and flagType, "
           << "copied unchanged from the proposed flag.";
    return prompt.str();
}

json LlmFlagValidator::buildRequestBody(const std::string& transcript_id, const Segment& segment,
                                        const FlagSet& proposed) const
{
    json payload = {
        { "transcriptId", transcript_id },
        { "segment", segment },
        { "proposedFlags", proposed },
    };

    json body;
    body["model"] = cfg_.model;
    body["temperature"] = cfg_.temperature;
    body["response_format"] = { { "type", "json_object" } };
    body["messages"] = json::array({
        { { "role", "system" }, { "content", buildSystemPrompt() } },
        { { "role", "user" }, { "content", toJsonText(payload) } },
    });
    return body;
}

std::optional<FlagSet> LlmFlagValidator::parseResponse(const std::string& body, std::string& error)
{
    try
    {
        auto doc = json::parse(body);
        if (!doc.contains("choices") || !doc["choices"].is_array() || doc["choices"].empty())
        {
            error = "missing choices in response";
            return std::nullopt;
        }

        const auto& choice = doc["choices"].at(0);
        if (!choice.contains("message") || !choice["message"].contains("content") ||
            !choice["message"]["content"].is_string())
        {
            error = "missing message content";
            return std::nullopt;
        }

        auto content = json::parse(choice["message"]["content"].get<std::string>());
        return content.get<FlagSet>();
    }
    catch (const std::exception& ex)
    {
        error = std::string("parse error: ") + ex.what();
        return std::nullopt;
    }
}

std::optional<FlagSet> LlmFlagValidator::validate(const std::string& transcript_id, const Segment& segment,
                                                  const FlagSet& proposed)
{
    last_error_.clear();
    if (!isReady())
    {
        last_error_ = "validator not configured";
        return std::nullopt;
    }
    if (!running_.load())
    {
        last_error_ = "validator cancelled";
        return std::nullopt;
    }

    std::vector<utils::Header> headers{
        { "Content-Type", "application/json" },
        { "Authorization", std::string("Bearer ") + cfg_.api_key },
    };
    utils::SessionConfig session;
    session.connect_timeout_ms = cfg_.connect_timeout_ms;
    session.timeout_ms = cfg_.timeout_ms;
    session.cancel_flag = &running_;

    const std::string url = normalizeURL(cfg_.base_url);
    const std::string body = toJsonText(buildRequestBody(transcript_id, segment, proposed));

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "[Validator] POST " << url << " transcript=" << transcript_id << " proposed=" << proposed.size()
            << " segment=" << processing::Diagnostics::Preview(segment.text);
    }

    const utils::HttpResponse resp = transport_(url, body, headers, session);
    if (!resp.error.empty())
    {
        fail("transport error: " + resp.error);
        return std::nullopt;
    }
    if (!resp.ok())
    {
        fail("HTTP " + std::to_string(resp.status_code) + ": " + processing::Diagnostics::Preview(resp.text));
        return std::nullopt;
    }

    std::string error;
    auto reviewed = parseResponse(resp.text, error);
    if (!reviewed)
    {
        fail(error);
        return std::nullopt;
    }
    return reviewed;
}

void LlmFlagValidator::fail(const std::string& message)
{
    last_error_ = message;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Validation,
                                        "Flag validator unavailable, keeping proposed flags", message);
}

std::string LlmFlagValidator::normalizeURL(const std::string& base_url)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    if (url.find("/chat/completions") != std::string::npos)
        return url;

    const std::string v1 = "/v1";
    if (url.size() >= v1.size() && url.compare(url.size() - v1.size(), v1.size(), v1) == 0)
        return url + "/chat/completions";

    return url + "/v1/chat/completions";
}

} // namespace moderation
