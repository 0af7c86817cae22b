#pragma once

#include "IFlagValidator.hpp"
#include "../utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace moderation
{

struct ValidatorConfig
{
    bool enabled = false;
    std::string base_url = "https://api.groq.com/openai";
    std::string model = "llama-3.1-70b-versatile";
    std::string api_key;
    int connect_timeout_ms = 3000;
    int timeout_ms = 15000;
    double temperature = 0.2;
};

// What the reviewer is told about the session policy
struct PolicyContext
{
    std::string allowed_language = "en";
    std::optional<std::string> topic_prompt;
    std::vector<std::string> topic_keywords;
};

/**
 * @brief Flag reviewer backed by an OpenAI-compatible chat-completions endpoint.
 *
 * One synchronous request per validate() call, bounded by the configured timeouts. The
 * model is asked for a JSON object {profanity[], languagePolicy[], offTopic[]} of flags to
 * keep; anything else is treated as the validator being unavailable.
 */
class LlmFlagValidator : public IFlagValidator
{
public:
    LlmFlagValidator(ValidatorConfig cfg, PolicyContext policy, utils::PostJsonFn transport = utils::post_json);
    ~LlmFlagValidator() override;

    bool isReady() const override;

    std::optional<text_processing::FlagSet> validate(const std::string& transcript_id,
                                                     const text_processing::Segment& segment,
                                                     const text_processing::FlagSet& proposed) override;

    const char* lastError() const override { return last_error_.c_str(); }

    // Aborts an in-flight request
    void cancel() { running_.store(false); }

    std::string buildSystemPrompt() const;
    nlohmann::json buildRequestBody(const std::string& transcript_id, const text_processing::Segment& segment,
                                    const text_processing::FlagSet& proposed) const;

    // Reviewed flags from a chat-completions response body, or std::nullopt with error set
    static std::optional<text_processing::FlagSet> parseResponse(const std::string& body, std::string& error);

    // Appends /v1/chat/completions (or /chat/completions after a trailing /v1) unless present
    static std::string normalizeURL(const std::string& base_url);

    const ValidatorConfig& config() const { return cfg_; }

private:
    void fail(const std::string& message);

    ValidatorConfig cfg_;
    PolicyContext policy_;
    utils::PostJsonFn transport_;
    std::atomic<bool> running_{ true };
    std::string last_error_;
};

} // namespace moderation
