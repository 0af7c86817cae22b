#pragma once

#include "../processing/ContentAnalyzer.hpp"
#include "../moderation/LlmFlagValidator.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

// Every recognized option with its default. Sections:
//   [moderation]                window_size, allowed_language, lexicon_path
//   [moderation.topic]          keywords, prompt, off_topic_indicators
//   [moderation.participation]  dominance_threshold, silence_threshold
//   [validator]                 enabled, base_url, model, api_key, connect_timeout_ms, timeout_ms
//   [diagnostics]               verbose, max_preview, redact_text
struct ModerationConfig
{
    static constexpr const char* kApiKeyEnv = "GROQ_API_KEY";

    std::size_t window_size = 8;
    std::string allowed_language = "en";
    std::optional<std::string> lexicon_path;
    processing::TopicConfig topic;
    processing::ParticipationConfig participation;
    moderation::ValidatorConfig validator;
    bool diagnostics_verbose = false;
    std::size_t diagnostics_max_preview = 160;
    bool diagnostics_redact_text = false;

    void applyDefaults();

    void loadModeration(const toml::table& section);
    void loadValidator(const toml::table& section);
    void loadDiagnostics(const toml::table& section);

    // Fills an empty validator.api_key from the environment
    void resolveApiKey();

    // Registers the three sections; load() on the manager then fills this struct
    void registerConfigHandlers(ConfigManager& config);

    processing::ContentAnalyzerConfig analyzerConfig() const;
    moderation::PolicyContext policyContext() const;
    void applyDiagnostics() const;
};

// Reads config_path into a ModerationConfig; missing or broken files yield the defaults
ModerationConfig loadModerationConfig(const std::string& config_path);
