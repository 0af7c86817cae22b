#include "ModerationConfig.hpp"
#include "ConfigManager.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <cstdlib>
#include <plog/Log.h>

namespace
{

std::vector<std::string> readStringArray(const toml::table& t, const char* key)
{
    std::vector<std::string> out;
    if (auto* arr = t[key].as_array())
    {
        for (const auto& item : *arr)
        {
            if (auto v = item.value<std::string>())
                out.push_back(*v);
        }
    }
    return out;
}

} // namespace

void ModerationConfig::applyDefaults()
{
    *this = ModerationConfig{};
}

void ModerationConfig::loadModeration(const toml::table& m)
{
    if (auto v = m["window_size"].value<int64_t>())
    {
        if (*v >= 1)
            window_size = static_cast<std::size_t>(*v);
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "moderation.window_size must be at least 1, keeping " +
                                                    std::to_string(window_size),
                                                "value: " + std::to_string(*v));
    }
    if (auto v = m["allowed_language"].value<std::string>())
    {
        if (!v->empty())
            allowed_language = *v;
    }
    if (auto v = m["lexicon_path"].value<std::string>())
        lexicon_path = v->empty() ? std::nullopt : std::optional<std::string>(*v);

    if (auto* t = m["topic"].as_table())
    {
        // Empty lists fall back to the built-in keyword sets inside the scorer
        topic.topic_keywords = readStringArray(*t, "keywords");
        topic.off_topic_indicators = readStringArray(*t, "off_topic_indicators");
        if (auto v = (*t)["prompt"].value<std::string>())
            topic.topic_prompt = v->empty() ? std::nullopt : std::optional<std::string>(*v);
    }

    if (auto* p = m["participation"].as_table())
    {
        if (auto v = (*p)["dominance_threshold"].value<double>())
            participation.dominance_threshold = *v;
        if (auto v = (*p)["silence_threshold"].value<double>())
            participation.silence_threshold = *v;
    }
}

void ModerationConfig::loadValidator(const toml::table& v_tbl)
{
    if (auto v = v_tbl["enabled"].value<bool>())
        validator.enabled = *v;
    if (auto v = v_tbl["base_url"].value<std::string>())
        validator.base_url = *v;
    if (auto v = v_tbl["model"].value<std::string>())
        validator.model = *v;
    if (auto v = v_tbl["api_key"].value<std::string>())
        validator.api_key = *v;
    if (auto v = v_tbl["connect_timeout_ms"].value<int>())
        validator.connect_timeout_ms = *v;
    if (auto v = v_tbl["timeout_ms"].value<int>())
        validator.timeout_ms = *v;
    resolveApiKey();
}

void ModerationConfig::loadDiagnostics(const toml::table& d)
{
    if (auto v = d["verbose"].value<bool>())
        diagnostics_verbose = *v;
    if (auto v = d["redact_text"].value<bool>())
        diagnostics_redact_text = *v;
    if (auto v = d["max_preview"].value<int64_t>())
    {
        if (*v > 0)
            diagnostics_max_preview = static_cast<std::size_t>(*v);
    }
}

void ModerationConfig::resolveApiKey()
{
    if (!validator.api_key.empty())
        return;
    if (const char* env = std::getenv(kApiKeyEnv))
        validator.api_key = env;
}

void ModerationConfig::registerConfigHandlers(ConfigManager& config)
{
    TableCallbacks moderation_cb;
    moderation_cb.load = [this](const toml::table& section) { loadModeration(section); };
    config.registerTable("moderation", std::move(moderation_cb),
                         { "window_size", "allowed_language", "lexicon_path", "topic", "participation" });

    TableCallbacks validator_cb;
    validator_cb.load = [this](const toml::table& section) { loadValidator(section); };
    config.registerTable("validator", std::move(validator_cb),
                         { "enabled", "base_url", "model", "api_key", "connect_timeout_ms", "timeout_ms" });

    TableCallbacks diagnostics_cb;
    diagnostics_cb.load = [this](const toml::table& section) { loadDiagnostics(section); };
    config.registerTable("diagnostics", std::move(diagnostics_cb), { "verbose", "max_preview", "redact_text" });
}

processing::ContentAnalyzerConfig ModerationConfig::analyzerConfig() const
{
    processing::ContentAnalyzerConfig cfg;
    cfg.allowed_language = allowed_language;
    cfg.topic = topic;
    cfg.participation = participation;
    return cfg;
}

moderation::PolicyContext ModerationConfig::policyContext() const
{
    moderation::PolicyContext ctx;
    ctx.allowed_language = allowed_language;
    ctx.topic_prompt = topic.topic_prompt;
    ctx.topic_keywords = topic.topic_keywords.empty() ? processing::TopicAdherenceScorer::defaultTopicKeywords()
                                                      : topic.topic_keywords;
    return ctx;
}

void ModerationConfig::applyDiagnostics() const
{
    processing::Diagnostics::SetVerbose(diagnostics_verbose);
    processing::Diagnostics::SetMaxPreview(diagnostics_max_preview);
    processing::Diagnostics::SetRedactText(diagnostics_redact_text);
}

ModerationConfig loadModerationConfig(const std::string& config_path)
{
    ModerationConfig cfg;
    ConfigManager manager(config_path);
    cfg.registerConfigHandlers(manager);
    if (!manager.load())
    {
        PLOG_WARNING << "Using default moderation settings: " << manager.lastError();
        cfg.applyDefaults();
    }
    cfg.resolveApiKey();
    return cfg;
}
