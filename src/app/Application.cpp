#include "Application.hpp"
#include "config/ModerationConfig.hpp"
#include "moderation/AlertPublisher.hpp"
#include "moderation/FlagJson.hpp"
#include "moderation/LiveModerationSession.hpp"
#include "moderation/LlmFlagValidator.hpp"
#include "moderation/ModerationOrchestrator.hpp"
#include "processing/BatchDetector.hpp"
#include "processing/ContentAnalyzer.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/Lexicon.hpp"
#include "processing/LexiconMatcher.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using nlohmann::json;

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::string joinArgs(const std::vector<std::string>& args, std::size_t from)
{
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i)
    {
        if (!out.empty())
            out += ' ';
        out += args[i];
    }
    return out;
}

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return kExitUsage;
    }
    if (command_ == Command::Help)
    {
        printUsage();
        return kExitOk;
    }

    if (!initializeLogging())
        return kExitFailure;

    initializeConfig();
    if (!initializeLexicon())
        return kExitFailure;

    int rc = kExitFailure;
    switch (command_)
    {
    case Command::Check:
        rc = runCheck();
        break;
    case Command::Live:
        rc = runLive();
        break;
    case Command::Analyze:
        rc = runAnalyze();
        break;
    default:
        printUsage();
        rc = kExitUsage;
        break;
    }

    reportPendingErrors();
    return rc;
}

bool Application::parseCommandLineArgs()
{
    for (std::size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        auto takeValue = [&](std::string& out) -> bool
        {
            if (i + 1 >= args_.size())
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = args_[++i];
            return true;
        };

        if (arg == "--config")
        {
            if (!takeValue(config_path_))
                return false;
        }
        else if (arg == "--device")
        {
            if (!takeValue(device_id_))
                return false;
        }
        else if (arg == "--transcript")
        {
            if (!takeValue(transcript_id_))
                return false;
        }
        else if (arg == "--speaker")
        {
            if (!takeValue(speaker_))
                return false;
        }
        else if (arg == "--verbose")
        {
            verbose_override_ = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            command_ = Command::Help;
            return true;
        }
        else if (command_ == Command::None)
        {
            if (arg == "check")
                command_ = Command::Check;
            else if (arg == "live")
                command_ = Command::Live;
            else if (arg == "analyze")
                command_ = Command::Analyze;
            else
            {
                std::cerr << "Unknown command: " << arg << "\n";
                return false;
            }
        }
        else
        {
            positional_.push_back(arg);
        }
    }

    switch (command_)
    {
    case Command::Check:
        return !positional_.empty();
    case Command::Analyze:
        return !positional_.empty() && positional_.size() <= 2;
    case Command::Live:
        return positional_.empty();
    default:
        return false;
    }
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = "logs/speechguard.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = false });

    utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>({ .name = "diagnostics",
                                                                              .filepath = "logs/detection.log",
                                                                              .append_override = std::nullopt,
                                                                              .level_override = std::nullopt,
                                                                              .max_file_size = 10 * 1024 * 1024,
                                                                              .backup_count = 3,
                                                                              .add_console_appender = false });
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ModerationConfig>(loadModerationConfig(config_path_));
    if (verbose_override_)
        config_->diagnostics_verbose = true;
    config_->applyDiagnostics();

    PLOG_INFO << "Config: window_size=" << config_->window_size << " allowed_language=" << config_->allowed_language
              << " validator=" << (config_->validator.enabled ? "on" : "off");
}

bool Application::initializeLexicon()
{
    try
    {
        auto lexicon = processing::Lexicon::loadOrBuiltin(config_->lexicon_path);
        matcher_ = std::make_shared<const processing::LexiconMatcher>(lexicon);
        PLOG_INFO << "Lexicon ready: " << lexicon->size() << " terms";
        return true;
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Lexicon, "Failed to prepare the lexicon", ex.what());
        std::cerr << "Failed to prepare the lexicon: " << ex.what() << "\n";
        return false;
    }
}

int Application::runCheck()
{
    const std::string text = joinArgs(positional_, 0);
    processing::BatchDetector detector(matcher_);

    auto matches = detector.detect(text);
    json out = {
        { "text", text },
        { "hasProfanity", !matches.empty() },
        { "matches", matches },
        { "highlight", detector.highlight(text) },
    };
    std::cout << moderation::toJsonText(out, 2) << std::endl;
    return kExitOk;
}

int Application::runLive()
{
    auto sink = std::make_shared<moderation::JsonLinesAlertSink>(std::cout);
    moderation::LiveModerationSession session(matcher_, sink, { device_id_, transcript_id_, speaker_ },
                                              config_->window_size);

    const auto started = std::chrono::steady_clock::now();
    std::string line;
    while (std::getline(std::cin, line))
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        // getline drops the newline; it still separates the last word from the next line
        line.push_back('\n');
        session.ingest(line, static_cast<std::int64_t>(elapsed.count()));
    }
    session.end();
    return kExitOk;
}

int Application::runAnalyze()
{
    const std::string& path = positional_[0];
    const std::string transcript_id = positional_.size() > 1 ? positional_[1] : std::string("transcript");

    std::ifstream file(path);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Cannot open segments file", path);
        std::cerr << "Cannot open " << path << "\n";
        return kExitFailure;
    }

    std::vector<text_processing::Segment> segments;
    try
    {
        json doc = json::parse(file);
        const json& list = doc.is_object() ? doc.at("segments") : doc;
        segments = list.get<std::vector<text_processing::Segment>>();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Segments file is not valid",
                                          path + ": " + ex.what());
        std::cerr << "Invalid segments file " << path << ": " << ex.what() << "\n";
        return kExitFailure;
    }

    auto analyzer = std::make_shared<const processing::ContentAnalyzer>(matcher_, config_->analyzerConfig());
    std::shared_ptr<moderation::IFlagValidator> validator;
    if (config_->validator.enabled)
        validator = std::make_shared<moderation::LlmFlagValidator>(config_->validator, config_->policyContext());

    moderation::ModerationOrchestrator orchestrator(analyzer, validator);
    if (config_->validator.enabled && !orchestrator.hasValidator())
        PLOG_WARNING << "Validator enabled but not ready (missing API key?); proposed flags are kept as-is";

    auto moderated = orchestrator.moderateTranscript(transcript_id, segments);
    const auto& analysis = moderated.analysis;

    json out = {
        { "transcriptId", transcript_id },
        { "profanity", analysis.profanity },
        { "languagePolicy", analysis.language_policy },
        { "participation", analysis.participation },
        { "topicAdherence", analysis.topic_adherence },
        { "participationFlags", analysis.participation_flags },
        { "allFlagged", analysis.all_flagged },
        { "reviewed", moderated.reviewed },
    };
    std::cout << moderation::toJsonText(out, 2) << std::endl;
    return kExitOk;
}

void Application::printUsage() const
{
    std::cerr << "Usage:\n"
              << "  speechguard [--config <path>] [--verbose] check <text...>\n"
              << "  speechguard [--config <path>] [--verbose] live [--device <id>] [--transcript <id>] [--speaker <name>]\n"
              << "  speechguard [--config <path>] [--verbose] analyze <segments.json> [transcriptId]\n";
}

void Application::reportPendingErrors() const
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] "
                  << utils::ErrorReporter::CategoryToString(report.category) << ": " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
}
