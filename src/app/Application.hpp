#pragma once

#include <memory>
#include <string>
#include <vector>

struct ModerationConfig;

namespace processing
{
class LexiconMatcher;
}

// Command-line front end:
//   speechguard [--config <path>] [--verbose] check <text...>
//   speechguard [--config <path>] [--verbose] live [--device <id>] [--transcript <id>] [--speaker <name>]
//   speechguard [--config <path>] [--verbose] analyze <segments.json> [transcriptId]
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class Command
    {
        None,
        Check,
        Live,
        Analyze,
        Help
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    void initializeConfig();
    bool initializeLexicon();

    int runCheck();
    int runLive();
    int runAnalyze();
    void printUsage() const;
    void reportPendingErrors() const;

    std::vector<std::string> args_;
    std::vector<std::string> positional_;
    std::string config_path_ = "config.toml";
    std::string device_id_ = "cli";
    std::string transcript_id_ = "live";
    std::string speaker_ = "Speaker 1";
    bool verbose_override_ = false;
    Command command_ = Command::None;

    std::unique_ptr<ModerationConfig> config_;
    std::shared_ptr<const processing::LexiconMatcher> matcher_;
};
