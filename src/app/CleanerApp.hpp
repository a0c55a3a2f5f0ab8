#pragma once

#include "CorpusRunner.hpp"
#include "corpus/Diagnostics.hpp"
#include "utils/LogManager.hpp"

#include <memory>
#include <optional>
#include <string>

#include <toml++/toml.h>

namespace corpus
{
class Pipeline;
}

namespace app
{

enum ExitCode : int
{
    kExitOk = 0,
    kExitUsage = 1,
    kExitConfig = 2,
    kExitIo = 3,
};

// Command line of the paraclean executable
struct CommandLine
{
    std::string config_path = "config.toml";
    std::string src;
    std::string tgt;
    std::string out_src;
    std::string out_tgt;
    std::string tsv;
    std::string out_tsv;
    std::string report;
    std::optional<std::size_t> threads;
    bool verbose = false;
    bool help = false;

    [[nodiscard]] bool tabSeparated() const { return !tsv.empty(); }
};

class CleanerApp
{
public:
    CleanerApp(int argc, char** argv);
    ~CleanerApp();

    int run();

    // throws std::invalid_argument with a usage message
    [[nodiscard]] static CommandLine ParseCommandLine(int argc, char** argv);
    [[nodiscard]] static std::string Usage();

private:
    bool loadConfig();
    bool initializeLogging();
    bool buildPipeline();
    int process();
    bool writeReport(const RunStats& stats) const;
    void printPendingErrors() const;

    int argc_ = 0;
    char** argv_ = nullptr;

    CommandLine cmd_;
    utils::LogManager::Settings log_settings_;
    RunnerSettings runner_settings_;
    corpus::Diagnostics::Settings diagnostics_;
    toml::table pipeline_section_;
    std::unique_ptr<corpus::Pipeline> pipeline_;
};

} // namespace app
