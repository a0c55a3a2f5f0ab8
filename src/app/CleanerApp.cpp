#include "CleanerApp.hpp"

#include "config/ConfigManager.hpp"
#include "config/PipelineFactory.hpp"
#include "corpus/Diagnostics.hpp"
#include "corpus/Pipeline.hpp"
#include "utils/ErrorReporter.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <plog/Log.h>

namespace po = boost::program_options;

namespace app
{

namespace
{

po::options_description optionsDescription(CommandLine& cmd, int64_t& threads)
{
    po::options_description desc("paraclean options");
    // clang-format off
    desc.add_options()
        ("help,h", po::bool_switch(&cmd.help), "Show this help message")
        ("config,c", po::value(&cmd.config_path)->default_value(cmd.config_path), "TOML configuration file")
        ("src", po::value(&cmd.src), "Source side input, one sentence per line")
        ("tgt", po::value(&cmd.tgt), "Target side input, aligned with --src")
        ("out-src", po::value(&cmd.out_src), "Cleaned source output")
        ("out-tgt", po::value(&cmd.out_tgt), "Cleaned target output")
        ("tsv", po::value(&cmd.tsv), "Tab-joined \"src<TAB>tgt\" input instead of --src/--tgt")
        ("out-tsv", po::value(&cmd.out_tsv), "Tab-joined output for --tsv")
        ("threads,j", po::value(&threads), "Worker threads, overrides runner.threads")
        ("report", po::value(&cmd.report), "Write run statistics as JSON to this file")
        ("verbose,v", po::bool_switch(&cmd.verbose), "Trace every rejection in the diagnostics log");
    // clang-format on
    return desc;
}

} // namespace

CleanerApp::CleanerApp(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

CleanerApp::~CleanerApp() { utils::LogManager::Shutdown(); }

std::string CleanerApp::Usage()
{
    CommandLine cmd;
    int64_t threads = 0;
    std::ostringstream oss;
    oss << "Usage: paraclean --config FILE (--src F --tgt F --out-src F --out-tgt F | --tsv F --out-tsv F)\n"
        << "                 [--threads N] [--report stats.json] [--verbose]\n\n"
        << optionsDescription(cmd, threads);
    return oss.str();
}

CommandLine CleanerApp::ParseCommandLine(int argc, char** argv)
{
    CommandLine cmd;
    int64_t threads = 0;
    po::variables_map vm;

    try
    {
        auto desc = optionsDescription(cmd, threads);
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& ex)
    {
        throw std::invalid_argument(ex.what());
    }

    if (cmd.help)
        return cmd;

    if (vm.count("threads"))
    {
        if (threads < 1 || static_cast<uint64_t>(threads) > RunnerSettings::kMaxThreads)
            throw std::invalid_argument("--threads must be between 1 and " +
                                        std::to_string(RunnerSettings::kMaxThreads));
        cmd.threads = static_cast<std::size_t>(threads);
    }

    const bool parallel = !cmd.src.empty() || !cmd.tgt.empty() || !cmd.out_src.empty() || !cmd.out_tgt.empty();
    const bool tab_separated = !cmd.tsv.empty() || !cmd.out_tsv.empty();

    if (parallel && tab_separated)
        throw std::invalid_argument("--tsv/--out-tsv cannot be combined with --src/--tgt/--out-src/--out-tgt");
    if (tab_separated && (cmd.tsv.empty() || cmd.out_tsv.empty()))
        throw std::invalid_argument("--tsv requires --out-tsv");
    if (!tab_separated && (cmd.src.empty() || cmd.tgt.empty() || cmd.out_src.empty() || cmd.out_tgt.empty()))
        throw std::invalid_argument("--src, --tgt, --out-src and --out-tgt are all required");

    return cmd;
}

int CleanerApp::run()
{
    try
    {
        cmd_ = ParseCommandLine(argc_, argv_);
    }
    catch (const std::invalid_argument& ex)
    {
        std::cerr << "paraclean: " << ex.what() << "\n\n" << Usage();
        return kExitUsage;
    }

    if (cmd_.help)
    {
        std::cout << Usage();
        return kExitOk;
    }

    if (!loadConfig())
    {
        printPendingErrors();
        return kExitConfig;
    }

    if (!initializeLogging())
    {
        printPendingErrors();
        return kExitIo;
    }

    if (!buildPipeline())
    {
        printPendingErrors();
        return kExitConfig;
    }

    const int status = process();
    printPendingErrors();
    return status;
}

bool CleanerApp::loadConfig()
{
    config::ConfigManager config(cmd_.config_path);

    config.registerTable("logging", { .load = [this](const toml::table& section)
                                      { log_settings_ = utils::LogManager::ParseSettings(section); } },
                         { "level", "append_logs", "directory" });

    config.registerTable("diagnostics",
                         { .load = [this](const toml::table& section)
                           { diagnostics_ = corpus::Diagnostics::ParseSettings(section); } },
                         { "verbose", "max_preview" });

    config.registerTable("runner", { .load = [this](const toml::table& section)
                                     { runner_settings_ = RunnerSettings::Parse(section); } },
                         { "threads", "batch_size" });

    config.registerTable("pipeline", { .load = [this](const toml::table& section) { pipeline_section_ = section; } },
                         { "normalizers", "filters" });

    // ConfigManager has already reported the failure
    return config.load();
}

bool CleanerApp::initializeLogging()
{
    if (!utils::LogManager::Initialize(log_settings_))
        return false;

    const utils::LogManager::LoggerConfig main_log{ .name = "main",
                                                    .filepath = utils::LogManager::LogPath("paraclean.log"),
                                                    .append_override = std::nullopt,
                                                    .level_override = std::nullopt,
                                                    .max_file_size = 10 * 1024 * 1024,
                                                    .backup_count = 3,
                                                    .add_console_appender = true };
    const utils::LogManager::LoggerConfig diagnostics_log{ .name = "diagnostics",
                                                           .filepath = utils::LogManager::LogPath("diagnostics.log"),
                                                           .append_override = std::nullopt,
                                                           .level_override = plog::verbose,
                                                           .max_file_size = 10 * 1024 * 1024,
                                                           .backup_count = 3,
                                                           .add_console_appender = false };

    if (!utils::LogManager::RegisterLogger<0>(main_log) ||
        !utils::LogManager::RegisterLogger<corpus::Diagnostics::kLogInstance>(diagnostics_log))
        return false;

    if (cmd_.verbose)
        diagnostics_.verbose = true;
    corpus::Diagnostics::Apply(diagnostics_);

    if (cmd_.threads)
        runner_settings_.threads = *cmd_.threads;

    PLOG_INFO << "paraclean starting, config " << cmd_.config_path;
    return true;
}

bool CleanerApp::buildPipeline()
{
    try
    {
        config::PipelineFactory factory;
        pipeline_ = std::make_unique<corpus::Pipeline>(factory.build(pipeline_section_));
    }
    catch (const config::ConfigError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid pipeline configuration",
                                          ex.what());
        return false;
    }

    std::ostringstream stages;
    for (const auto& name : pipeline_->normalizerNames())
        stages << ' ' << name;
    stages << " |";
    for (const auto& name : pipeline_->filterNames())
        stages << ' ' << name;
    PLOG_INFO << "Pipeline:" << stages.str();
    return true;
}

int CleanerApp::process()
{
    CorpusRunner runner(*pipeline_, runner_settings_);
    RunStats stats;

    try
    {
        if (cmd_.tabSeparated())
            stats = runner.runTabSeparatedFile(cmd_.tsv, cmd_.out_tsv);
        else
            stats = runner.runParallelFiles(cmd_.src, cmd_.tgt, cmd_.out_src, cmd_.out_tgt);
    }
    catch (const IoError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Io, "Corpus I/O failed", ex.what());
        return kExitIo;
    }

    PLOG_INFO << "Done: read=" << stats.read << " kept=" << stats.kept << " modified=" << stats.modified
              << " rejected=" << stats.rejectedTotal() << " malformed=" << stats.malformed
              << " errors=" << stats.errors;
    for (const auto& [filter, count] : stats.rejected)
        PLOG_INFO << "  rejected by " << filter << ": " << count;

    if (!cmd_.report.empty() && !writeReport(stats))
        return kExitIo;
    return kExitOk;
}

bool CleanerApp::writeReport(const RunStats& stats) const
{
    std::ofstream out(cmd_.report, std::ios::trunc);
    if (out)
        out << stats.toJson().dump(2) << '\n';
    if (!out)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Io, "Cannot write statistics report", cmd_.report);
        return false;
    }
    PLOG_INFO << "Statistics written to " << cmd_.report;
    return true;
}

void CleanerApp::printPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.stopsRun())
            std::cerr << "paraclean: " << utils::ErrorReporter::Format(report) << '\n';
    }
}

} // namespace app
