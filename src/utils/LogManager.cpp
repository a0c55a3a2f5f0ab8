#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "corpus/Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

namespace
{

// The one appender a plog instance ever sees. plog cannot detach appenders,
// so files are swapped in and out here.
class RelayAppender final : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& target : targets_)
            target->write(record);
    }

    void add(std::unique_ptr<plog::IAppender> target)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.push_back(std::move(target));
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<plog::IAppender>> targets_;
};

// outlives the plog logger it is attached to, which is created after it
template <int InstanceId>
RelayAppender& relayFor()
{
    static RelayAppender relay;
    return relay;
}

} // namespace

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;

LogManager::Settings LogManager::ParseSettings(const toml::table& section)
{
    Settings settings;

    if (auto append = section["append_logs"].value<bool>())
    {
        settings.append_logs = *append;
    }

    if (auto level = section["level"].value<int64_t>())
    {
        int level_int = static_cast<int>(*level);
        if (level_int >= plog::none && level_int <= plog::verbose)
        {
            settings.level = static_cast<plog::Severity>(level_int);
        }
        else
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring out of range logging level",
                                         "logging.level = " + std::to_string(level_int));
        }
    }
    else if (auto name = section["level"].value<std::string>())
    {
        settings.level = plog::severityFromString(name->c_str());
    }

    if (auto directory = section["directory"].value<std::string>())
    {
        settings.directory = *directory;
    }

    return settings;
}

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_settings.append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto& relay = relayFor<InstanceId>();
        relay.clear();
        relay.add(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count));
        if (config.add_console_appender)
            relay.add(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr));

        plog::Severity level = config.level_override.value_or(s_settings.level);
        if (auto logger = plog::get<InstanceId>())
            logger->setMaxSeverity(level);
        else
            plog::init<InstanceId>(level, &relay);

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<corpus::Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<corpus::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);

    relayFor<0>().clear();
    relayFor<corpus::Diagnostics::kLogInstance>().clear();
    s_initialized = false;
}

std::string LogManager::LogPath(const std::string& filename)
{
    return (std::filesystem::path(s_settings.directory) / filename).string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   s_settings.directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
