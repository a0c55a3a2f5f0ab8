#pragma once

#include <string>
#include <optional>
#include <plog/Severity.h>
#include <toml++/toml.h>

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // [logging] table of the configuration file
    struct Settings
    {
        bool append_logs = true;
        plog::Severity level = plog::info;
        std::string directory = "logs";
    };

    [[nodiscard]] static Settings ParseSettings(const toml::table& section);

    static bool Initialize(const Settings& settings = {});

    // Registering an instance again replaces its appenders
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Silences the loggers and closes their files; Initialize() may follow
    static void Shutdown();

    static std::string LogPath(const std::string& filename);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static Settings s_settings;
};

} // namespace utils
