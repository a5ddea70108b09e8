#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <plog/Severity.h>

namespace greekeval::utils
{

class LogManager
{
public:
    // Process-wide defaults, usually read from the [logging] table of the settings file
    struct Settings
    {
        plog::Severity level = plog::info;
        std::string directory = "logs";
        std::string file = "logs/greekeval.log";
        bool append = true;
        bool console = false;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
    };

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

    static bool Initialize(const Settings& settings);

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Registers the default instance from the settings passed to Initialize
    static bool RegisterDefaultLogger();

    // Silences every registered logger and closes its files. Registering the
    // same instance again afterwards writes only to the new targets.
    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static void PrepareLogDirectory();

private:
    LogManager() = default;

    static bool s_initialized;
    static Settings s_settings;
    // Keyed by plog instance id
    static std::map<int, std::function<void()>> s_detachers;
};

} // namespace greekeval::utils
