#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace greekeval::utils
{

namespace
{

// plog loggers live for the whole process and can only gain appenders, so each
// instance gets one permanent appender whose targets are swapped on registration.
class InstanceAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& target : targets_)
        {
            target->write(record);
        }
    }

    void setTargets(std::vector<std::unique_ptr<plog::IAppender>> targets)
    {
        std::vector<std::unique_ptr<plog::IAppender>> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous.swap(targets_);
            targets_ = std::move(targets);
        }
        // Old file appenders close their files here
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<plog::IAppender>> targets_;
};

template <int InstanceId>
InstanceAppender& instanceAppender()
{
    static InstanceAppender appender;
    return appender;
}

} // namespace

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::map<int, std::function<void()>> LogManager::s_detachers;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    if (settings.file.empty())
    {
        ErrorReporter::ReportError(ErrorCategory::Logging, "Log file path is empty");
        return false;
    }

    s_settings = settings;
    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Logging,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_settings.append);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        std::vector<std::unique_ptr<plog::IAppender>> targets;
        targets.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count));
        if (config.add_console_appender)
        {
            targets.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
        }

        plog::Severity level = config.level_override.value_or(s_settings.level);

        InstanceAppender& appender = instanceAppender<InstanceId>();
        appender.setTargets(std::move(targets));

        if (auto logger = plog::get<InstanceId>())
        {
            // Registered before; the instance appender is already attached
            logger->setMaxSeverity(level);
        }
        else
        {
            plog::init<InstanceId>(level, &appender);
        }

        s_detachers[InstanceId] = []() {
            if (auto logger = plog::get<InstanceId>())
            {
                logger->setMaxSeverity(plog::none);
            }
            instanceAppender<InstanceId>().setTargets({});
        };
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Logging, "Failed to register logger: " + config.name, ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

bool LogManager::RegisterDefaultLogger()
{
    LoggerConfig config;
    config.name = "greekeval";
    config.filepath = s_settings.file;
    config.max_file_size = s_settings.max_file_size;
    config.backup_count = s_settings.backup_count;
    config.add_console_appender = s_settings.console;
    return RegisterLogger<0>(config);
}

void LogManager::Shutdown()
{
    for (const auto& [id, detach] : s_detachers)
    {
        detach();
    }
    s_detachers.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_settings.append; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_settings.level; }

void LogManager::PrepareLogDirectory()
{
    if (s_settings.directory.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Logging, "Unable to prepare log directory", ec.message());
    }
}

} // namespace greekeval::utils
