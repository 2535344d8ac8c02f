#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <array>
#include <fstream>
#include <utility>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadSettings(config_path);

    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create log directory",
                                     s_settings.directory.string() + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

std::filesystem::path LogManager::PathFor(const std::string& file_name) { return s_settings.directory / file_name; }

template <int InstanceId>
bool LogManager::OpenChannel(const ChannelOptions& options)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Log channel opened before LogManager::Initialize",
                                   options.file_name);
        return false;
    }

    const std::string path = PathFor(options.file_name).string();
    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), s_settings.max_file_size, s_settings.backup_count);
        plog::init<InstanceId>(options.level_override.value_or(s_settings.level), file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (options.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get<InstanceId>()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log channel " + path, ex.what());
        return false;
    }
}

template bool LogManager::OpenChannel<kRunLogInstance>(const ChannelOptions&);
template bool LogManager::OpenChannel<kFlowLogInstance>(const ChannelOptions&);

deskpilot::Logger LogManager::MakeEngineLogger(bool verbose, std::function<void(const std::string&)> on_error)
{
    deskpilot::Logger log;
    log.info = [](const std::string& m)
    {
        PLOG_INFO << m;
        PLOG_INFO_(kFlowLogInstance) << m;
    };
    log.debug = [verbose](const std::string& m)
    {
        PLOG_DEBUG_(kFlowLogInstance) << m;
        if (verbose)
            PLOG_DEBUG << m;
    };
    log.warn = [](const std::string& m)
    {
        PLOG_WARNING << m;
        PLOG_WARNING_(kFlowLogInstance) << m;
    };
    log.error = [on_error = std::move(on_error)](const std::string& m)
    {
        PLOG_ERROR << m;
        PLOG_ERROR_(kFlowLogInstance) << m;
        if (on_error)
            on_error(m);
    };
    return log;
}

std::optional<plog::Severity> LogManager::ParseLevel(std::string_view name)
{
    static constexpr std::array<std::pair<std::string_view, plog::Severity>, 7> kLevels{ {
        { "none", plog::none },
        { "fatal", plog::fatal },
        { "error", plog::error },
        { "warning", plog::warning },
        { "info", plog::info },
        { "debug", plog::debug },
        { "verbose", plog::verbose },
    } };

    for (const auto& [level_name, severity] : kLevels)
    {
        if (level_name == name)
            return severity;
    }
    return std::nullopt;
}

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

void LogManager::ReadSettings(const std::string& config_path)
{
    // Logging comes up before ConfigManager, so [logging] is read here directly
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    toml::table cfg;
    try
    {
        cfg = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& e)
    {
        // ConfigManager reports the broken file again once it loads it
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Log settings not read from " + config_path,
                                     std::string(e.description()));
        return;
    }

    const toml::table* logging = cfg["logging"].as_table();
    if (!logging)
        return;

    if (auto dir = (*logging)["directory"].value<std::string>(); dir && !dir->empty())
        s_settings.directory = *dir;
    if (auto append = (*logging)["append"].value<bool>())
        s_settings.append = *append;

    if (auto name = (*logging)["level"].value<std::string>())
    {
        if (auto level = ParseLevel(*name))
            s_settings.level = *level;
        else
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown log level, keeping 'info'", *name);
    }

    if (auto size_mb = (*logging)["max_file_size_mb"].value<int64_t>(); size_mb && *size_mb > 0 && *size_mb <= 1024)
        s_settings.max_file_size = static_cast<std::size_t>(*size_mb) * 1024 * 1024;
    if (auto backups = (*logging)["backup_count"].value<int64_t>(); backups && *backups >= 0 && *backups <= 100)
        s_settings.backup_count = static_cast<int>(*backups);
}

} // namespace utils
