#pragma once

#include "deskpilot/api/logger.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// plog instances: the run log and the engine's decision trail
inline constexpr int kRunLogInstance = 0;
inline constexpr int kFlowLogInstance = 1;

/// [logging] table of config.toml
struct LogSettings
{
    std::filesystem::path directory = "logs";
    bool append = true;
    plog::Severity level = plog::info;
    std::size_t max_file_size = 10 * 1024 * 1024;
    int backup_count = 3;
};

class LogManager
{
public:
    struct ChannelOptions
    {
        std::string file_name; // relative to LogSettings::directory
        std::optional<plog::Severity> level_override;
        bool console = false;
    };

    /// Reads [logging] (when the file exists) and creates the log directory.
    static bool Initialize(const std::string& config_path = "config.toml");

    template <int InstanceId>
    static bool OpenChannel(const ChannelOptions& options);

    /**
     * Builds the engine's Logger callbacks.
     *
     * Everything goes to the flow channel. info/warn/error also go to the run
     * log; debug only when @p verbose. @p on_error sees every error message.
     */
    static deskpilot::Logger MakeEngineLogger(bool verbose, std::function<void(const std::string&)> on_error = {});

    /// "none", "fatal", "error", "warning", "info", "debug", "verbose"
    static std::optional<plog::Severity> ParseLevel(std::string_view name);

    static const LogSettings& Settings() { return s_settings; }
    static std::filesystem::path PathFor(const std::string& file_name);

    static void Shutdown();

private:
    LogManager() = default;

    static void ReadSettings(const std::string& config_path);

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
