#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

class ConfigManager;
class AutomationSettings;
class AutomationService;

namespace deskpilot
{
class MemoryUiTree;
class SteadyClock;
} // namespace deskpilot

namespace platform
{
class EventFeed;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

    // Async-signal-safe variant of requestExit()
    static void requestExitFromSignal();

private:
    bool initialize();
    bool initializeLogging();
    bool parseCommandLineArgs();
    void printUsage() const;
    void setupManagers();
    void initializeConfig();
    bool startService();

    void mainLoop();
    void pollConfig();
    void drainPendingWork();
    void cleanup();

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<AutomationSettings> settings_;
    std::unique_ptr<deskpilot::SteadyClock> clock_;
    std::unique_ptr<deskpilot::MemoryUiTree> tree_;
    std::unique_ptr<AutomationService> service_;
    std::unique_ptr<platform::EventFeed> feed_;

    std::string config_path_ = "config.toml";
    std::string events_path_ = "-";
    int drain_ms_ = 3000;
    bool verbose_override_ = false;
    bool exit_after_args_ = false;

    unsigned applied_settings_generation_ = 0;
    std::chrono::steady_clock::time_point last_config_poll_{};
    bool cleaned_up_ = false;

    static std::atomic<bool> s_quit_requested;

    int argc_ = 0;
    char** argv_ = nullptr;
};
