#include "Application.hpp"
#include "config/AutomationSettings.hpp"
#include "config/ConfigManager.hpp"
#include "platform/EventFeed.hpp"
#include "services/AutomationService.hpp"
#include "utils/CrashHandler.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include "deskpilot/api/deskpilot.hpp"
#include "deskpilot/tree/MemoryUiTree.hpp"
#include "deskpilot/util/Clock.hpp"
#include "deskpilot/util/Profile.hpp"

#include <plog/Log.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>

namespace
{

void HandleInterruptSignal(int) { Application::requestExitFromSignal(); }

void FlushErrorsOnCrash() { utils::ErrorReporter::FlushPendingToHistory(); }

bool parse_int(const char* text, int& out)
{
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0 || value > 600000)
        return false;
    out = static_cast<int>(value);
    return true;
}

} // namespace

std::atomic<bool> Application::s_quit_requested{ false };

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    PROFILE_SCOPE_FUNCTION();

    if (!parseCommandLineArgs())
        return false;
    if (exit_after_args_)
        return true;

    if (!initializeLogging())
        return false;

    setupManagers();
    initializeConfig();
    return startService();
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    if (!utils::LogManager::OpenChannel<utils::kRunLogInstance>({ .file_name = "run.log",
                                                                  .level_override = std::nullopt,
                                                                  .console = true }))
        return false;

    // The flow trail is always written at debug level; run.log follows [logging] level
    if (!utils::LogManager::OpenChannel<utils::kFlowLogInstance>({ .file_name = "flow.log",
                                                                   .level_override = plog::debug,
                                                                   .console = false }))
        return false;

    utils::ErrorReporter::InitializeLogFile(utils::LogManager::PathFor("errors.log").string());

    utils::CrashHandler::Initialize();
    utils::CrashHandler::RegisterFatalCleanup(&FlushErrorsOnCrash);
    return true;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        const bool has_value = i + 1 < argc_;

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage();
            exit_after_args_ = true;
            return true;
        }
        if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            verbose_override_ = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && has_value)
        {
            config_path_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--events") == 0 && has_value)
        {
            events_path_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--drain-ms") == 0 && has_value)
        {
            if (!parse_int(argv_[++i], drain_ms_))
            {
                std::cerr << "deskpilot: --drain-ms expects a number of milliseconds\n";
                return false;
            }
        }
        else
        {
            std::cerr << "deskpilot: unrecognized argument '" << arg << "'\n";
            printUsage();
            return false;
        }
    }
    return true;
}

void Application::printUsage() const
{
    std::cout << "Usage: deskpilot [--config FILE] [--events FILE|-] [--drain-ms N] [--verbose]\n"
                 "\n"
                 "Replays JSON-lines UI notifications (stdin by default) through the\n"
                 "connection and screen-share automation and logs what it does.\n"
                 "\n"
                 "  --config FILE   configuration file (default config.toml)\n"
                 "  --events FILE   notification stream, '-' for stdin\n"
                 "  --drain-ms N    time left for deferred work after the stream ends (default 3000)\n"
                 "  --verbose       log every gate decision\n";
}

void Application::setupManagers()
{
    PROFILE_SCOPE_FUNCTION();

    config_ = std::make_unique<ConfigManager>(config_path_);
    settings_ = std::make_unique<AutomationSettings>();
    clock_ = std::make_unique<deskpilot::SteadyClock>();
    tree_ = std::make_unique<deskpilot::MemoryUiTree>();
    service_ = std::make_unique<AutomationService>(*tree_, clock_.get());
    feed_ = std::make_unique<platform::EventFeed>(service_->engine(), *tree_, *clock_);
}

void Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    settings_->registerConfigHandler(*config_);

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }
    last_config_poll_ = std::chrono::steady_clock::now();
}

bool Application::startService()
{
    deskpilot::Config cfg = settings_->engineConfig();
    if (verbose_override_)
        cfg.verbose = true;

    if (!service_->initialize(cfg))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Automation engine failed to start",
                                          service_->getLastErrorMessage());
        return false;
    }
    applied_settings_generation_ = settings_->generation();

    // The host binds the service at startup; the stream may still interrupt and reconnect it
    service_->engine().on_connected();

    PLOG_INFO << "deskpilot ready: watching " << cfg.source_package << " and " << cfg.companion_package;
    return true;
}

int Application::run()
{
    PROFILE_THREAD_NAME("MainThread");

    if (!initialize())
        return 1;
    if (exit_after_args_)
        return 0;

    std::signal(SIGINT, HandleInterruptSignal);
    std::signal(SIGTERM, HandleInterruptSignal);

    mainLoop();
    drainPendingWork();
    cleanup();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    s_quit_requested.store(true, std::memory_order_release);
}

void Application::requestExitFromSignal() { s_quit_requested.store(true, std::memory_order_release); }

void Application::mainLoop()
{
    PROFILE_SCOPE_FUNCTION();

    std::ifstream file;
    std::istream* in = &std::cin;
    if (events_path_ != "-")
    {
        file.open(events_path_);
        if (!file.is_open())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::EventFeed, "Cannot open notification stream",
                                              events_path_);
            return;
        }
        in = &file;
    }

    PLOG_INFO << "Reading notifications from " << (in == &std::cin ? std::string("stdin") : events_path_);

    utils::CrashHandler::SetContext("processing notification stream");

    std::string line;
    std::size_t line_number = 0;
    while (!s_quit_requested.load(std::memory_order_acquire) && std::getline(*in, line))
    {
        ++line_number;
        (void)feed_->processLine(line, line_number); // failures are reported per line
        pollConfig();
    }

    utils::CrashHandler::SetContext(nullptr);

    const auto& c = feed_->counters();
    PLOG_INFO << "Notification stream finished: " << c.notifications << " notifications (" << c.scheduled
              << " scheduled), " << c.lifecycle << " lifecycle events, " << c.skipped << " skipped";
}

void Application::pollConfig()
{
    const auto now = std::chrono::steady_clock::now();
    if (now - last_config_poll_ < std::chrono::seconds(1))
        return;
    last_config_poll_ = now;

    if (!config_->reloadIfChanged() || settings_->generation() == applied_settings_generation_)
        return;

    deskpilot::Config cfg = settings_->engineConfig();
    if (verbose_override_)
        cfg.verbose = true;
    if (service_->reinitialize(cfg))
        applied_settings_generation_ = settings_->generation();
}

void Application::drainPendingWork()
{
    if (!service_ || drain_ms_ <= 0)
        return;

    // Deferred cycles are due at most settle + retry delays after the last notification
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(drain_ms_);
    while (!s_quit_requested.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

    service_->engine().wait_idle();
}

void Application::cleanup()
{
    if (cleaned_up_ || !service_)
        return;
    cleaned_up_ = true;

    for (const auto& msg : service_->notifications())
        PLOG_DEBUG << "Notification delivered: " << msg;

    service_->shutdown();
    utils::ErrorReporter::FlushPendingToHistory();
    if (const std::string summary = utils::ErrorReporter::SummaryLine(); !summary.empty())
        PLOG_INFO << "Problems reported this run: " << summary;

    if (config_ && !config_->save())
        PLOG_WARNING << "Configuration not saved: " << config_->lastError();
}
