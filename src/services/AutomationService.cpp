#include "AutomationService.hpp"

#include <plog/Log.h>

#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include "deskpilot/api/deskpilot.hpp"

#include <mutex>
#include <utility>

struct AutomationService::Impl
{
    explicit Impl(deskpilot::IUiTree& tree, deskpilot::IClock* clock)
        : engine(std::make_unique<deskpilot::Engine>(tree, clock))
    {
    }

    std::unique_ptr<deskpilot::Engine> engine;
    bool initialized = false;

    mutable std::mutex notify_mutex;
    std::vector<std::string> notifications;
    static constexpr std::size_t kMaxNotifications = 256;

    mutable std::mutex error_mutex;
    std::string last_error_message;

    void pushNotification(const std::string& msg)
    {
        PLOG_INFO << "[notify] " << msg;
        std::lock_guard<std::mutex> lock(notify_mutex);
        if (notifications.size() >= kMaxNotifications)
            notifications.erase(notifications.begin());
        notifications.push_back(msg);
    }

    void setLastErrorMessage(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error_message = msg;
    }
};

AutomationService::AutomationService(deskpilot::IUiTree& tree, deskpilot::IClock* clock)
    : pimpl_(std::make_unique<Impl>(tree, clock))
{
    pimpl_->engine->set_error_callback(
        [](const deskpilot::ErrorInfo& info)
        {
            const std::string message = info.component + ": " + info.message;
            switch (info.level)
            {
            case deskpilot::ErrorSeverityLevel::Info:
                utils::ErrorReporter::ReportInfo(utils::ErrorCategory::Automation, message, info.details);
                break;
            case deskpilot::ErrorSeverityLevel::Warning:
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Automation, message, info.details);
                break;
            case deskpilot::ErrorSeverityLevel::Error:
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Automation, message, info.details);
                break;
            }
        });
}

AutomationService::~AutomationService() { shutdown(); }

bool AutomationService::initialize(const deskpilot::Config& cfg)
{
    Impl* impl = pimpl_.get();
    auto log = utils::LogManager::MakeEngineLogger(cfg.verbose,
                                                   [impl](const std::string& m) { impl->setLastErrorMessage(m); });
    const bool ok = impl->engine->initialize(cfg, std::move(log),
                                             [impl](const std::string& msg) { impl->pushNotification(msg); });
    if (!ok)
    {
        PLOG_ERROR << "Automation engine rejected its configuration: " << impl->engine->last_error();
        return false;
    }
    impl->initialized = true;
    return true;
}

bool AutomationService::reinitialize(const deskpilot::Config& cfg)
{
    // Rejected before the running session is touched; the old settings stay in effect
    if (const std::string problem = deskpilot::Engine::validate(cfg); !problem.empty())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Reloaded automation settings rejected, keeping the current ones", problem);
        return false;
    }

    const bool was_connected = pimpl_->engine->service_enabled();
    if (was_connected)
        pimpl_->engine->on_interrupt();

    if (!initialize(cfg))
    {
        PLOG_ERROR << "Failed to re-initialize automation engine with new config";
        return false;
    }

    PLOG_INFO << "Automation configuration reloaded";
    if (was_connected)
        pimpl_->engine->on_connected();
    return true;
}

void AutomationService::shutdown()
{
    if (!pimpl_ || !pimpl_->initialized)
        return;
    if (pimpl_->engine->service_enabled())
        pimpl_->engine->on_destroy();
    pimpl_->engine->wait_idle();
}

deskpilot::Engine& AutomationService::engine() { return *pimpl_->engine; }

std::vector<std::string> AutomationService::notifications() const
{
    std::lock_guard<std::mutex> lock(pimpl_->notify_mutex);
    return pimpl_->notifications;
}

std::string AutomationService::getLastErrorMessage() const
{
    std::lock_guard<std::mutex> lock(pimpl_->error_mutex);
    return pimpl_->last_error_message;
}
