#pragma once

#include "ChangeEvent.hpp"
#include "DeferredTaskScheduler.hpp"
#include "../flow/FlowController.hpp"
#include "../util/Clock.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deskpilot
{

enum class GateDecision
{
    ServiceDisabled, // no session is running
    DroppedForeign,  // not one of the monitored applications
    IgnoredKind,     // accepted by the filter but not a trigger
    RateLimited,     // too soon after the last accepted trigger
    Scheduled        // processing scheduled after the settle delay
};

const char* GateDecisionName(GateDecision decision);

struct GateSettings
{
    std::string source_package;
    std::string companion_package;
    std::vector<EventKind> trigger_kinds{ EventKind::WindowStateChanged };
    std::chrono::milliseconds min_process_interval{ 800 };
    std::chrono::milliseconds settle_delay{ 400 };
};

/**
 * @brief Front door for change notifications
 *
 * Filters by application and kind, rate-limits triggers and schedules the
 * processing cycle under TaskPurpose::SettleDelay. Never blocks: all it does
 * is put a task on the scheduler, replacing any pending one.
 */
class EventGate
{
public:
    using CycleLauncher = std::function<void(MonitoredApp app)>;

    EventGate(GateSettings settings, DeferredTaskScheduler& scheduler, IClock& clock, CycleLauncher launch);

    GateDecision OnChange(const ChangeEvent& event);

    std::optional<MonitoredApp> Classify(const std::string& source) const;

    /// Forget the rate-limit window (lifecycle reset).
    void Reset();

private:
    bool IsTrigger(EventKind kind) const;

    GateSettings settings_;
    DeferredTaskScheduler& scheduler_;
    IClock& clock_;
    CycleLauncher launch_;

    std::mutex mutex_;
    std::optional<TimePoint> last_trigger_;
};

} // namespace deskpilot
