#pragma once

#include "FlowState.hpp"
#include "../action/ActionExecutor.hpp"
#include "../api/logger.hpp"
#include "../detection/DialogDetector.hpp"
#include "../locating/NodeLocator.hpp"
#include "../tree/NodeAccess.hpp"
#include "../util/Clock.hpp"
#include "../util/ErrorContext.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace deskpilot
{

enum class MonitoredApp
{
    Source,   // remote-desktop client
    Companion // system UI
};

const char* MonitoredAppName(MonitoredApp app);

enum class CycleOutcome
{
    NoSnapshot,     // no active window or a snapshot is still live
    Ignored,        // nothing to do for this app in the current step
    NotDetected,    // expected dialog not confirmed
    TargetNotFound, // dialog confirmed, element missing
    ActionFailed,   // element found, every click strategy failed
    Vetoed,         // confirm dialog showing the wrong share mode
    Advanced,       // step moved forward
    Completed,      // flow finished, back to Idle
    Fault           // platform fault caught at the cycle boundary
};

const char* CycleOutcomeName(CycleOutcome outcome);

struct CycleResult
{
    CycleOutcome outcome = CycleOutcome::Ignored;
    FlowStep step_before = FlowStep::Idle;
    FlowStep step_after = FlowStep::Idle;
    bool stuck_reset = false;
};

struct FlowTiming
{
    std::chrono::milliseconds stuck_timeout{ 30000 };
    std::chrono::milliseconds source_render_wait{ 300 };
    std::chrono::milliseconds companion_render_wait{ 500 };
    std::chrono::milliseconds retry_delay{ 500 };
    std::chrono::milliseconds chooser_retry_delay{ 800 };
    std::chrono::milliseconds confirm_retry_delay{ 1000 };
};

/// Request a follow-up cycle; `only_if_step` skips it when the flow has moved on meanwhile.
using RetryRequest =
    std::function<void(MonitoredApp app, std::chrono::milliseconds delay, std::optional<FlowStep> only_if_step)>;

using NotificationSink = std::function<void(const std::string&)>;

/**
 * @brief The cross-application state machine
 *
 * One RunCycle() call is one processing cycle: stuck check, snapshot, then the
 * handler for the current step. A step only advances after the detector
 * confirmed the expected dialog in the snapshot of this cycle. The caller must
 * hold the processing slot of the FlowState.
 */
class FlowController
{
public:
    struct Dependencies
    {
        FlowState& state;
        NodeAccess& access;
        const NodeLocator& locator;
        const DialogDetector& detector;
        ActionExecutor& executor;
        IClock& clock;
        const Logger& logger;
        ErrorContext& errors;
    };

    FlowController(Dependencies deps, FlowTiming timing, std::string entire_screen_fragment);

    void SetNotificationSink(NotificationSink sink) { notify_ = std::move(sink); }
    void SetRetryRequest(RetryRequest retry) { retry_ = std::move(retry); }

    CycleResult RunCycle(MonitoredApp app);

private:
    CycleOutcome Dispatch(MonitoredApp app, const Snapshot& snapshot);

    CycleOutcome HandleIncomingConnection(const Snapshot& snapshot);
    CycleOutcome HandleShareDialog(const Snapshot& snapshot);
    CycleOutcome HandleChooser(const Snapshot& snapshot);
    CycleOutcome HandleShareConfirm(const Snapshot& snapshot);

    /// Locate `role` and click it, escalating when the role allows it.
    CycleOutcome Activate(const Snapshot& snapshot, TargetRole role);

    bool SelectorReadsEntireScreen(const UiNode& selector) const;
    /// Reset to Idle after `stuck_timeout` without progress. @return true if a step was abandoned
    bool CheckStuck();

    void Advance(FlowStep to);
    void ScheduleRetry(std::chrono::milliseconds delay, std::optional<FlowStep> only_if_step = std::nullopt);
    void Notify(const std::string& message);

    void LogInfo(const std::string& msg) const;
    void LogDebug(const std::string& msg) const;
    void LogWarn(const std::string& msg) const;
    void LogError(const std::string& msg) const;

    Dependencies deps_;
    FlowTiming timing_;
    std::string entire_screen_fragment_;
    NotificationSink notify_;
    RetryRequest retry_;
};

} // namespace deskpilot
