#include "FlowController.hpp"
#include "../util/Profile.hpp"
#include "../util/TextMatch.hpp"

#include <utility>

namespace deskpilot
{

const char* MonitoredAppName(MonitoredApp app)
{
    switch (app)
    {
    case MonitoredApp::Source:
        return "source";
    case MonitoredApp::Companion:
        return "companion";
    }
    return "unknown";
}

const char* CycleOutcomeName(CycleOutcome outcome)
{
    switch (outcome)
    {
    case CycleOutcome::NoSnapshot:
        return "no-snapshot";
    case CycleOutcome::Ignored:
        return "ignored";
    case CycleOutcome::NotDetected:
        return "not-detected";
    case CycleOutcome::TargetNotFound:
        return "target-not-found";
    case CycleOutcome::ActionFailed:
        return "action-failed";
    case CycleOutcome::Vetoed:
        return "vetoed";
    case CycleOutcome::Advanced:
        return "advanced";
    case CycleOutcome::Completed:
        return "completed";
    case CycleOutcome::Fault:
        return "fault";
    }
    return "unknown";
}

FlowController::FlowController(Dependencies deps, FlowTiming timing, std::string entire_screen_fragment)
    : deps_(deps)
    , timing_(timing)
    , entire_screen_fragment_(std::move(entire_screen_fragment))
{
}

CycleResult FlowController::RunCycle(MonitoredApp app)
{
    PROFILE_SCOPE_FUNCTION();

    CycleResult result;
    result.step_before = deps_.state.Step();

    try
    {
        result.stuck_reset = CheckStuck();

        const FlowStep step = deps_.state.Step();
        const bool relevant = app == MonitoredApp::Source ? step == FlowStep::Idle : step != FlowStep::Idle;
        if (!relevant)
        {
            LogDebug(std::string("Ignoring ") + MonitoredAppName(app) + " window in step " + FlowStepName(step));
            result.outcome = CycleOutcome::Ignored;
        }
        else
        {
            // Let the window finish rendering before reading it
            deps_.clock.SleepFor(app == MonitoredApp::Source ? timing_.source_render_wait :
                                                               timing_.companion_render_wait);

            auto snapshot = deps_.access.AcquireSnapshot();
            if (!snapshot)
            {
                LogDebug("No snapshot available, cycle aborted");
                result.outcome = CycleOutcome::NoSnapshot;
            }
            else
            {
                result.outcome = Dispatch(app, *snapshot);
            }
        }
    }
    catch (const std::exception& e)
    {
        LogError(std::string("Processing cycle aborted: ") + e.what());
        deps_.errors.ReportError("FlowController", "Processing cycle aborted", e.what());
        result.outcome = CycleOutcome::Fault;
    }

    result.step_after = deps_.state.Step();
    LogDebug(std::string("Cycle ") + MonitoredAppName(app) + ": " + CycleOutcomeName(result.outcome) + " (" +
             FlowStepName(result.step_before) + " -> " + FlowStepName(result.step_after) + ")");
    return result;
}

bool FlowController::CheckStuck()
{
    const TimePoint now = deps_.clock.Now();
    if (now - deps_.state.LastActivity() <= timing_.stuck_timeout)
        return false;

    const FlowStep from = deps_.state.Step();
    deps_.state.Reset(now);
    if (from != FlowStep::Idle)
        LogInfo(std::string("Recovery: no progress in ") + FlowStepName(from) + " for " +
                std::to_string(timing_.stuck_timeout.count() / 1000) + "s, back to Idle");
    return from != FlowStep::Idle;
}

CycleOutcome FlowController::Dispatch(MonitoredApp app, const Snapshot& snapshot)
{
    if (app == MonitoredApp::Source)
        return HandleIncomingConnection(snapshot);

    switch (deps_.state.Step())
    {
    case FlowStep::AwaitingShareDialog:
        return HandleShareDialog(snapshot);
    case FlowStep::AwaitingChooser:
        return HandleChooser(snapshot);
    case FlowStep::AwaitingShareConfirm:
        return HandleShareConfirm(snapshot);
    case FlowStep::Idle:
        break;
    }
    return CycleOutcome::Ignored;
}

CycleOutcome FlowController::HandleIncomingConnection(const Snapshot& snapshot)
{
    const EvidenceReport report = deps_.detector.Classify(snapshot, DialogShape::IncomingConnection);
    if (!report.Confirmed())
        return CycleOutcome::NotDetected;

    deps_.state.CountDialogDetected();
    LogInfo("Incoming connection dialog detected (" + report.Summary() + ")");

    const CycleOutcome outcome = Activate(snapshot, TargetRole::AcceptButton);
    if (outcome != CycleOutcome::Advanced)
        return outcome;

    deps_.state.CountAutoAccept();
    Advance(FlowStep::AwaitingShareDialog);
    Notify("Connection accepted");
    return CycleOutcome::Advanced;
}

CycleOutcome FlowController::HandleShareDialog(const Snapshot& snapshot)
{
    const EvidenceReport report = deps_.detector.Classify(snapshot, DialogShape::ShareDialog);
    if (report.Confirmed())
    {
        const CycleOutcome outcome = Activate(snapshot, TargetRole::ModeSelector);
        if (outcome == CycleOutcome::Advanced)
            Advance(FlowStep::AwaitingChooser);
        return outcome;
    }

    // Selector already opened by someone else
    const EvidenceReport chooser = deps_.detector.Classify(snapshot, DialogShape::ShareChooser);
    if (chooser.Confirmed())
    {
        LogInfo("Chooser already open, skipping mode selector");
        Advance(FlowStep::AwaitingChooser);
        ScheduleRetry(timing_.retry_delay);
        return CycleOutcome::Advanced;
    }

    return CycleOutcome::NotDetected;
}

CycleOutcome FlowController::HandleChooser(const Snapshot& snapshot)
{
    const EvidenceReport report = deps_.detector.Classify(snapshot, DialogShape::ShareChooser);
    if (report.Confirmed())
    {
        const CycleOutcome outcome = Activate(snapshot, TargetRole::EntireScreenOption);
        if (outcome == CycleOutcome::Advanced)
        {
            Advance(FlowStep::AwaitingShareConfirm);
            // The chooser closes without a window change of its own
            ScheduleRetry(timing_.chooser_retry_delay);
        }
        return outcome;
    }

    // Chooser gone; entire screen may already be selected
    const EvidenceReport confirm = deps_.detector.Classify(snapshot, DialogShape::ShareConfirm);
    if (confirm.Confirmed() && confirm.Has("selector_entire_screen"))
    {
        LogInfo("Entire screen already selected, skipping chooser");
        Advance(FlowStep::AwaitingShareConfirm);
        ScheduleRetry(timing_.retry_delay);
        return CycleOutcome::Advanced;
    }

    return CycleOutcome::NotDetected;
}

CycleOutcome FlowController::HandleShareConfirm(const Snapshot& snapshot)
{
    {
        auto selector = deps_.locator.Locate(snapshot, TargetRole::ModeSelector);
        if (selector && !SelectorReadsEntireScreen(*selector))
        {
            LogWarn("Share mode selector does not read \"" + entire_screen_fragment_ + "\", not confirming");
            return CycleOutcome::Vetoed;
        }
    }

    const EvidenceReport report = deps_.detector.Classify(snapshot, DialogShape::ShareConfirm);
    if (!report.Confirmed())
        return CycleOutcome::NotDetected;

    const CycleOutcome outcome = Activate(snapshot, TargetRole::ConfirmButton);
    if (outcome != CycleOutcome::Advanced)
    {
        ScheduleRetry(timing_.confirm_retry_delay, FlowStep::AwaitingShareConfirm);
        return outcome;
    }

    deps_.state.CountShareCompleted();
    Advance(FlowStep::Idle);
    Notify("Screen sharing started");
    return CycleOutcome::Completed;
}

CycleOutcome FlowController::Activate(const Snapshot& snapshot, TargetRole role)
{
    auto target = deps_.locator.Locate(snapshot, role);
    if (!target)
    {
        LogDebug(std::string(TargetRoleName(role)) + " not found, step unchanged");
        return CycleOutcome::TargetNotFound;
    }

    if (!deps_.executor.Click(*target, deps_.locator.ShouldEscalate(role)))
    {
        LogWarn(std::string("Click on ") + TargetRoleName(role) + " failed, step unchanged");
        return CycleOutcome::ActionFailed;
    }

    LogInfo(std::string(TargetRoleName(role)) + " clicked");
    return CycleOutcome::Advanced;
}

bool FlowController::SelectorReadsEntireScreen(const UiNode& selector) const
{
    std::string value = selector.FirstChildText();
    if (value.empty())
        value = selector.Caption();
    return text::ContainsIgnoreCase(value, entire_screen_fragment_);
}

void FlowController::Advance(FlowStep to)
{
    const FlowStep from = deps_.state.Step();
    deps_.state.TransitionTo(to, deps_.clock.Now());
    LogInfo(std::string("Step ") + FlowStepName(from) + " -> " + FlowStepName(to));
}

void FlowController::ScheduleRetry(std::chrono::milliseconds delay, std::optional<FlowStep> only_if_step)
{
    if (retry_)
        retry_(MonitoredApp::Companion, delay, only_if_step);
}

void FlowController::Notify(const std::string& message)
{
    if (!notify_)
        return;
    try
    {
        notify_(message);
    }
    catch (const std::exception& e)
    {
        LogWarn(std::string("Notification sink raised: ") + e.what());
    }
}

void FlowController::LogInfo(const std::string& msg) const
{
    if (deps_.logger.info)
        deps_.logger.info(msg);
}

void FlowController::LogDebug(const std::string& msg) const
{
    if (deps_.logger.debug)
        deps_.logger.debug(msg);
}

void FlowController::LogWarn(const std::string& msg) const
{
    if (deps_.logger.warn)
        deps_.logger.warn(msg);
}

void FlowController::LogError(const std::string& msg) const
{
    if (deps_.logger.error)
        deps_.logger.error(msg);
}

} // namespace deskpilot
