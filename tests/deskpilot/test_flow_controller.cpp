#include <catch2/catch_test_macros.hpp>

#include "TestWindows.hpp"
#include "deskpilot/flow/FlowController.hpp"
#include "deskpilot/signatures/UiSignatures.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace deskpilot;
using namespace testwin;
using namespace std::chrono_literals;

namespace
{

struct Retry
{
    MonitoredApp app;
    std::chrono::milliseconds delay;
    std::optional<FlowStep> only_if_step;
};

struct FlowHarness
{
    MemoryUiTree tree;
    ManualClock clock;
    NodeAccess access{ tree };
    UiSignatures signatures = UiSignatures::ForPackages(kSource, kCompanion);
    Logger log;
    ErrorContext errors;
    NodeLocator locator{ access, signatures.recipes, log };
    DialogDetector detector{ access, locator, signatures.profiles, log };
    ActionExecutor executor{ clock, log, 100ms };
    FlowState state{ clock.Now() };
    FlowController controller{ { state, access, locator, detector, executor, clock, log, errors },
                               FlowTiming{},
                               signatures.entire_screen_fragment };

    std::vector<std::string> notifications;
    std::vector<Retry> retries;
    std::vector<ErrorInfo> reported;

    FlowHarness()
    {
        controller.SetNotificationSink([this](const std::string& m) { notifications.push_back(m); });
        controller.SetRetryRequest([this](MonitoredApp app, std::chrono::milliseconds delay,
                                          std::optional<FlowStep> only_if_step)
                                   { retries.push_back(Retry{ app, delay, only_if_step }); });
        errors.SetCallback([this](const ErrorInfo& info) { reported.push_back(info); });
    }

    CycleResult Run(MonitoredApp app, const char* package, const MemoryNode& window)
    {
        tree.SetActiveWindow(package, window);
        REQUIRE(state.TryBeginCycle());
        ProcessingLease lease(state);
        return controller.RunCycle(app);
    }

    bool Clicked(const std::string& class_or_text) const
    {
        for (const auto& a : tree.PerformedActions())
        {
            if (a.action == NodeAction::Click && a.accepted &&
                (a.text == class_or_text || a.class_name == class_or_text))
                return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("FlowController - Full share flow", "[flow]")
{
    FlowHarness h;

    // Incoming connection: accept
    CycleResult r = h.Run(MonitoredApp::Source, kSource, IncomingConnectionWindow());
    REQUIRE(r.outcome == CycleOutcome::Advanced);
    REQUIRE(h.state.Step() == FlowStep::AwaitingShareDialog);
    REQUIRE(h.Clicked("ACCEPT"));
    REQUIRE(h.notifications == std::vector<std::string>{ "Connection accepted" });

    // Share dialog: open the mode selector
    r = h.Run(MonitoredApp::Companion, kCompanion, ShareDialogWindow("Share one app"));
    REQUIRE(r.outcome == CycleOutcome::Advanced);
    REQUIRE(h.state.Step() == FlowStep::AwaitingChooser);
    REQUIRE(h.Clicked("android.widget.Spinner"));

    // Chooser: pick entire screen through the grandparent row
    h.tree.ClearActionLog();
    r = h.Run(MonitoredApp::Companion, kCompanion, ChooserWindow());
    REQUIRE(r.outcome == CycleOutcome::Advanced);
    REQUIRE(h.state.Step() == FlowStep::AwaitingShareConfirm);
    REQUIRE(h.Clicked("android.widget.LinearLayout"));
    REQUIRE(h.retries.size() == 1);
    REQUIRE(h.retries[0].app == MonitoredApp::Companion);
    REQUIRE(h.retries[0].delay == 800ms);

    // Confirm
    r = h.Run(MonitoredApp::Companion, kCompanion, ShareDialogWindow("Share entire screen"));
    REQUIRE(r.outcome == CycleOutcome::Completed);
    REQUIRE(h.state.Step() == FlowStep::Idle);
    REQUIRE(h.Clicked("Share screen"));

    const FlowStats stats = h.state.Stats();
    REQUIRE(stats.dialogs_detected == 1);
    REQUIRE(stats.auto_accept_count == 1);
    REQUIRE(stats.shares_completed == 1);
    REQUIRE(h.notifications.back() == "Screen sharing started");
    REQUIRE(h.tree.OutstandingHandles() == 0);
    REQUIRE(h.tree.RejectedReleases() == 0);
}

TEST_CASE("FlowController - Relevance and detection", "[flow]")
{
    FlowHarness h;

    SECTION("Companion windows are ignored while idle")
    {
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, ShareDialogWindow("Share one app"));
        REQUIRE(r.outcome == CycleOutcome::Ignored);
        REQUIRE(h.tree.IssuedHandles() == 0);
    }

    SECTION("Source windows are ignored mid-flow")
    {
        h.state.TransitionTo(FlowStep::AwaitingChooser, h.clock.Now());
        const CycleResult r = h.Run(MonitoredApp::Source, kSource, IncomingConnectionWindow());
        REQUIRE(r.outcome == CycleOutcome::Ignored);
        REQUIRE(h.state.Step() == FlowStep::AwaitingChooser);
    }

    SECTION("Unrelated dialog never transitions")
    {
        const CycleResult r = h.Run(MonitoredApp::Source, kSource, UnrelatedWindow());
        REQUIRE(r.outcome == CycleOutcome::NotDetected);
        REQUIRE(h.state.Step() == FlowStep::Idle);
        REQUIRE(h.tree.PerformedActions().empty());
        REQUIRE(h.state.Stats().dialogs_detected == 0);
    }

    SECTION("Render wait precedes reading the window")
    {
        const TimePoint before = h.clock.Now();
        (void)h.Run(MonitoredApp::Source, kSource, UnrelatedWindow());
        REQUIRE(h.clock.Now() - before == 300ms);
    }
}

TEST_CASE("FlowController - Failures keep the step", "[flow]")
{
    FlowHarness h;

    SECTION("Rejected accept click")
    {
        auto window = IncomingConnectionWindow();
        window.children.back().action_results[NodeAction::Click] = false;
        const CycleResult r = h.Run(MonitoredApp::Source, kSource, window);
        REQUIRE(r.outcome == CycleOutcome::ActionFailed);
        REQUIRE(h.state.Step() == FlowStep::Idle);
        REQUIRE(h.state.Stats().dialogs_detected == 1);
        REQUIRE(h.state.Stats().auto_accept_count == 0);
        REQUIRE(h.notifications.empty());
    }

    SECTION("Confirm refused on the wrong share mode")
    {
        h.state.TransitionTo(FlowStep::AwaitingShareConfirm, h.clock.Now());
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, ShareDialogWindow("Share one app"));
        REQUIRE(r.outcome == CycleOutcome::Vetoed);
        REQUIRE(h.state.Step() == FlowStep::AwaitingShareConfirm);
        REQUIRE_FALSE(h.Clicked("Share screen"));
    }

    SECTION("Failed confirm schedules a step-gated retry")
    {
        auto window = ShareDialogWindow("Share entire screen");
        for (auto& child : window.children.front().children)
        {
            if (child.text == "Share screen")
            {
                child.action_results[NodeAction::Click] = false;
                child.action_results[NodeAction::LongClick] = false;
            }
        }
        h.state.TransitionTo(FlowStep::AwaitingShareConfirm, h.clock.Now());
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, window);
        REQUIRE(r.outcome == CycleOutcome::ActionFailed);
        REQUIRE(h.state.Step() == FlowStep::AwaitingShareConfirm);
        REQUIRE(h.retries.size() == 1);
        REQUIRE(h.retries[0].delay == 1000ms);
        REQUIRE(h.retries[0].only_if_step == FlowStep::AwaitingShareConfirm);
    }

    SECTION("Platform fault is contained at the cycle boundary")
    {
        h.tree.SetActiveWindow(kSource, IncomingConnectionWindow());
        h.tree.FailAfterCalls(5);
        REQUIRE(h.state.TryBeginCycle());
        CycleResult r;
        {
            ProcessingLease lease(h.state);
            r = h.controller.RunCycle(MonitoredApp::Source);
        }
        REQUIRE(r.outcome == CycleOutcome::Fault);
        REQUIRE_FALSE(h.state.IsProcessing());
        REQUIRE(h.state.Step() == FlowStep::Idle);
        REQUIRE(h.tree.OutstandingHandles() == 0);
        REQUIRE(h.reported.size() == 1);
        REQUIRE(h.reported[0].level == ErrorSeverityLevel::Error);
        REQUIRE(h.errors.LastError().find("FlowController") == 0);
    }
}

TEST_CASE("FlowController - Fallback transitions", "[flow]")
{
    FlowHarness h;

    SECTION("Chooser already open while waiting for the share dialog")
    {
        h.state.TransitionTo(FlowStep::AwaitingShareDialog, h.clock.Now());
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, ChooserWindow());
        REQUIRE(r.outcome == CycleOutcome::Advanced);
        REQUIRE(h.state.Step() == FlowStep::AwaitingChooser);
        REQUIRE(h.tree.PerformedActions().empty());
        REQUIRE(h.retries.size() == 1);
        REQUIRE(h.retries[0].delay == 500ms);
    }

    SECTION("Entire screen already selected while waiting for the chooser")
    {
        h.state.TransitionTo(FlowStep::AwaitingChooser, h.clock.Now());
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, ShareDialogWindow("Share entire screen"));
        REQUIRE(r.outcome == CycleOutcome::Advanced);
        REQUIRE(h.state.Step() == FlowStep::AwaitingShareConfirm);
        REQUIRE(h.retries.size() == 1);
        REQUIRE(h.retries[0].delay == 500ms);
    }
}

TEST_CASE("FlowController - Stuck recovery", "[flow]")
{
    FlowHarness h;
    h.state.TransitionTo(FlowStep::AwaitingChooser, h.clock.Now());

    SECTION("Within the timeout the step is kept")
    {
        h.clock.Advance(29s);
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, UnrelatedWindow());
        REQUIRE_FALSE(r.stuck_reset);
        REQUIRE(h.state.Step() == FlowStep::AwaitingChooser);
    }

    SECTION("Past the timeout the flow restarts from idle")
    {
        h.clock.Advance(31s);
        const CycleResult r = h.Run(MonitoredApp::Source, kSource, IncomingConnectionWindow());
        REQUIRE(r.stuck_reset);
        REQUIRE(r.step_before == FlowStep::AwaitingChooser);
        REQUIRE(r.outcome == CycleOutcome::Advanced);
        REQUIRE(h.state.Step() == FlowStep::AwaitingShareDialog);
    }

    SECTION("A late chooser after the timeout is left alone")
    {
        h.clock.Advance(31s);
        const CycleResult r = h.Run(MonitoredApp::Companion, kCompanion, ChooserWindow());
        REQUIRE(r.stuck_reset);
        REQUIRE(r.step_before == FlowStep::AwaitingChooser);
        REQUIRE(r.outcome == CycleOutcome::Ignored);
        REQUIRE(h.state.Step() == FlowStep::Idle);
        REQUIRE(h.tree.PerformedActions().empty());
        REQUIRE(h.tree.IssuedHandles() == 0);
        REQUIRE(h.retries.empty());
    }
}
