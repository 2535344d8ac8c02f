#include <catch2/catch_test_macros.hpp>

#include "deskpilot/events/DeferredTaskScheduler.hpp"
#include "deskpilot/events/EventGate.hpp"
#include "deskpilot/util/Clock.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace deskpilot;
using namespace std::chrono_literals;

TEST_CASE("DeferredTaskScheduler - Purpose-keyed tasks", "[scheduler]")
{
    ManualClock clock;
    std::vector<std::string> faults;
    DeferredTaskScheduler scheduler(clock, [&](const std::string& m) { faults.push_back(m); });
    std::vector<std::string> ran;

    SECTION("Nothing runs before it is due")
    {
        scheduler.Schedule(TaskPurpose::SettleDelay, 400ms, [&] { ran.push_back("settle"); });
        clock.Advance(399ms);
        REQUIRE(scheduler.RunDue() == 0);
        clock.Advance(1ms);
        REQUIRE(scheduler.RunDue() == 1);
        REQUIRE(ran == std::vector<std::string>{ "settle" });
        REQUIRE(scheduler.PendingCount() == 0);
    }

    SECTION("Scheduling again replaces the pending task of that purpose")
    {
        scheduler.Schedule(TaskPurpose::SettleDelay, 400ms, [&] { ran.push_back("first"); });
        clock.Advance(300ms);
        scheduler.Schedule(TaskPurpose::SettleDelay, 400ms, [&] { ran.push_back("second"); });
        clock.Advance(100ms);
        REQUIRE(scheduler.RunDue() == 0);
        clock.Advance(300ms);
        REQUIRE(scheduler.RunDue() == 1);
        REQUIRE(ran == std::vector<std::string>{ "second" });
    }

    SECTION("Different purposes coexist and run in scheduling order")
    {
        scheduler.Schedule(TaskPurpose::Retry, 500ms, [&] { ran.push_back("retry"); });
        scheduler.Schedule(TaskPurpose::SettleDelay, 400ms, [&] { ran.push_back("settle"); });
        REQUIRE(scheduler.PendingCount() == 2);
        clock.Advance(1s);
        REQUIRE(scheduler.RunDue() == 2);
        REQUIRE(ran == std::vector<std::string>{ "retry", "settle" });
    }

    SECTION("Cancelled tasks never run")
    {
        scheduler.Schedule(TaskPurpose::Retry, 500ms, [&] { ran.push_back("retry"); });
        scheduler.Schedule(TaskPurpose::SettleDelay, 400ms, [&] { ran.push_back("settle"); });
        scheduler.Cancel(TaskPurpose::Retry);
        REQUIRE_FALSE(scheduler.IsPending(TaskPurpose::Retry));
        scheduler.CancelAll();
        clock.Advance(1s);
        REQUIRE(scheduler.RunDue() == 0);
        REQUIRE(ran.empty());
    }

    SECTION("A throwing task is reported and does not stop the others")
    {
        scheduler.Schedule(TaskPurpose::Retry, 0ms, [] { throw std::runtime_error("boom"); });
        scheduler.Schedule(TaskPurpose::SettleDelay, 0ms, [&] { ran.push_back("settle"); });
        REQUIRE(scheduler.RunDue() == 2);
        REQUIRE(ran == std::vector<std::string>{ "settle" });
        REQUIRE(faults.size() == 1);
        REQUIRE(faults[0].find("boom") != std::string::npos);
    }
}

TEST_CASE("EventGate - Filtering and rate limiting", "[gate]")
{
    ManualClock clock;
    DeferredTaskScheduler scheduler(clock);
    std::vector<MonitoredApp> launched;

    GateSettings settings;
    settings.source_package = "com.anydesk.anydeskandroid";
    settings.companion_package = "com.android.systemui";
    EventGate gate(settings, scheduler, clock, [&](MonitoredApp app) { launched.push_back(app); });

    SECTION("Foreign applications are dropped")
    {
        REQUIRE(gate.OnChange({ "com.example.mail", EventKind::WindowStateChanged }) == GateDecision::DroppedForeign);
        REQUIRE(gate.OnChange({ "", EventKind::WindowStateChanged }) == GateDecision::DroppedForeign);
        REQUIRE(scheduler.PendingCount() == 0);
    }

    SECTION("Only trigger kinds schedule a cycle")
    {
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::ViewClicked }) == GateDecision::IgnoredKind);
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::WindowContentChanged }) ==
                GateDecision::IgnoredKind);
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::WindowStateChanged }) == GateDecision::Scheduled);
    }

    SECTION("Cycle runs after the settle delay for the right application")
    {
        REQUIRE(gate.OnChange({ settings.companion_package, EventKind::WindowStateChanged }) ==
                GateDecision::Scheduled);
        clock.Advance(399ms);
        scheduler.RunDue();
        REQUIRE(launched.empty());
        clock.Advance(1ms);
        scheduler.RunDue();
        REQUIRE(launched == std::vector<MonitoredApp>{ MonitoredApp::Companion });
    }

    SECTION("Triggers closer than the minimum interval are rate limited")
    {
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::WindowStateChanged }) == GateDecision::Scheduled);
        clock.Advance(799ms);
        REQUIRE(gate.OnChange({ settings.companion_package, EventKind::WindowStateChanged }) ==
                GateDecision::RateLimited);
        clock.Advance(1ms);
        REQUIRE(gate.OnChange({ settings.companion_package, EventKind::WindowStateChanged }) ==
                GateDecision::Scheduled);

        clock.Advance(1s);
        scheduler.RunDue();
        // The second trigger replaced the first pending cycle
        REQUIRE(launched == std::vector<MonitoredApp>{ MonitoredApp::Companion });
    }

    SECTION("Reset forgets the rate-limit window")
    {
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::WindowStateChanged }) == GateDecision::Scheduled);
        gate.Reset();
        REQUIRE(gate.OnChange({ settings.source_package, EventKind::WindowStateChanged }) == GateDecision::Scheduled);
    }
}
