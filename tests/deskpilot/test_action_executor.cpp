#include <catch2/catch_test_macros.hpp>

#include "TestWindows.hpp"
#include "deskpilot/action/ActionExecutor.hpp"
#include "deskpilot/tree/NodeAccess.hpp"
#include "deskpilot/util/Clock.hpp"

#include <chrono>
#include <vector>

using namespace deskpilot;
using namespace testwin;
using namespace std::chrono_literals;

namespace
{

std::vector<NodeAction> ActionsOn(const MemoryUiTree& tree, const std::string& class_name)
{
    std::vector<NodeAction> out;
    for (const auto& a : tree.PerformedActions())
        if (a.class_name == class_name)
            out.push_back(a.action);
    return out;
}

} // namespace

TEST_CASE("ActionExecutor - Click strategies", "[action]")
{
    MemoryUiTree tree;
    NodeAccess access(tree);
    ManualClock clock;
    Logger log;
    ActionExecutor executor(clock, log, 100ms);

    auto target = Clickable(View("android.widget.CheckedTextView", "Share entire screen"));
    auto parent = Clickable(View("android.widget.LinearLayout"));

    SECTION("A plain click is tried first")
    {
        tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { target }));
        auto snapshot = access.AcquireSnapshot();
        UiNode node = access.QueryFirst(*snapshot, MatchCriteria::ByStructure("CheckedTextView"));

        REQUIRE(executor.Click(node, false));
        REQUIRE(ActionsOn(tree, target.class_name) == std::vector<NodeAction>{ NodeAction::Click });
    }

    SECTION("Focus then click waits for the settle delay")
    {
        target.action_results[NodeAction::Click] = false;
        tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { target }));
        auto snapshot = access.AcquireSnapshot();
        UiNode node = access.QueryFirst(*snapshot, MatchCriteria::ByStructure("CheckedTextView"));

        const TimePoint before = clock.Now();
        REQUIRE_FALSE(executor.Click(node, false));
        REQUIRE(clock.Now() - before == 100ms);
        REQUIRE(ActionsOn(tree, target.class_name) ==
                std::vector<NodeAction>{ NodeAction::Click, NodeAction::AccessibilityFocus, NodeAction::Click });
    }

    SECTION("Escalation ends with the clickable parent")
    {
        target.action_results[NodeAction::Click] = false;
        target.action_results[NodeAction::LongClick] = false;
        tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { With(parent, { target }) }));
        auto snapshot = access.AcquireSnapshot();
        UiNode node = access.QueryFirst(*snapshot, MatchCriteria::ByStructure("CheckedTextView"));

        REQUIRE(executor.Click(node, true));
        REQUIRE(ActionsOn(tree, target.class_name) ==
                std::vector<NodeAction>{ NodeAction::Click, NodeAction::AccessibilityFocus, NodeAction::Click,
                                         NodeAction::LongClick, NodeAction::Focus, NodeAction::Click });
        REQUIRE(ActionsOn(tree, parent.class_name) == std::vector<NodeAction>{ NodeAction::Click });
    }

    SECTION("A platform fault counts as a failed strategy")
    {
        tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { target }));
        {
            auto snapshot = access.AcquireSnapshot();
            UiNode node = access.QueryFirst(*snapshot, MatchCriteria::ByStructure("CheckedTextView"));
            tree.FailAfterCalls(0);
            REQUIRE(executor.Click(node, false));
            REQUIRE(ActionsOn(tree, target.class_name) ==
                    std::vector<NodeAction>{ NodeAction::AccessibilityFocus, NodeAction::Click });
        }
        REQUIRE(tree.OutstandingHandles() == 0);
    }
}
