#include <catch2/catch_test_macros.hpp>

#include "TestWindows.hpp"
#include "deskpilot/detection/DialogDetector.hpp"
#include "deskpilot/locating/NodeLocator.hpp"
#include "deskpilot/signatures/UiSignatures.hpp"

#include <string>
#include <vector>

using namespace deskpilot;
using namespace testwin;

namespace
{

struct Harness
{
    MemoryUiTree tree;
    NodeAccess access{ tree };
    UiSignatures signatures = UiSignatures::ForPackages(kSource, kCompanion);
    std::vector<std::string> warnings;
    Logger log;
    NodeLocator locator{ access, signatures.recipes, log };
    DialogDetector detector{ access, locator, signatures.profiles, log };

    Harness()
    {
        log.warn = [this](const std::string& m) { warnings.push_back(m); };
    }
};

} // namespace

TEST_CASE("NodeLocator - Strategies", "[locator]")
{
    Harness h;

    SECTION("Accept button found by id and caption")
    {
        h.tree.SetActiveWindow(kSource, IncomingConnectionWindow());
        auto snapshot = h.access.AcquireSnapshot();
        auto accept = h.locator.Locate(*snapshot, TargetRole::AcceptButton);
        REQUIRE(accept.has_value());
        REQUIRE(accept->Text() == "ACCEPT");
        REQUIRE_FALSE(h.locator.ShouldEscalate(TargetRole::AcceptButton));
    }

    SECTION("Text match climbs to the clickable grandparent")
    {
        h.tree.SetActiveWindow(kCompanion, ChooserWindow());
        {
            auto snapshot = h.access.AcquireSnapshot();
            auto option = h.locator.Locate(*snapshot, TargetRole::EntireScreenOption);
            REQUIRE(option.has_value());
            REQUIRE(option->ClassName() == "android.widget.LinearLayout");
            REQUIRE(option->IsClickable());
            REQUIRE(option->Caption().empty());
            REQUIRE(h.locator.ShouldEscalate(TargetRole::EntireScreenOption));
        }
        REQUIRE(h.tree.OutstandingHandles() == 0);
    }

    SECTION("Absolute bounds are the last resort and flagged as fragile")
    {
        auto row = Clickable(View("android.widget.FrameLayout"));
        row.bounds = Rect{ 89, 1210, 991, 1399 };
        h.tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { row }));

        auto snapshot = h.access.AcquireSnapshot();
        auto option = h.locator.Locate(*snapshot, TargetRole::EntireScreenOption);
        REQUIRE(option.has_value());
        REQUIRE(option->Bounds() == Rect{ 89, 1210, 991, 1399 });
        REQUIRE(h.warnings.size() == 1);
    }

    SECTION("Confirm button never resolves to Cancel")
    {
        h.tree.SetActiveWindow(kCompanion, With(View("android.widget.FrameLayout"), { Button("Cancel") }));
        auto snapshot = h.access.AcquireSnapshot();
        REQUIRE_FALSE(h.locator.Locate(*snapshot, TargetRole::ConfirmButton).has_value());
    }

    SECTION("Disabled accept button is not a target")
    {
        auto window = IncomingConnectionWindow();
        window.children.back().enabled = false;
        h.tree.SetActiveWindow(kSource, window);
        auto snapshot = h.access.AcquireSnapshot();
        REQUIRE_FALSE(h.locator.Locate(*snapshot, TargetRole::AcceptButton).has_value());
    }
}

TEST_CASE("DialogDetector - Evidence scoring", "[detector]")
{
    Harness h;

    SECTION("Incoming connection dialog is confirmed")
    {
        h.tree.SetActiveWindow(kSource, IncomingConnectionWindow());
        auto snapshot = h.access.AcquireSnapshot();
        const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::IncomingConnection);
        REQUIRE(report.Confirmed());
        REQUIRE(report.Has("title"));
        REQUIRE(report.Has("accept_and_dismiss"));
        REQUIRE_FALSE(report.Has("profile_selector"));
    }

    SECTION("A lone OK button does not look like an incoming connection")
    {
        h.tree.SetActiveWindow(kSource, UnrelatedWindow());
        auto snapshot = h.access.AcquireSnapshot();
        const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::IncomingConnection);
        REQUIRE_FALSE(report.Confirmed());
        REQUIRE(report.score < report.threshold);
    }

    SECTION("One heavy signal alone is not enough")
    {
        h.tree.SetActiveWindow(kSource, With(View("android.widget.FrameLayout"),
                                             { Button("DISMISS", "android:id/button2"),
                                               Button("ACCEPT", "android:id/button1") }));
        auto snapshot = h.access.AcquireSnapshot();
        const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::IncomingConnection);
        REQUIRE(report.Has("accept_and_dismiss"));
        REQUIRE_FALSE(report.Confirmed());
    }

    SECTION("Chooser confirmed from its two options")
    {
        h.tree.SetActiveWindow(kCompanion, ChooserWindow());
        auto snapshot = h.access.AcquireSnapshot();
        const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::ShareChooser);
        REQUIRE(report.Confirmed());
        REQUIRE(report.Has("entire_screen_option"));
        REQUIRE(report.Has("one_app_option"));
        REQUIRE(report.Has("chooser_bounds"));
    }

    SECTION("Confirm shape needs the selector on entire screen")
    {
        h.tree.SetActiveWindow(kCompanion, ShareDialogWindow("Share entire screen"));
        {
            auto snapshot = h.access.AcquireSnapshot();
            const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::ShareConfirm);
            REQUIRE(report.Confirmed());
            REQUIRE(report.Has("selector_entire_screen"));
        }

        h.tree.SetActiveWindow(kCompanion, ShareDialogWindow("Share one app"));
        {
            auto snapshot = h.access.AcquireSnapshot();
            const EvidenceReport report = h.detector.Classify(*snapshot, DialogShape::ShareConfirm);
            REQUIRE_FALSE(report.Has("selector_entire_screen"));
        }
        REQUIRE(h.tree.OutstandingHandles() == 0);
    }
}
