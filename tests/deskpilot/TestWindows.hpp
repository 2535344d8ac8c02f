#pragma once

#include "deskpilot/tree/MemoryUiTree.hpp"

#include <string>
#include <utility>
#include <vector>

// Window fixtures shaped like the dialogs seen on the reference device
namespace testwin
{

inline constexpr const char* kSource = "com.anydesk.anydeskandroid";
inline constexpr const char* kCompanion = "com.android.systemui";

inline std::string SourceId(const char* name) { return std::string(kSource) + ":id/" + name; }
inline std::string CompanionId(const char* name) { return std::string(kCompanion) + ":id/" + name; }

inline deskpilot::MemoryNode View(std::string cls, std::string text = {}, std::string id = {})
{
    deskpilot::MemoryNode n;
    n.class_name = std::move(cls);
    n.text = std::move(text);
    n.view_id = std::move(id);
    return n;
}

inline deskpilot::MemoryNode Clickable(deskpilot::MemoryNode n)
{
    n.clickable = true;
    n.focusable = true;
    return n;
}

inline deskpilot::MemoryNode With(deskpilot::MemoryNode parent, std::vector<deskpilot::MemoryNode> children)
{
    parent.children = std::move(children);
    return parent;
}

inline deskpilot::MemoryNode Button(std::string text, std::string id = {})
{
    return Clickable(View("android.widget.Button", std::move(text), std::move(id)));
}

inline deskpilot::MemoryNode IncomingConnectionWindow()
{
    return With(View("android.widget.FrameLayout"),
                { View("android.widget.TextView", "Incoming connection request", SourceId("dialog_accept_title_text")),
                  View("android.widget.TextView", "Alice would like to view your desk", SourceId("dialog_accept_msg")),
                  View("android.widget.TextView", "123 456 789", SourceId("dialog_accept_address")),
                  Button("DISMISS", "android:id/button2"),
                  Button("ACCEPT", "android:id/button1") });
}

// Share-your-screen dialog; `mode` is the selector's current value
inline deskpilot::MemoryNode ShareDialogWindow(const std::string& mode)
{
    auto selector = With(Clickable(View("android.widget.Spinner", "", CompanionId("screen_share_mode_options"))),
                         { View("android.widget.TextView", mode) });

    return With(View("android.widget.FrameLayout"),
                { With(View("android.widget.LinearLayout", "", CompanionId("screen_share_permission_dialog")),
                       { View("android.widget.TextView", "Share your screen with AnyDesk?",
                              CompanionId("screen_share_dialog_title")),
                         std::move(selector),
                         Button("Cancel", "android:id/button2"),
                         Button("Share screen", "android:id/button1") }) });
}

// Mode chooser: captions sit two levels below the clickable row
inline deskpilot::MemoryNode ChooserWindow()
{
    auto row = [](const char* caption)
    {
        return With(Clickable(View("android.widget.LinearLayout")),
                    { With(View("android.widget.LinearLayout"), { View("android.widget.TextView", caption) }) });
    };

    auto list = With(View("android.widget.ListView"), { row("Share entire screen"), row("Share one app") });
    list.bounds = deskpilot::Rect{ 89, 1021, 991, 1399 };

    return With(View("android.widget.FrameLayout"), { std::move(list) });
}

inline deskpilot::MemoryNode UnrelatedWindow()
{
    return With(View("android.widget.FrameLayout"),
                { View("android.widget.TextView", "Settings"), Button("OK", "android:id/button1") });
}

} // namespace testwin
