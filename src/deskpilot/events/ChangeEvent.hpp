#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace deskpilot
{

enum class EventKind
{
    WindowStateChanged,
    WindowContentChanged,
    ViewClicked,
    ViewFocused
};

inline const char* EventKindName(EventKind kind)
{
    switch (kind)
    {
    case EventKind::WindowStateChanged:
        return "window_state_changed";
    case EventKind::WindowContentChanged:
        return "window_content_changed";
    case EventKind::ViewClicked:
        return "view_clicked";
    case EventKind::ViewFocused:
        return "view_focused";
    }
    return "unknown";
}

inline std::optional<EventKind> ParseEventKind(std::string_view name)
{
    for (EventKind kind : { EventKind::WindowStateChanged, EventKind::WindowContentChanged, EventKind::ViewClicked,
                            EventKind::ViewFocused })
    {
        if (name == EventKindName(kind))
            return kind;
    }
    return std::nullopt;
}

/// One UI-change notification from the platform.
struct ChangeEvent
{
    std::string source; // package of the application that changed
    EventKind kind = EventKind::WindowStateChanged;
};

} // namespace deskpilot
