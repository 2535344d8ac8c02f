#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace deskpilot
{

/// Raw platform handle. Each query hands out fresh handles, even for the same element.
using NodeRef = std::uint64_t;

inline constexpr NodeRef kNullNode = 0;

struct Rect
{
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    bool operator==(const Rect&) const = default;

    bool IsEmpty() const { return right <= left || bottom <= top; }
};

enum class NodeAction
{
    Click,
    LongClick,
    Focus,              // input focus
    AccessibilityFocus
};

inline const char* NodeActionName(NodeAction action)
{
    switch (action)
    {
    case NodeAction::Click:
        return "click";
    case NodeAction::LongClick:
        return "long-click";
    case NodeAction::Focus:
        return "focus";
    case NodeAction::AccessibilityFocus:
        return "accessibility-focus";
    }
    return "unknown";
}

/// Attributes of one element, as reported by the platform at query time.
struct NodeInfo
{
    std::string class_name;
    std::string text;
    std::string content_description;
    std::string view_id;
    bool clickable = false;
    bool long_clickable = false;
    bool focusable = false;
    bool enabled = false;
    bool visible = false;
    Rect bounds{};
    int child_count = 0;
};

/**
 * @brief Raised by the platform when a call cannot be served
 *
 * Typical causes are stale handles (the window changed underneath the query)
 * or releasing a handle that is no longer valid.
 */
class TreeFault : public std::runtime_error
{
public:
    explicit TreeFault(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

} // namespace deskpilot
