#include "MatchCriteria.hpp"
#include "../util/TextMatch.hpp"

#include <sstream>

namespace deskpilot
{

const char* MatchKindName(MatchKind kind)
{
    switch (kind)
    {
    case MatchKind::ExactId:
        return "id";
    case MatchKind::LiteralText:
        return "text";
    case MatchKind::Structural:
        return "structure";
    case MatchKind::AbsoluteBounds:
        return "bounds";
    }
    return "unknown";
}

MatchCriteria MatchCriteria::ById(std::string view_id)
{
    MatchCriteria c;
    c.kind = MatchKind::ExactId;
    c.pattern = std::move(view_id);
    return c;
}

MatchCriteria MatchCriteria::ByText(std::string caption)
{
    MatchCriteria c;
    c.kind = MatchKind::LiteralText;
    c.pattern = std::move(caption);
    return c;
}

MatchCriteria MatchCriteria::ByStructure(std::string class_fragment)
{
    MatchCriteria c;
    c.kind = MatchKind::Structural;
    c.pattern = std::move(class_fragment);
    return c;
}

MatchCriteria MatchCriteria::ByBounds(Rect rect)
{
    MatchCriteria c;
    c.kind = MatchKind::AbsoluteBounds;
    c.bounds = rect;
    return c;
}

MatchCriteria& MatchCriteria::WithCaptions(std::vector<std::string> list, CaptionMatch match)
{
    captions = std::move(list);
    caption_match = match;
    return *this;
}

MatchCriteria& MatchCriteria::Excluding(std::vector<std::string> list)
{
    excluded_captions = std::move(list);
    return *this;
}

MatchCriteria& MatchCriteria::WithChildCaptions(std::vector<std::string> list)
{
    child_captions = std::move(list);
    return *this;
}

MatchCriteria& MatchCriteria::WithChildCount(int count)
{
    child_count = count;
    return *this;
}

MatchCriteria& MatchCriteria::InClass(std::string fragment)
{
    class_contains = std::move(fragment);
    return *this;
}

MatchCriteria& MatchCriteria::Clickable()
{
    require_clickable = true;
    return *this;
}

MatchCriteria& MatchCriteria::Enabled()
{
    require_enabled = true;
    return *this;
}

MatchCriteria& MatchCriteria::Interactive()
{
    require_clickable = true;
    require_enabled = true;
    return *this;
}

MatchCriteria& MatchCriteria::WalkUpToClickable()
{
    walk_to_clickable_ancestor = true;
    return *this;
}

std::string MatchCriteria::Describe() const
{
    std::ostringstream oss;
    oss << MatchKindName(kind) << ":";
    if (kind == MatchKind::AbsoluteBounds)
        oss << "[" << bounds.left << "," << bounds.top << "][" << bounds.right << "," << bounds.bottom << "]";
    else
        oss << pattern;
    return oss.str();
}

namespace
{

bool ChildCaptionsMatch(const UiNode& node, const std::vector<std::string>& wanted)
{
    const int count = node.ChildCount();
    for (int i = 0; i < count; ++i)
    {
        UiNode child = node.Child(i);
        if (!child)
            continue;
        if (text::MatchesAnyCaption(child.Caption(), wanted, false))
            return true;
    }
    return false;
}

} // namespace

bool PassesFilters(const MatchCriteria& criteria, const UiNode& node, bool check_interactivity)
{
    if (!node)
        return false;

    const NodeInfo& info = node.Info();

    if (check_interactivity)
    {
        if (criteria.require_clickable && !info.clickable)
            return false;
        if (criteria.require_enabled && !info.enabled)
            return false;
    }

    switch (criteria.kind)
    {
    case MatchKind::Structural:
        if (!text::ContainsIgnoreCase(info.class_name, criteria.pattern))
            return false;
        break;
    case MatchKind::AbsoluteBounds:
        if (!(info.bounds == criteria.bounds))
            return false;
        break;
    default:
        break;
    }

    if (!criteria.class_contains.empty() && !text::ContainsIgnoreCase(info.class_name, criteria.class_contains))
        return false;

    const std::string caption = node.Caption();
    if (!text::MatchesAnyCaption(caption, criteria.captions, criteria.caption_match == CaptionMatch::Equals))
        return false;

    if (!criteria.excluded_captions.empty() && text::MatchesAnyCaption(caption, criteria.excluded_captions, true))
        return false;

    if (criteria.child_count >= 0 && info.child_count != criteria.child_count)
        return false;

    if (!criteria.child_captions.empty() && !ChildCaptionsMatch(node, criteria.child_captions))
        return false;

    return true;
}

} // namespace deskpilot
