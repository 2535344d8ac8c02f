#include "NodeAccess.hpp"
#include "../util/Profile.hpp"

#include <deque>
#include <utility>

namespace deskpilot
{

Snapshot::Snapshot(UiNode root, std::atomic<bool>* live_flag) noexcept
    : root_(std::move(root))
    , live_flag_(live_flag)
{
}

Snapshot::Snapshot(Snapshot&& other) noexcept
    : root_(std::move(other.root_))
    , live_flag_(std::exchange(other.live_flag_, nullptr))
{
}

Snapshot::~Snapshot()
{
    root_.Release();
    if (live_flag_)
        live_flag_->store(false, std::memory_order_release);
}

NodeAccess::NodeAccess(IUiTree& tree)
    : tree_(tree)
{
}

std::optional<Snapshot> NodeAccess::AcquireSnapshot()
{
    bool expected = false;
    if (!snapshot_live_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return std::nullopt;

    NodeRef root_ref = kNullNode;
    try
    {
        root_ref = tree_.AcquireRoot();
    }
    catch (...)
    {
        snapshot_live_.store(false, std::memory_order_release);
        throw;
    }

    if (root_ref == kNullNode)
    {
        snapshot_live_.store(false, std::memory_order_release);
        return std::nullopt;
    }

    return Snapshot(UiNode(&tree_, root_ref), &snapshot_live_);
}

NodeList NodeAccess::Query(const Snapshot& snapshot, const MatchCriteria& criteria) const
{
    PROFILE_SCOPE_FUNCTION();

    const NodeRef scope = snapshot.Root().Ref();
    if (scope == kNullNode)
        return {};

    switch (criteria.kind)
    {
    case MatchKind::ExactId:
    case MatchKind::LiteralText:
    {
        NodeList candidates = AdoptAll(&tree_, criteria.kind == MatchKind::ExactId ?
                                                   tree_.FindByViewId(scope, criteria.pattern) :
                                                   tree_.FindByText(scope, criteria.pattern));

        const bool check_interactivity = !criteria.walk_to_clickable_ancestor;
        NodeList matches;
        for (auto& node : candidates)
        {
            if (PassesFilters(criteria, node, check_interactivity))
                matches.push_back(std::move(node));
        }
        return matches;
    }
    case MatchKind::Structural:
    case MatchKind::AbsoluteBounds:
        return Traverse(snapshot, criteria, false);
    }
    return {};
}

UiNode NodeAccess::QueryFirst(const Snapshot& snapshot, const MatchCriteria& criteria) const
{
    if (criteria.kind == MatchKind::Structural || criteria.kind == MatchKind::AbsoluteBounds)
    {
        NodeList found = Traverse(snapshot, criteria, true);
        return found.empty() ? UiNode{} : std::move(found.front());
    }

    NodeList found = Query(snapshot, criteria);
    if (found.empty())
        return {};
    return std::move(found.front());
}

NodeList NodeAccess::Traverse(const Snapshot& snapshot, const MatchCriteria& criteria, bool first_only) const
{
    PROFILE_SCOPE_CUSTOM("NodeAccess.Traverse");

    NodeList matches;
    const UiNode& root = snapshot.Root();
    if (!root)
        return matches;

    // The root stays with the snapshot; only descendants are candidates.
    std::deque<UiNode> queue;
    const int root_children = root.ChildCount();
    for (int i = 0; i < root_children; ++i)
    {
        UiNode child = root.Child(i);
        if (child)
            queue.push_back(std::move(child));
    }

    while (!queue.empty())
    {
        UiNode current = std::move(queue.front());
        queue.pop_front();

        if (PassesFilters(criteria, current))
        {
            matches.push_back(std::move(current));
            if (first_only)
                break;
            continue;
        }

        const int count = current.ChildCount();
        for (int i = 0; i < count; ++i)
        {
            UiNode child = current.Child(i);
            if (child)
                queue.push_back(std::move(child));
        }
    }

    return matches;
}

} // namespace deskpilot
