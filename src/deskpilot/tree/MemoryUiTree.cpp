#include "MemoryUiTree.hpp"
#include "../util/TextMatch.hpp"

#include <utility>

namespace deskpilot
{

MemoryUiTree::MemoryUiTree(std::size_t action_log_limit)
    : action_log_limit_(action_log_limit)
{
}

void MemoryUiTree::SetActiveWindow(std::string package, const MemoryNode& root)
{
    std::lock_guard<std::mutex> lock(mutex_);
    package_ = std::move(package);
    nodes_.clear();
    ++generation_;
    Flatten(root, -1);
}

void MemoryUiTree::ClearActiveWindow()
{
    std::lock_guard<std::mutex> lock(mutex_);
    package_.clear();
    nodes_.clear();
    ++generation_;
}

std::string MemoryUiTree::ActivePackage() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return package_;
}

std::size_t MemoryUiTree::IssuedHandles() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return issued_;
}

std::size_t MemoryUiTree::ReleasedHandles() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

std::size_t MemoryUiTree::OutstandingHandles() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

std::size_t MemoryUiTree::RejectedReleases() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_releases_;
}

std::vector<PerformedAction> MemoryUiTree::PerformedActions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PerformedAction>(actions_.begin(), actions_.end());
}

void MemoryUiTree::ClearActionLog()
{
    std::lock_guard<std::mutex> lock(mutex_);
    actions_.clear();
}

std::size_t MemoryUiTree::TotalActions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_actions_;
}

void MemoryUiTree::FailAfterCalls(std::size_t calls)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fault_armed_ = true;
    calls_until_fault_ = calls;
}

bool MemoryUiTree::SetText(const std::string& view_id, const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& node : nodes_)
    {
        if (node.attrs.view_id == view_id)
        {
            node.attrs.text = text;
            return true;
        }
    }
    return false;
}

int MemoryUiTree::Flatten(const MemoryNode& node, int parent)
{
    const int index = static_cast<int>(nodes_.size());
    nodes_.emplace_back();
    nodes_[index].attrs = node;
    nodes_[index].attrs.children.clear();
    nodes_[index].parent = parent;

    for (const auto& child : node.children)
    {
        const int child_index = Flatten(child, index);
        nodes_[index].children.push_back(child_index);
    }
    return index;
}

void MemoryUiTree::CountCallLocked()
{
    if (!fault_armed_)
        return;
    if (calls_until_fault_ == 0)
    {
        fault_armed_ = false;
        throw TreeFault("injected platform fault");
    }
    --calls_until_fault_;
}

int MemoryUiTree::ResolveLocked(NodeRef ref) const
{
    auto it = handles_.find(ref);
    if (it == handles_.end())
        throw TreeFault("unknown node handle " + std::to_string(ref));
    if (it->second.generation != generation_ || it->second.index < 0 ||
        it->second.index >= static_cast<int>(nodes_.size()))
        throw TreeFault("stale node handle " + std::to_string(ref));
    return it->second.index;
}

NodeRef MemoryUiTree::IssueLocked(int index)
{
    const NodeRef ref = next_handle_++;
    handles_[ref] = HandleEntry{ index, generation_ };
    ++issued_;
    return ref;
}

void MemoryUiTree::CollectLocked(int index, std::vector<int>& out) const
{
    // Pre-order, scope excluded
    for (int child : nodes_[index].children)
    {
        out.push_back(child);
        CollectLocked(child, out);
    }
}

NodeRef MemoryUiTree::AcquireRoot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    if (nodes_.empty())
        return kNullNode;
    return IssueLocked(0);
}

std::vector<NodeRef> MemoryUiTree::FindByViewId(NodeRef scope, const std::string& view_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const int scope_index = ResolveLocked(scope);

    std::vector<int> candidates;
    CollectLocked(scope_index, candidates);

    std::vector<NodeRef> out;
    for (int index : candidates)
    {
        if (!view_id.empty() && nodes_[index].attrs.view_id == view_id)
            out.push_back(IssueLocked(index));
    }
    return out;
}

std::vector<NodeRef> MemoryUiTree::FindByText(NodeRef scope, const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const int scope_index = ResolveLocked(scope);

    std::vector<int> candidates;
    CollectLocked(scope_index, candidates);

    std::vector<NodeRef> out;
    for (int index : candidates)
    {
        const auto& attrs = nodes_[index].attrs;
        const bool hit = (!attrs.text.empty() && text::ContainsIgnoreCase(attrs.text, text)) ||
                         (!attrs.content_description.empty() &&
                          text::ContainsIgnoreCase(attrs.content_description, text));
        if (hit)
            out.push_back(IssueLocked(index));
    }
    return out;
}

NodeRef MemoryUiTree::GetParent(NodeRef node)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const int index = ResolveLocked(node);
    const int parent = nodes_[index].parent;
    if (parent < 0)
        return kNullNode;
    return IssueLocked(parent);
}

int MemoryUiTree::ChildCount(NodeRef node)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    return static_cast<int>(nodes_[ResolveLocked(node)].children.size());
}

NodeRef MemoryUiTree::GetChild(NodeRef node, int index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const auto& children = nodes_[ResolveLocked(node)].children;
    if (index < 0 || index >= static_cast<int>(children.size()))
        return kNullNode;
    return IssueLocked(children[index]);
}

NodeInfo MemoryUiTree::Describe(NodeRef node)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const FlatNode& flat = nodes_[ResolveLocked(node)];
    const MemoryNode& a = flat.attrs;

    NodeInfo info;
    info.class_name = a.class_name;
    info.text = a.text;
    info.content_description = a.content_description;
    info.view_id = a.view_id;
    info.clickable = a.clickable;
    info.long_clickable = a.long_clickable;
    info.focusable = a.focusable;
    info.enabled = a.enabled;
    info.visible = a.visible;
    info.bounds = a.bounds;
    info.child_count = static_cast<int>(flat.children.size());
    return info;
}

bool MemoryUiTree::PerformAction(NodeRef node, NodeAction action)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CountCallLocked();
    const MemoryNode& a = nodes_[ResolveLocked(node)].attrs;

    bool accepted = false;
    if (auto it = a.action_results.find(action); it != a.action_results.end())
    {
        accepted = it->second;
    }
    else
    {
        switch (action)
        {
        case NodeAction::Click:
            accepted = a.clickable && a.enabled;
            break;
        case NodeAction::LongClick:
            accepted = a.long_clickable && a.enabled;
            break;
        case NodeAction::Focus:
            accepted = a.focusable && a.enabled;
            break;
        case NodeAction::AccessibilityFocus:
            accepted = a.visible;
            break;
        }
    }

    ++total_actions_;
    if (action_log_limit_ > 0)
    {
        if (actions_.size() >= action_log_limit_)
            actions_.pop_front();
        actions_.push_back(PerformedAction{ a.view_id, a.text, a.class_name, action, accepted });
    }
    return accepted;
}

void MemoryUiTree::Release(NodeRef node)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(node);
    if (it == handles_.end())
    {
        ++rejected_releases_;
        throw TreeFault("release of unknown node handle " + std::to_string(node));
    }
    handles_.erase(it);
    ++released_;
}

} // namespace deskpilot
