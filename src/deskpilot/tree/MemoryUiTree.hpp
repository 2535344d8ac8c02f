#pragma once

#include "IUiTree.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace deskpilot
{

/// One element of an in-memory window description.
struct MemoryNode
{
    std::string class_name;
    std::string text;
    std::string content_description;
    std::string view_id;
    bool clickable = false;
    bool long_clickable = false;
    bool focusable = false;
    bool enabled = true;
    bool visible = true;
    Rect bounds{};

    // Forced results per action; actions not listed follow the node's flags
    std::map<NodeAction, bool> action_results;

    std::vector<MemoryNode> children;
};

struct PerformedAction
{
    std::string view_id;
    std::string text;
    std::string class_name;
    NodeAction action = NodeAction::Click;
    bool accepted = false;
};

/**
 * @brief IUiTree backed by an in-memory window description
 *
 * Serves windows pushed by the host (see platform::EventFeed) and the test
 * suite. Keeps full handle accounting: every handle it hands out is tracked
 * until released, releasing an unknown handle raises TreeFault, and handles
 * from a replaced window become stale.
 */
class MemoryUiTree final : public IUiTree
{
public:
    static constexpr std::size_t kDefaultActionLogLimit = 256;

    /// Keeps the most recent @p action_log_limit performed actions
    explicit MemoryUiTree(std::size_t action_log_limit = kDefaultActionLogLimit);

    /// Replace the active window. Handles into the previous window become stale.
    void SetActiveWindow(std::string package, const MemoryNode& root);
    void ClearActiveWindow();
    std::string ActivePackage() const;

    // Handle accounting
    std::size_t IssuedHandles() const;
    std::size_t ReleasedHandles() const;
    std::size_t OutstandingHandles() const;
    std::size_t RejectedReleases() const;

    /// Oldest first, at most the configured limit
    std::vector<PerformedAction> PerformedActions() const;
    void ClearActionLog();
    std::size_t TotalActions() const;

    /// Make the platform call after `calls` successful ones throw TreeFault (once).
    void FailAfterCalls(std::size_t calls);

    /// Update attributes of the first node with `view_id` in the active window.
    bool SetText(const std::string& view_id, const std::string& text);

    // IUiTree
    NodeRef AcquireRoot() override;
    std::vector<NodeRef> FindByViewId(NodeRef scope, const std::string& view_id) override;
    std::vector<NodeRef> FindByText(NodeRef scope, const std::string& text) override;
    NodeRef GetParent(NodeRef node) override;
    int ChildCount(NodeRef node) override;
    NodeRef GetChild(NodeRef node, int index) override;
    NodeInfo Describe(NodeRef node) override;
    bool PerformAction(NodeRef node, NodeAction action) override;
    void Release(NodeRef node) override;

private:
    struct FlatNode
    {
        MemoryNode attrs; // children left empty
        int parent = -1;
        std::vector<int> children;
    };

    struct HandleEntry
    {
        int index = -1;
        std::uint64_t generation = 0;
    };

    int Flatten(const MemoryNode& node, int parent);
    int ResolveLocked(NodeRef ref) const;
    NodeRef IssueLocked(int index);
    void CountCallLocked();
    void CollectLocked(int index, std::vector<int>& out) const;

    mutable std::mutex mutex_;
    std::string package_;
    std::vector<FlatNode> nodes_;
    std::uint64_t generation_ = 1;

    std::unordered_map<NodeRef, HandleEntry> handles_;
    NodeRef next_handle_ = 1;
    std::size_t issued_ = 0;
    std::size_t released_ = 0;
    std::size_t rejected_releases_ = 0;

    bool fault_armed_ = false;
    std::size_t calls_until_fault_ = 0;

    std::size_t action_log_limit_;
    std::deque<PerformedAction> actions_;
    std::size_t total_actions_ = 0;
};

} // namespace deskpilot
