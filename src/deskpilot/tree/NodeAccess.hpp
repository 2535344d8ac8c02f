#pragma once

#include "IUiTree.hpp"
#include "UiNode.hpp"
#include "../locating/MatchCriteria.hpp"

#include <atomic>
#include <optional>

namespace deskpilot
{

class NodeAccess;

/**
 * @brief Exclusive, scoped ownership of the active window's root
 *
 * Only NodeAccess creates snapshots and only one may be live at a time. The
 * root handle is released and the slot freed when the snapshot goes out of
 * scope, whichever path the processing cycle takes.
 */
class Snapshot
{
public:
    ~Snapshot();

    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;

    Snapshot(Snapshot&& other) noexcept;
    Snapshot& operator=(Snapshot&&) = delete;

    const UiNode& Root() const { return root_; }

private:
    friend class NodeAccess;

    Snapshot(UiNode root, std::atomic<bool>* live_flag) noexcept;

    UiNode root_;
    std::atomic<bool>* live_flag_ = nullptr;
};

/**
 * @brief Query front-end over IUiTree
 *
 * Every query returns owning UiNode handles; whatever the caller does not keep
 * is released when the returned list is destroyed. Traversal queries release
 * each visited node that is not part of the result before moving on.
 */
class NodeAccess
{
public:
    explicit NodeAccess(IUiTree& tree);

    NodeAccess(const NodeAccess&) = delete;
    NodeAccess& operator=(const NodeAccess&) = delete;

    /**
     * @brief Take the active window's root
     * @return Empty when no window is available or another snapshot is still live
     */
    std::optional<Snapshot> AcquireSnapshot();

    bool IsSnapshotLive() const { return snapshot_live_.load(std::memory_order_acquire); }

    /**
     * @brief All nodes matching `criteria`, in tree order
     *
     * For text criteria that climb to an ancestor, interactivity filters are
     * left to the caller; every other filter is applied here.
     */
    NodeList Query(const Snapshot& snapshot, const MatchCriteria& criteria) const;

    /// First match of Query(); the remaining matches are released.
    UiNode QueryFirst(const Snapshot& snapshot, const MatchCriteria& criteria) const;

    IUiTree& Tree() const { return tree_; }

private:
    NodeList Traverse(const Snapshot& snapshot, const MatchCriteria& criteria, bool first_only) const;

    IUiTree& tree_;
    std::atomic<bool> snapshot_live_{ false };
};

} // namespace deskpilot
