#pragma once

#include "MatchCriteria.hpp"
#include "TargetRole.hpp"
#include "../api/logger.hpp"
#include "../tree/NodeAccess.hpp"

#include <optional>
#include <vector>

namespace deskpilot
{

/// Ordered strategies for one role; evaluation stops at the first hit.
struct LocatorRecipe
{
    TargetRole role = TargetRole::AcceptButton;
    std::vector<MatchCriteria> strategies;

    // Whether ActionExecutor may use the escalated click strategies on this target
    bool escalate_click = false;
};

/**
 * @brief Multi-strategy element search
 *
 * Runs a role's recipe against the current snapshot. Text matches that are not
 * themselves interactive are replaced by their nearest clickable ancestor.
 * Absolute-bounds hits are logged as fragile.
 */
class NodeLocator
{
public:
    NodeLocator(const NodeAccess& access, std::vector<LocatorRecipe> recipes, const Logger& logger);

    std::optional<UiNode> Locate(const Snapshot& snapshot, TargetRole role) const;

    /// Evaluate a single criteria with the same rules as a recipe strategy.
    std::optional<UiNode> LocateWith(const Snapshot& snapshot, const MatchCriteria& criteria) const;

    bool ShouldEscalate(TargetRole role) const;

    const LocatorRecipe* FindRecipe(TargetRole role) const;

    /**
     * @brief Walk up from `node` to the nearest clickable, enabled element
     *
     * `node` itself is returned when it qualifies. Every ancestor passed on
     * the way is released.
     * @return Empty node when no ancestor qualifies
     */
    static UiNode ClimbToClickable(UiNode node);

private:
    const NodeAccess& access_;
    std::vector<LocatorRecipe> recipes_;
    const Logger& logger_;
};

} // namespace deskpilot
