#include "NodeLocator.hpp"
#include "../util/Profile.hpp"

#include <utility>

namespace deskpilot
{

NodeLocator::NodeLocator(const NodeAccess& access, std::vector<LocatorRecipe> recipes, const Logger& logger)
    : access_(access)
    , recipes_(std::move(recipes))
    , logger_(logger)
{
}

const LocatorRecipe* NodeLocator::FindRecipe(TargetRole role) const
{
    for (const auto& recipe : recipes_)
    {
        if (recipe.role == role)
            return &recipe;
    }
    return nullptr;
}

bool NodeLocator::ShouldEscalate(TargetRole role) const
{
    const LocatorRecipe* recipe = FindRecipe(role);
    return recipe && recipe->escalate_click;
}

std::optional<UiNode> NodeLocator::Locate(const Snapshot& snapshot, TargetRole role) const
{
    PROFILE_SCOPE_FUNCTION();

    const LocatorRecipe* recipe = FindRecipe(role);
    if (!recipe)
    {
        if (logger_.warn)
            logger_.warn(std::string("No locator recipe for ") + TargetRoleName(role));
        return std::nullopt;
    }

    for (const auto& criteria : recipe->strategies)
    {
        auto found = LocateWith(snapshot, criteria);
        if (!found)
            continue;

        if (criteria.kind == MatchKind::AbsoluteBounds)
        {
            if (logger_.warn)
                logger_.warn(std::string(TargetRoleName(role)) + " located by absolute bounds (fragile): " +
                             criteria.Describe());
        }
        else if (logger_.debug)
        {
            logger_.debug(std::string(TargetRoleName(role)) + " located by " + criteria.Describe() + " -> " +
                          found->Describe());
        }
        return found;
    }

    if (logger_.debug)
        logger_.debug(std::string(TargetRoleName(role)) + " not found");
    return std::nullopt;
}

std::optional<UiNode> NodeLocator::LocateWith(const Snapshot& snapshot, const MatchCriteria& criteria) const
{
    if (!criteria.walk_to_clickable_ancestor)
    {
        UiNode node = access_.QueryFirst(snapshot, criteria);
        if (!node)
            return std::nullopt;
        return node;
    }

    // Matches are tried in order; each one either yields an ancestor or is dropped
    NodeList matches = access_.Query(snapshot, criteria);
    for (auto& match : matches)
    {
        UiNode target = ClimbToClickable(std::move(match));
        if (target)
            return target;
    }
    return std::nullopt;
}

UiNode NodeLocator::ClimbToClickable(UiNode node)
{
    UiNode current = std::move(node);
    while (current)
    {
        if (current.IsClickable() && current.IsEnabled())
            return current;
        // Assigning over `current` releases the level we just left
        current = current.Parent();
    }
    return {};
}

} // namespace deskpilot
