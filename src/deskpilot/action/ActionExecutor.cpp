#include "ActionExecutor.hpp"
#include "../util/Profile.hpp"

namespace deskpilot
{

ActionExecutor::ActionExecutor(IClock& clock, const Logger& logger, std::chrono::milliseconds settle_delay)
    : clock_(clock)
    , logger_(logger)
    , settle_delay_(settle_delay)
{
}

bool ActionExecutor::Click(const UiNode& node, bool escalate)
{
    PROFILE_SCOPE_FUNCTION();

    if (!node)
        return false;

    if (BasicStrategies(node))
        return true;

    if (!escalate)
    {
        if (logger_.warn)
            logger_.warn("Click failed without escalation");
        return false;
    }

    if (TryStep("long-click", node, NodeAction::LongClick, false))
        return true;
    if (TryStep("focus+click", node, NodeAction::Focus, true))
        return true;
    if (ClickParent(node))
        return true;

    if (logger_.warn)
        logger_.warn("All click strategies exhausted");
    return false;
}

bool ActionExecutor::BasicStrategies(const UiNode& node)
{
    if (TryStep("click", node, NodeAction::Click, false))
        return true;
    return TryStep("a11y-focus+click", node, NodeAction::AccessibilityFocus, true);
}

bool ActionExecutor::TryStep(const char* name, const UiNode& node, NodeAction first, bool settle_then_click)
{
    try
    {
        bool ok = node.Perform(first);
        if (settle_then_click)
        {
            // Focus is only a preparation; the click decides
            clock_.SleepFor(settle_delay_);
            ok = node.Perform(NodeAction::Click);
        }

        if (logger_.debug)
            logger_.debug(std::string("Strategy ") + name + (ok ? " succeeded" : " failed"));
        return ok;
    }
    catch (const std::exception& e)
    {
        if (logger_.warn)
            logger_.warn(std::string("Strategy ") + name + " raised: " + e.what());
        return false;
    }
}

bool ActionExecutor::ClickParent(const UiNode& node)
{
    try
    {
        UiNode parent = node.Parent();
        if (!parent || !parent.IsClickable())
        {
            if (logger_.debug)
                logger_.debug("No clickable parent to delegate to");
            return false;
        }

        if (logger_.debug)
            logger_.debug("Delegating click to parent " + parent.Describe());
        return BasicStrategies(parent);
    }
    catch (const std::exception& e)
    {
        if (logger_.warn)
            logger_.warn(std::string("Parent delegation raised: ") + e.what());
        return false;
    }
}

} // namespace deskpilot
