#pragma once

#include "../api/logger.hpp"
#include "../tree/UiNode.hpp"
#include "../util/Clock.hpp"

#include <chrono>

namespace deskpilot
{

/**
 * @brief Activates located elements with escalating fallbacks
 *
 * Strategies, in order:
 *  1. click
 *  2. accessibility focus, settle, click
 *  3. (escalate only) long-click
 *  4. (escalate only) input focus, settle, click
 *  5. (escalate only) strategies 1 and 2 on the clickable parent, one hop
 *
 * A platform fault inside a strategy is logged and counts as that strategy
 * failing; Click() itself does not throw.
 */
class ActionExecutor
{
public:
    ActionExecutor(IClock& clock, const Logger& logger, std::chrono::milliseconds settle_delay);

    /// @return false once every applicable strategy failed
    bool Click(const UiNode& node, bool escalate);

private:
    bool BasicStrategies(const UiNode& node);
    bool TryStep(const char* name, const UiNode& node, NodeAction first, bool settle_then_click);
    bool ClickParent(const UiNode& node);

    IClock& clock_;
    const Logger& logger_;
    std::chrono::milliseconds settle_delay_;
};

} // namespace deskpilot
