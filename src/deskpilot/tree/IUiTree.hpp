#pragma once

#include "UiTreeTypes.hpp"

#include <string>
#include <vector>

namespace deskpilot
{

/**
 * @brief Pure virtual interface to the platform's UI tree of the active window
 *
 * The tree itself belongs to the platform. Every call that returns a NodeRef
 * hands out a new handle that the caller must give back through Release()
 * exactly once. Callers inside the engine never do this by hand: handles are
 * wrapped in UiNode, which releases on destruction.
 *
 * Any call may throw TreeFault.
 */
class IUiTree
{
public:
    virtual ~IUiTree() = default;

    /**
     * @brief Root of the active window
     * @return New handle, or kNullNode when no window is available
     */
    virtual NodeRef AcquireRoot() = 0;

    /**
     * @brief Elements under `scope` whose view identifier equals `view_id`
     * @return New handles in tree order
     */
    virtual std::vector<NodeRef> FindByViewId(NodeRef scope, const std::string& view_id) = 0;

    /**
     * @brief Elements under `scope` whose text or content description contains `text`
     *
     * Matching is case-insensitive.
     * @return New handles in tree order
     */
    virtual std::vector<NodeRef> FindByText(NodeRef scope, const std::string& text) = 0;

    virtual NodeRef GetParent(NodeRef node) = 0;

    virtual int ChildCount(NodeRef node) = 0;

    virtual NodeRef GetChild(NodeRef node, int index) = 0;

    virtual NodeInfo Describe(NodeRef node) = 0;

    /**
     * @brief Perform an action on the element
     * @return true if the platform accepted the action
     */
    virtual bool PerformAction(NodeRef node, NodeAction action) = 0;

    /**
     * @brief Return a handle to the platform
     *
     * May throw TreeFault when the handle is already invalid.
     */
    virtual void Release(NodeRef node) = 0;
};

} // namespace deskpilot
