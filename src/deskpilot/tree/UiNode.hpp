#pragma once

#include "IUiTree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace deskpilot
{

/**
 * @brief Owning, move-only wrapper around one platform handle
 *
 * The handle is released exactly once: on Release(), on move-assignment over
 * it, or on destruction, whichever comes first. A release the platform rejects
 * (handle already invalid) is ignored.
 *
 * Attributes are fetched from the platform on first access and cached for the
 * lifetime of the wrapper.
 */
class UiNode
{
public:
    UiNode() = default;
    UiNode(IUiTree* tree, NodeRef ref) noexcept;
    ~UiNode();

    UiNode(const UiNode&) = delete;
    UiNode& operator=(const UiNode&) = delete;

    UiNode(UiNode&& other) noexcept;
    UiNode& operator=(UiNode&& other) noexcept;

    explicit operator bool() const noexcept { return ref_ != kNullNode; }
    bool Valid() const noexcept { return ref_ != kNullNode; }

    NodeRef Ref() const noexcept { return ref_; }

    const NodeInfo& Info() const;

    const std::string& ClassName() const { return Info().class_name; }
    const std::string& Text() const { return Info().text; }
    const std::string& ViewId() const { return Info().view_id; }
    const Rect& Bounds() const { return Info().bounds; }
    bool IsClickable() const { return Info().clickable; }
    bool IsEnabled() const { return Info().enabled; }

    /// Text if present, otherwise the content description
    std::string Caption() const;

    int ChildCount() const;
    UiNode Child(int index) const;
    UiNode Parent() const;

    /// First non-empty child text (used to read a selector's current value)
    std::string FirstChildText() const;

    bool Perform(NodeAction action) const;

    void Release() noexcept;

    /// Debug description: class, id and caption
    std::string Describe() const;

private:
    IUiTree* tree_ = nullptr;
    NodeRef ref_ = kNullNode;
    mutable std::optional<NodeInfo> info_;
};

using NodeList = std::vector<UiNode>;

/// Wrap a batch of raw handles; each one ends up owned by exactly one UiNode.
NodeList AdoptAll(IUiTree* tree, const std::vector<NodeRef>& refs);

} // namespace deskpilot
