#include "UiNode.hpp"
#include "../util/TextMatch.hpp"

#include <sstream>
#include <utility>

namespace deskpilot
{

UiNode::UiNode(IUiTree* tree, NodeRef ref) noexcept
    : tree_(tree)
    , ref_(tree ? ref : kNullNode)
{
}

UiNode::~UiNode() { Release(); }

UiNode::UiNode(UiNode&& other) noexcept
    : tree_(std::exchange(other.tree_, nullptr))
    , ref_(std::exchange(other.ref_, kNullNode))
    , info_(std::move(other.info_))
{
    other.info_.reset();
}

UiNode& UiNode::operator=(UiNode&& other) noexcept
{
    if (this != &other)
    {
        Release();
        tree_ = std::exchange(other.tree_, nullptr);
        ref_ = std::exchange(other.ref_, kNullNode);
        info_ = std::move(other.info_);
        other.info_.reset();
    }
    return *this;
}

const NodeInfo& UiNode::Info() const
{
    if (!info_)
    {
        if (!Valid())
            throw TreeFault("attribute access on released node");
        info_ = tree_->Describe(ref_);
    }
    return *info_;
}

std::string UiNode::Caption() const
{
    const auto& info = Info();
    return info.text.empty() ? info.content_description : info.text;
}

int UiNode::ChildCount() const
{
    if (!Valid())
        return 0;
    return tree_->ChildCount(ref_);
}

UiNode UiNode::Child(int index) const
{
    if (!Valid())
        return {};
    return UiNode(tree_, tree_->GetChild(ref_, index));
}

UiNode UiNode::Parent() const
{
    if (!Valid())
        return {};
    return UiNode(tree_, tree_->GetParent(ref_));
}

std::string UiNode::FirstChildText() const
{
    const int count = ChildCount();
    for (int i = 0; i < count; ++i)
    {
        UiNode child = Child(i);
        if (!child)
            continue;

        std::string text = text::Trim(child.Text());
        if (!text.empty())
            return text;
    }
    return {};
}

bool UiNode::Perform(NodeAction action) const
{
    if (!Valid())
        return false;
    return tree_->PerformAction(ref_, action);
}

void UiNode::Release() noexcept
{
    if (ref_ == kNullNode || !tree_)
        return;

    const NodeRef ref = std::exchange(ref_, kNullNode);
    info_.reset();
    try
    {
        tree_->Release(ref);
    }
    catch (const std::exception&)
    {
        // Handle already invalid on the platform side; nothing left to give back.
    }
    catch (...)
    {
        // Backends outside our control may throw anything; this runs in destructors.
    }
}

std::string UiNode::Describe() const
{
    if (!Valid())
        return "<null>";

    std::ostringstream oss;
    const auto& info = Info();
    oss << info.class_name;
    if (!info.view_id.empty())
        oss << " #" << info.view_id;
    if (!info.text.empty())
        oss << " \"" << info.text << "\"";
    oss << " [" << info.bounds.left << "," << info.bounds.top << "][" << info.bounds.right << ","
        << info.bounds.bottom << "]";
    if (info.clickable)
        oss << " clickable";
    if (!info.enabled)
        oss << " disabled";
    return oss.str();
}

NodeList AdoptAll(IUiTree* tree, const std::vector<NodeRef>& refs)
{
    NodeList nodes;
    nodes.reserve(refs.size());
    for (NodeRef ref : refs)
        nodes.emplace_back(tree, ref);
    return nodes;
}

} // namespace deskpilot
