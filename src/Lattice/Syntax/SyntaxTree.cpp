#include <Lattice/Syntax/SyntaxTree.hpp>

#include <cmath>
#include <utility>

namespace Lattice::Syntax
{
    std::string_view ToString(NodeKind kind) noexcept
    {
        switch (kind)
        {
            case NodeKind::String:
                return "string";
            case NodeKind::Number:
                return "number";
            case NodeKind::Boolean:
                return "boolean";
            case NodeKind::Null:
                return "null";
            case NodeKind::Object:
                return "object";
            case NodeKind::Array:
                return "array";
            case NodeKind::Property:
                return "property";
        }
        return "unknown";
    }

    NodeId SyntaxTree::FindMember(NodeId object, std::string_view key) const noexcept
    {
        if (object >= m_nodes.size() || m_nodes[object].kind != NodeKind::Object)
            return InvalidNodeId;

        const auto properties = Children(object);
        for (auto it = properties.rbegin(); it != properties.rend(); ++it)
        {
            if (m_nodes[PropertyKey(*it)].text == key)
                return PropertyValue(*it);
        }
        return InvalidNodeId;
    }

    std::string_view SyntaxTree::AdoptSource(std::string source)
    {
        return AdoptSource(std::make_unique<std::string>(std::move(source)));
    }

    std::string_view SyntaxTree::AdoptSource(std::unique_ptr<std::string> source) noexcept
    {
        m_source = std::move(source);
        return Source();
    }

    NodeId SyntaxTree::AddNode(const Node& node)
    {
        m_nodes.push_back(node);
        return static_cast<NodeId>(m_nodes.size() - 1);
    }

    UInt32 SyntaxTree::AddChildren(std::span<const NodeId> children)
    {
        const auto first = static_cast<UInt32>(m_children.size());
        m_children.insert(m_children.end(), children.begin(), children.end());
        return first;
    }

    bool StructurallyEqual(const SyntaxTree& a, const SyntaxTree& b)
    {
        if (a.Root() == InvalidNodeId || b.Root() == InvalidNodeId)
            return a.Root() == b.Root();

        std::vector<std::pair<NodeId, NodeId>> pending;
        pending.emplace_back(a.Root(), b.Root());

        while (!pending.empty())
        {
            const auto [left, right] = pending.back();
            pending.pop_back();

            const Node& x = a.GetNode(left);
            const Node& y = b.GetNode(right);
            if (x.kind != y.kind || x.childCount != y.childCount)
                return false;

            switch (x.kind)
            {
                case NodeKind::String:
                    if (x.text != y.text)
                        return false;
                    break;
                case NodeKind::Number:
                    if (x.number != y.number && !(std::isnan(x.number) && std::isnan(y.number)))
                        return false;
                    break;
                case NodeKind::Boolean:
                    if (x.boolean != y.boolean)
                        return false;
                    break;
                default:
                    break;
            }

            const auto leftChildren  = a.Children(left);
            const auto rightChildren = b.Children(right);
            for (UIntSize i = leftChildren.size(); i-- > 0;)
                pending.emplace_back(leftChildren[i], rightChildren[i]);
        }
        return true;
    }
}// namespace Lattice::Syntax
