#include <Lattice/Analysis/SymbolExtractor.hpp>

#include <format>
#include <utility>

namespace Lattice::Analysis
{
    std::string_view ToString(SymbolKind kind) noexcept
    {
        switch (kind)
        {
            case SymbolKind::Object:
                return "object";
            case SymbolKind::Array:
                return "array";
            case SymbolKind::Property:
                return "property";
            case SymbolKind::Element:
                return "element";
            case SymbolKind::Value:
                return "value";
        }
        return "unknown";
    }

    std::vector<Symbol> ExtractSymbols(const Syntax::SyntaxTree& tree)
    {
        using Syntax::NodeId;
        using Syntax::NodeKind;

        std::vector<Symbol> symbols;
        if (tree.Root() == Syntax::InvalidNodeId)
            return symbols;

        struct Visit
        {
            NodeId      id;
            std::string path;
            SymbolKind  scalarKind;
        };

        std::vector<Visit> work;
        work.push_back(Visit {tree.Root(), std::string {}, SymbolKind::Value});
        while (!work.empty())
        {
            Visit visit = std::move(work.back());
            work.pop_back();

            const Syntax::Node& node = tree.GetNode(visit.id);
            Symbol              symbol;
            symbol.name      = visit.path.empty() ? std::string("root") : visit.path;
            symbol.range     = node.span;
            symbol.signature = std::string(Syntax::ToString(node.kind));

            switch (node.kind)
            {
                case NodeKind::Object: {
                    symbol.kind           = SymbolKind::Object;
                    const auto properties = tree.Children(visit.id);
                    for (auto it = properties.rbegin(); it != properties.rend(); ++it)
                    {
                        const std::string_view key = tree.GetNode(tree.PropertyKey(*it)).text;
                        std::string path = visit.path.empty() ? std::string(key) : std::format("{}.{}", visit.path, key);
                        work.push_back(Visit {tree.PropertyValue(*it), std::move(path), SymbolKind::Property});
                    }
                    break;
                }
                case NodeKind::Array: {
                    symbol.kind         = SymbolKind::Array;
                    const auto elements = tree.Children(visit.id);
                    for (UIntSize i = elements.size(); i > 0; --i)
                        work.push_back(Visit {elements[i - 1], std::format("{}[{}]", visit.path, i - 1), SymbolKind::Element});
                    break;
                }
                default:
                    symbol.kind = visit.scalarKind;
                    break;
            }
            symbols.push_back(std::move(symbol));
        }
        return symbols;
    }
}// namespace Lattice::Analysis
