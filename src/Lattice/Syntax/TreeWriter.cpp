#include <Lattice/Syntax/TreeWriter.hpp>

#include <Lattice/Syntax/Escapes.hpp>
#include <Lattice/Syntax/Identifier.hpp>
#include <Lattice/Syntax/NumberText.hpp>

#include <cmath>
#include <format>

namespace Lattice::Syntax
{
    namespace
    {
        void AppendNumber(Grammar grammar, F64 value, std::string& out)
        {
            if (std::isnan(value))
            {
                out += grammar == Grammar::Zon ? "nan" : "null";
                return;
            }
            // JSON has no infinity literal; an out-of-range exponent reads back as the same infinity.
            if (std::isinf(value))
            {
                if (grammar == Grammar::Json)
                    out += value < 0 ? "-1e999" : "1e999";
                else
                    out += value < 0 ? "-inf" : "inf";
                return;
            }
            if (value == std::trunc(value) && std::fabs(value) <= static_cast<F64>(MaxExactInteger))
            {
                out += std::format("{}", static_cast<Int64>(value));
                return;
            }
            out += std::format("{}", value);
        }

        class Writer
        {
        public:
            Writer(const SyntaxTree& tree, Grammar grammar) noexcept
                : m_tree(tree)
                , m_grammar(grammar)
            {
            }

            void Write(NodeId id, std::string& out) const
            {
                const Node& node = m_tree.GetNode(id);
                switch (node.kind)
                {
                    case NodeKind::String:
                        AppendQuoted(m_grammar, node.text, out);
                        break;
                    case NodeKind::Number:
                        AppendNumber(m_grammar, node.number, out);
                        break;
                    case NodeKind::Boolean:
                        out += node.boolean ? "true" : "false";
                        break;
                    case NodeKind::Null:
                        out += "null";
                        break;
                    case NodeKind::Object:
                        WriteObject(id, out);
                        break;
                    case NodeKind::Array:
                        WriteArray(id, out);
                        break;
                    case NodeKind::Property:
                        WriteProperty(id, out);
                        break;
                }
            }

        private:
            void WriteObject(NodeId id, std::string& out) const
            {
                out += m_grammar == Grammar::Zon ? ".{" : "{";
                bool first = true;
                for (const NodeId property : m_tree.Children(id))
                {
                    if (!first)
                        out.push_back(',');
                    first = false;
                    WriteProperty(property, out);
                }
                out.push_back('}');
            }

            void WriteArray(NodeId id, std::string& out) const
            {
                out += m_grammar == Grammar::Zon ? ".{" : "[";
                bool first = true;
                for (const NodeId element : m_tree.Children(id))
                {
                    if (!first)
                        out.push_back(',');
                    first = false;
                    Write(element, out);
                }
                out.push_back(m_grammar == Grammar::Zon ? '}' : ']');
            }

            void WriteProperty(NodeId id, std::string& out) const
            {
                const std::string_view key = m_tree.GetNode(m_tree.PropertyKey(id)).text;
                if (m_grammar == Grammar::Zon)
                {
                    out.push_back('.');
                    AppendIdentifier(key, out);
                    out.push_back('=');
                }
                else
                {
                    AppendQuoted(Grammar::Json, key, out);
                    out.push_back(':');
                }
                Write(m_tree.PropertyValue(id), out);
            }

            const SyntaxTree& m_tree;
            Grammar           m_grammar;
        };
    }// namespace

    std::string WriteTree(const SyntaxTree& tree, Grammar grammar)
    {
        std::string out;
        if (tree.Root() == InvalidNodeId)
            return out;
        Writer(tree, grammar).Write(tree.Root(), out);
        return out;
    }

    std::string WriteJson(const SyntaxTree& tree)
    {
        return WriteTree(tree, Grammar::Json);
    }

    std::string WriteZon(const SyntaxTree& tree)
    {
        return WriteTree(tree, Grammar::Zon);
    }
}// namespace Lattice::Syntax
