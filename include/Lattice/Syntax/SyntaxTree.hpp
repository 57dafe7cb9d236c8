/// @file SyntaxTree.hpp
/// @brief Handle-indexed syntax tree produced by `Parser`.
///
/// Nodes are stored in one vector and refer to each other through `NodeId` handles. Child
/// lists are contiguous runs inside a shared handle vector. Text that cannot view the source
/// directly (decoded escapes, copies) lives in the tree's arena and dies with the tree.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Memory/Arena.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Text/Span.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Lattice::Syntax
{
    enum class NodeKind : UInt8
    {
        String,
        Number,
        Boolean,
        Null,
        Object,
        Array,
        Property,
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(NodeKind kind) noexcept;

    using NodeId                        = UInt32;
    inline constexpr NodeId InvalidNodeId = 0xFFFFFFFFu;

    /// @brief One tree node.
    ///
    /// - `text`: decoded string contents for `String`, the literal for `Number`.
    /// - `number`/`boolean`: payload of `Number`/`Boolean`.
    /// - `firstChild`/`childCount`: run inside the tree's child handles. Objects list
    ///   properties, arrays list elements, a property lists `[key, value]`.
    struct Node
    {
        NodeKind         kind {NodeKind::Null};
        Text::Span       span {};
        std::string_view text {};
        F64              number {0.0};
        bool             boolean {false};
        UInt32           firstChild {0};
        UInt32           childCount {0};
    };

    class LATTICE_API SyntaxTree
    {
    public:
        explicit SyntaxTree(UIntSize arenaChunkBytes = Memory::Arena::DefaultChunkBytes, UIntSize arenaLimitBytes = 0) noexcept
            : m_arena(arenaChunkBytes, arenaLimitBytes)
        {
        }

        SyntaxTree(const SyntaxTree&)            = delete;
        SyntaxTree& operator=(const SyntaxTree&) = delete;
        SyntaxTree(SyntaxTree&&) noexcept            = default;
        SyntaxTree& operator=(SyntaxTree&&) noexcept = default;
        ~SyntaxTree()                                = default;

        [[nodiscard]] NodeId Root() const noexcept { return m_root; }

        [[nodiscard]] const Node& GetNode(NodeId id) const noexcept { return m_nodes[id]; }

        [[nodiscard]] std::span<const NodeId> Children(NodeId id) const noexcept
        {
            const Node& node = m_nodes[id];
            return std::span<const NodeId>(m_children.data() + node.firstChild, node.childCount);
        }

        /// @brief Key node of a `Property`.
        [[nodiscard]] NodeId PropertyKey(NodeId property) const noexcept { return Children(property)[0]; }

        /// @brief Value node of a `Property`.
        [[nodiscard]] NodeId PropertyValue(NodeId property) const noexcept { return Children(property)[1]; }

        /// @brief Value of the last member of `object` named `key`, or `InvalidNodeId`.
        [[nodiscard]] NodeId FindMember(NodeId object, std::string_view key) const noexcept;

        [[nodiscard]] UIntSize NodeCount() const noexcept { return m_nodes.size(); }

        [[nodiscard]] Memory::Arena&       GetArena() noexcept { return m_arena; }
        [[nodiscard]] const Memory::Arena& GetArena() const noexcept { return m_arena; }

        /// @brief Keeps `source` alive as long as the tree; returns a view of the stored text.
        std::string_view AdoptSource(std::string source);

        /// @brief Takes ownership of an already allocated buffer without moving its bytes.
        std::string_view AdoptSource(std::unique_ptr<std::string> source) noexcept;

        [[nodiscard]] std::string_view Source() const noexcept
        {
            return m_source ? std::string_view(*m_source) : std::string_view {};
        }

        // Builder interface used by the parser.
        NodeId AddNode(const Node& node);
        UInt32 AddChildren(std::span<const NodeId> children);
        void   SetRoot(NodeId root) noexcept { m_root = root; }
        Node&  MutableNode(NodeId id) noexcept { return m_nodes[id]; }

    private:
        std::vector<Node>            m_nodes {};
        std::vector<NodeId>          m_children {};
        NodeId                       m_root {InvalidNodeId};
        Memory::Arena                m_arena;
        std::unique_ptr<std::string> m_source {};
    };

    /// @brief Compares shape, kinds, keys and scalar values; spans and arenas are ignored.
    [[nodiscard]] LATTICE_API bool StructurallyEqual(const SyntaxTree& a, const SyntaxTree& b);
}// namespace Lattice::Syntax
