/// @file SymbolExtractor.hpp
/// @brief Flat, path-named outline of a parsed document.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>
#include <Lattice/Text/Span.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Lattice::Analysis
{
    enum class SymbolKind : UInt8
    {
        Object,
        Array,
        Property,///< Scalar value of an object member.
        Element, ///< Scalar element of an array.
        Value,   ///< Scalar document root.
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(SymbolKind kind) noexcept;

    /// @brief One outline entry.
    ///
    /// `name` is the dotted member path with `[i]` for array indices (`servers[0].host`);
    /// the document root is named `root`. `signature` is the value's type name.
    struct Symbol
    {
        std::string name;
        SymbolKind  kind {SymbolKind::Value};
        Text::Span  range {};
        std::string signature;
    };

    /// @brief Lists every value of `tree` in document order.
    [[nodiscard]] LATTICE_API std::vector<Symbol> ExtractSymbols(const Syntax::SyntaxTree& tree);
}// namespace Lattice::Analysis
