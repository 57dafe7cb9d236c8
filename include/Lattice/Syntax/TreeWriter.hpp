#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>

#include <string>

namespace Lattice::Syntax
{
    /// @brief Compact JSON text for `tree`. Infinities are written as `1e999` / `-1e999` and NaN as `null`.
    [[nodiscard]] LATTICE_API std::string WriteJson(const SyntaxTree& tree);

    /// @brief Compact ZON text for `tree`. Field names that are not plain identifiers use `.@"..."`.
    [[nodiscard]] LATTICE_API std::string WriteZon(const SyntaxTree& tree);

    [[nodiscard]] LATTICE_API std::string WriteTree(const SyntaxTree& tree, Grammar grammar);
}// namespace Lattice::Syntax
