#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Surface grammars understood by the lexers and the parser.
    enum class Grammar : UInt8
    {
        Json,
        Zon,
    };

    [[nodiscard]] constexpr std::string_view ToString(Grammar grammar) noexcept
    {
        switch (grammar)
        {
            case Grammar::Json:
                return "json";
            case Grammar::Zon:
                return "zon";
        }
        return "unknown";
    }

    /// @brief Picks the grammar from a file name: `.zon` selects ZON, everything else JSON.
    [[nodiscard]] constexpr Grammar GrammarFromPath(std::string_view path) noexcept
    {
        return path.ends_with(".zon") ? Grammar::Zon : Grammar::Json;
    }
}// namespace Lattice::Syntax
