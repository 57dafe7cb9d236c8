#pragma once

#include <Lattice/Syntax/Grammar.hpp>

#include <string>
#include <string_view>

namespace Lattice::IO
{
    /// @brief A file's path together with its full contents.
    struct SourceFile
    {
        std::string path {};
        std::string contents {};

        [[nodiscard]] std::string_view Text() const noexcept { return contents; }

        /// @brief Grammar implied by the file extension.
        [[nodiscard]] Syntax::Grammar DetectGrammar() const noexcept { return Syntax::GrammarFromPath(path); }
    };
}// namespace Lattice::IO
