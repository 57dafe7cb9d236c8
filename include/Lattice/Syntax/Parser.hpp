#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IByteReader.hpp>
#include <Lattice/Logging/Logger.hpp>
#include <Lattice/Memory/Arena.hpp>
#include <Lattice/Syntax/ContextStack.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/ParseError.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>
#include <Lattice/Syntax/TokenStream.hpp>
#include <Lattice/Utilities/Expected.hpp>

#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Parser configuration.
    struct ParseOptions
    {
        /// Values above `ContextStack::Capacity` are capped to it.
        UInt32   maxDepth {ContextStack::Capacity};
        bool     copyStrings {false};
        bool     allowComments {false};
        bool     allowTrailingCommas {false};
        bool     validateUtf8 {true};
        UIntSize arenaChunkBytes {Memory::Arena::DefaultChunkBytes};
        UIntSize arenaLimitBytes {0};

        const Logging::Logger* logger {nullptr};
    };

    /// @brief Recursive-descent parser producing a `SyntaxTree`.
    ///
    /// Parsing stops at the first structural error; no partial tree is returned. ZON input
    /// always accepts comments and trailing commas. Unless `copyStrings` is set, strings without
    /// escapes view `source`, which must then outlive the tree.
    class LATTICE_API Parser
    {
    public:
        static Utilities::Expected<SyntaxTree, ParseError>
        Parse(std::string_view source, Grammar grammar, const ParseOptions& options = {});

        /// @brief Parses tokens pulled from `tokens`; spans in those tokens index into `source`.
        static Utilities::Expected<SyntaxTree, ParseError>
        Parse(std::string_view source, TokenStream& tokens, Grammar grammar, const ParseOptions& options = {});

        /// @brief Reads `reader` to completion and parses the bytes; the tree keeps them alive.
        static Utilities::Expected<SyntaxTree, ParseError>
        Parse(IO::IByteReader& reader, Grammar grammar, const ParseOptions& options = {});
    };
}// namespace Lattice::Syntax
