/// @file Linter.hpp
/// @brief Streaming linter that validates JSON and ZON directly from tokens.
///
/// The linter never builds a syntax tree: it walks the token stream once, tracking per-object
/// key sets and per-array element counts for the containers currently open. Only enabled
/// rules are evaluated. Diagnostics are returned sorted by their start offset.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Lint/Diagnostic.hpp>
#include <Lattice/Lint/Rule.hpp>
#include <Lattice/Logging/Logger.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/TokenStream.hpp>

#include <string_view>
#include <vector>

namespace Lattice::Lint
{
    struct LinterOptions
    {
        /// Values above `Syntax::ContextStack::Capacity` are capped to it.
        UInt32 maxDepth {100};
        UInt32 maxStringLength {65536};
        UInt32 maxNumberPrecision {15};
        UInt32 maxObjectKeys {10000};
        UInt32 maxArrayElements {100000};
        UInt32 warnOnDeepNesting {20};
        bool   allowDuplicateKeys {false};
        bool   allowLeadingZeros {false};
        bool   allowComments {false};

        const Logging::Logger* logger {nullptr};
    };

    class LATTICE_API Linter
    {
    public:
        explicit Linter(const LinterOptions& options = {}) noexcept
            : m_options(options)
        {
        }

        [[nodiscard]] std::vector<Diagnostic>
        Lint(std::string_view source, Syntax::Grammar grammar, const EnabledRules& rules = EnabledRules::Defaults()) const;

        /// @brief Lints tokens pulled from `tokens`; their spans index into `source`.
        [[nodiscard]] std::vector<Diagnostic> Lint(std::string_view source,
                                                   Syntax::TokenStream& tokens,
                                                   Syntax::Grammar grammar,
                                                   const EnabledRules& rules = EnabledRules::Defaults()) const;

        [[nodiscard]] const LinterOptions& Options() const noexcept { return m_options; }

    private:
        LinterOptions m_options;
    };
}// namespace Lattice::Lint
