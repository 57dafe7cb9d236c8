#pragma once

#include <Lattice/Lint/Rule.hpp>
#include <Lattice/Text/Span.hpp>

#include <string>

namespace Lattice::Lint
{
    /// @brief One rule violation found by the linter.
    struct Diagnostic
    {
        RuleType    rule {RuleType::SyntaxError};
        std::string message {};
        Severity    severity {Severity::Error};
        Text::Span  range {};
    };
}// namespace Lattice::Lint
