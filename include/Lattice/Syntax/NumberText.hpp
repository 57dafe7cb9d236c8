/// @file NumberText.hpp
/// @brief Conversion of lexed number tokens to `F64`.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/Grammar.hpp>

#include <optional>
#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Largest integer magnitude an `F64` represents exactly (2^53 - 1).
    inline constexpr UInt64 MaxExactInteger = 9007199254740991ULL;

    /// @brief Converts the text of a `Number` token to its value.
    ///
    /// JSON text must follow the RFC 8259 number grammar. ZON text may additionally use `_`
    /// separators, `0x`/`0o`/`0b` prefixes, `inf`, `-inf`, `nan`, and character literals
    /// (flagged with `TokenFlags::CharLiteral`), whose value is the code point.
    ///
    /// @return nullopt when the text is not a well-formed number of `grammar`.
    [[nodiscard]] LATTICE_API std::optional<F64> ParseNumberText(Grammar grammar, std::string_view text, UInt16 flags);

    /// @brief Count of digits after the decimal point, ignoring any exponent.
    [[nodiscard]] LATTICE_API UInt32 FractionDigits(std::string_view text) noexcept;
}// namespace Lattice::Syntax
