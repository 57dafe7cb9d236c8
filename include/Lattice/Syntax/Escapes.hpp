/// @file Escapes.hpp
/// @brief Extraction and decoding of string-literal contents for both grammars.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/Token.hpp>

#include <string>
#include <string_view>

namespace Lattice::Syntax
{
    enum class DecodeStatus : UInt8
    {
        Ok,
        InvalidEscape,
        InvalidUnicodeEscape,
    };

    /// @brief Raw body of a string-like token: the text between the quotes, the name after a
    /// leading `.`, or the whole token for multiline strings.
    [[nodiscard]] LATTICE_API std::string_view LiteralBody(std::string_view tokenText, const Token& token) noexcept;

    /// @brief Upper bound on the decoded size of `body`; decoding never grows the text.
    [[nodiscard]] constexpr UIntSize DecodedCapacity(std::string_view body) noexcept { return body.size(); }

    /// @brief Decodes the escape sequences of `body` into `out`.
    ///
    /// `out` must provide at least `DecodedCapacity(body)` bytes. On success `written` holds the
    /// decoded length. Multiline ZON strings are joined with `\n` between lines.
    [[nodiscard]] LATTICE_API DecodeStatus DecodeLiteral(Grammar grammar,
                                                         std::string_view body,
                                                         const Token& token,
                                                         char* out,
                                                         UIntSize& written) noexcept;

    /// @brief Convenience wrapper decoding into a `std::string`.
    [[nodiscard]] LATTICE_API DecodeStatus DecodeLiteral(Grammar grammar, std::string_view body, const Token& token, std::string& out);

    /// @brief Checks escapes without producing output.
    [[nodiscard]] LATTICE_API DecodeStatus ValidateEscapes(Grammar grammar, std::string_view body) noexcept;

    /// @brief Appends `text` to `out` as a quoted literal of `grammar`, escaping as needed.
    LATTICE_API void AppendQuoted(Grammar grammar, std::string_view text, std::string& out);
}// namespace Lattice::Syntax
