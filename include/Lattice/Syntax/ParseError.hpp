#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Text/Span.hpp>

#include <string>
#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Why `Parser::Parse` rejected its input.
    ///
    /// `OutOfMemory` and `ReadFailed` describe infrastructure failures; every other code
    /// describes the text itself.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedToken,
        InvalidToken,
        InvalidNumber,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        InvalidEncoding,
        MissingValue,
        MissingSeparator,
        TrailingComma,
        CommentNotAllowed,
        DepthExceeded,
        TrailingCharacters,
        OutOfMemory,
        ReadFailed,
    };

    /// @brief Parsing error payload with code, offending span, location, and message.
    struct ParseError
    {
        ParseErrorCode       code {ParseErrorCode::None};
        Text::Span           span {};
        Text::SourceLocation location {};
        std::string          message {};
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(ParseErrorCode code) noexcept;
}// namespace Lattice::Syntax
