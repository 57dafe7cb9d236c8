/// @file Token.hpp
/// @brief Token kinds, flags and lexical error codes shared by every token producer.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Text/Span.hpp>

#include <string_view>

namespace Lattice::Syntax
{
    using Text::Span;

    /// @brief Closed set of token kinds produced by the lexers.
    ///
    /// `Whitespace` and `Comment` are trivia; `Continuation` is reserved for producers that
    /// split a logical token and is skipped by every consumer.
    enum class TokenKind : UInt8
    {
        String,
        Number,
        True,
        False,
        Null,
        ObjectStart,
        ObjectEnd,
        ArrayStart,
        ArrayEnd,
        Comma,
        Colon,
        PropertyName,
        Whitespace,
        Comment,
        Error,
        Eof,
        Continuation,
    };

    /// @brief Why the lexer produced an `Error` token.
    enum class LexErrorCode : UInt8
    {
        None,
        UnexpectedCharacter,
        InvalidLiteral,
        UnterminatedString,
        InvalidEscape,
        InvalidUnicodeEscape,
        ControlCharacter,
        LeadingZero,
        MalformedNumber,
        UnterminatedComment,
        CommentNotAllowed,
        NestingTooDeep,
    };

    /// @brief Bit flags attached to tokens by the lexers.
    namespace TokenFlags
    {
        inline constexpr UInt16 None         = 0;
        inline constexpr UInt16 HasEscapes   = 1u << 0;
        inline constexpr UInt16 Float        = 1u << 1;
        inline constexpr UInt16 Negative     = 1u << 2;
        inline constexpr UInt16 Exponent     = 1u << 3;
        inline constexpr UInt16 RadixPrefix  = 1u << 4;
        inline constexpr UInt16 Multiline    = 1u << 5;
        inline constexpr UInt16 EnumLiteral  = 1u << 6;
        inline constexpr UInt16 QuotedField  = 1u << 7;
        inline constexpr UInt16 BlockComment = 1u << 8;
        inline constexpr UInt16 CharLiteral  = 1u << 9;
    }// namespace TokenFlags

    struct Token
    {
        TokenKind    kind {TokenKind::Eof};
        Span         span {};
        UInt16       flags {TokenFlags::None};
        LexErrorCode error {LexErrorCode::None};

        [[nodiscard]] constexpr bool Has(UInt16 flag) const noexcept { return (flags & flag) != 0; }

        [[nodiscard]] constexpr bool IsTrivia() const noexcept
        {
            return kind == TokenKind::Whitespace || kind == TokenKind::Comment;
        }

        /// @brief Tokens that structural consumers step over.
        [[nodiscard]] constexpr bool IsSkippable() const noexcept
        {
            return IsTrivia() || kind == TokenKind::Continuation;
        }

        [[nodiscard]] constexpr bool IsValueStart() const noexcept
        {
            switch (kind)
            {
                case TokenKind::String:
                case TokenKind::Number:
                case TokenKind::True:
                case TokenKind::False:
                case TokenKind::Null:
                case TokenKind::ObjectStart:
                case TokenKind::ArrayStart:
                    return true;
                default:
                    return false;
            }
        }

        [[nodiscard]] constexpr std::string_view Text(std::string_view source) const noexcept
        {
            return span.Slice(source);
        }

        friend constexpr bool operator==(const Token&, const Token&) noexcept = default;
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(TokenKind kind) noexcept;
    [[nodiscard]] LATTICE_API std::string_view ToString(LexErrorCode code) noexcept;
}// namespace Lattice::Syntax
