/// @file JsonLexer.hpp
/// @brief Single-pass tokenizer for JSON text.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/ContextStack.hpp>
#include <Lattice/Syntax/SourceCursor.hpp>
#include <Lattice/Syntax/Token.hpp>

#include <optional>
#include <string_view>

namespace Lattice::Syntax
{
    struct LexerOptions
    {
        /// @brief Lex `//` and `/* */` comments as trivia instead of errors (JSON only).
        bool allowComments {false};
    };

    /// @brief Produces JSON tokens, including trivia, covering every byte of the input.
    ///
    /// The lexer never fails: malformed input becomes `Error` tokens and scanning resumes
    /// right after them. It keeps no heap state, so copying one is cheap.
    class LATTICE_API JsonLexer
    {
    public:
        explicit JsonLexer(std::string_view source, const LexerOptions& options = {}) noexcept
            : m_cursor(source)
            , m_options(options)
        {
        }

        /// @brief Next token; `Eof` is returned once, then nullopt forever.
        [[nodiscard]] std::optional<Token> Next() noexcept;

        /// @brief Position of the next unread byte.
        [[nodiscard]] Text::SourceLocation Location() const noexcept { return m_cursor.Location(); }

        [[nodiscard]] std::string_view Source() const noexcept { return m_cursor.Source(); }

    private:
        [[nodiscard]] Token Finish(TokenKind kind, UInt32 start, UInt32 end, UInt16 flags = TokenFlags::None) noexcept;
        [[nodiscard]] Token Fail(LexErrorCode code, UInt32 start, UInt32 end) noexcept;

        [[nodiscard]] Token ScanWhitespace(UInt32 start) noexcept;
        [[nodiscard]] Token ScanString(UInt32 start) noexcept;
        [[nodiscard]] Token ScanNumber(UInt32 start) noexcept;
        [[nodiscard]] Token ScanWord(UInt32 start) noexcept;
        [[nodiscard]] Token ScanComment(UInt32 start) noexcept;
        [[nodiscard]] Token ScanUnexpected(UInt32 start) noexcept;

        SourceCursor m_cursor;
        LexerOptions m_options;
        ContextStack m_context {};
        bool         m_expectKey {false};
        bool         m_finished {false};
    };
}// namespace Lattice::Syntax
