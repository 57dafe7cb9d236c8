/// @file ZonLexer.hpp
/// @brief Single-pass tokenizer for ZON, the `.{ .field = value }` configuration format.
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
    /// @brief Produces ZON tokens mapped onto the shared token vocabulary.
    ///
    /// - `.{` opens an object when its first entry is `.name =` (or it is empty), an array otherwise.
    /// - `.name` / `.@"name"` in field position is a `PropertyName`; elsewhere an enum-literal `String`.
    /// - `=` is reported as `Colon`.
    /// - `undefined` is reported as `Null`.
    class LATTICE_API ZonLexer
    {
    public:
        explicit ZonLexer(std::string_view source) noexcept
            : m_cursor(source)
        {
        }

        /// @brief Next token; `Eof` is returned once, then nullopt forever.
        [[nodiscard]] std::optional<Token> Next() noexcept;

        [[nodiscard]] Text::SourceLocation Location() const noexcept { return m_cursor.Location(); }

        [[nodiscard]] std::string_view Source() const noexcept { return m_cursor.Source(); }

    private:
        [[nodiscard]] Token Finish(TokenKind kind, UInt32 start, UInt32 end, UInt16 flags = TokenFlags::None) noexcept;
        [[nodiscard]] Token Fail(LexErrorCode code, UInt32 start, UInt32 end) noexcept;

        [[nodiscard]] Token ScanDot(UInt32 start) noexcept;
        [[nodiscard]] Token ScanString(UInt32 start) noexcept;
        [[nodiscard]] Token ScanMultilineString(UInt32 start) noexcept;
        [[nodiscard]] Token ScanCharLiteral(UInt32 start) noexcept;
        [[nodiscard]] Token ScanNumber(UInt32 start) noexcept;
        [[nodiscard]] Token ScanWord(UInt32 start) noexcept;

        /// @brief Scans a quoted literal body starting after the opening `quote`.
        ///
        /// @return Offset just past the closing quote, with `error`/`flags` filled in.
        [[nodiscard]] UInt32 ScanQuoted(UInt32 bodyStart, char quote, UInt16& flags, LexErrorCode& error) const noexcept;

        /// @brief Decides whether the `.{` ending at `offset` opens a struct.
        [[nodiscard]] bool OpensStruct(UInt32 offset) const noexcept;

        [[nodiscard]] UInt32 SkipTrivia(UInt32 offset) const noexcept;

        SourceCursor m_cursor;
        ContextStack m_context {};
        bool         m_expectField {false};
        bool         m_finished {false};
    };
}// namespace Lattice::Syntax
