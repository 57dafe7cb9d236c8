#include <Lattice/Syntax/ZonLexer.hpp>

#include "LexerCommon.hpp"

#include <algorithm>

namespace Lattice::Syntax
{
    namespace
    {
        [[nodiscard]] bool IsRadixDigit(char c, UInt32 radix) noexcept
        {
            if (radix == 16)
                return Text::IsHexDigit(c);
            if (radix == 8)
                return c >= '0' && c <= '7';
            return c == '0' || c == '1';
        }

        /// @brief Underscores must sit between two digits.
        [[nodiscard]] bool HasValidSeparators(std::string_view text, UInt32 radix) noexcept
        {
            for (UIntSize i = 0; i < text.size(); ++i)
            {
                if (text[i] != '_')
                    continue;
                if (i == 0 || i + 1 >= text.size())
                    return false;
                if (!IsRadixDigit(text[i - 1], radix) || !IsRadixDigit(text[i + 1], radix))
                    return false;
            }
            return true;
        }
    }// namespace

    std::optional<Token> ZonLexer::Next() noexcept
    {
        if (m_finished)
            return std::nullopt;

        const UInt32 start = m_cursor.Offset();
        if (m_cursor.IsEof())
        {
            m_finished = true;
            return Token {TokenKind::Eof, Span {start, start}};
        }

        const char c = m_cursor.Peek();
        switch (c)
        {
            case ' ':
            case '\t':
            case '\n':
            case '\r':
                return Finish(TokenKind::Whitespace, start, detail::SkipWhitespace(m_cursor.Source(), start));
            case '/':
                if (m_cursor.Peek(1) == '/')
                    return Finish(TokenKind::Comment, start, detail::LineEnd(m_cursor.Source(), start + 2));
                m_expectField = false;
                return Fail(LexErrorCode::UnexpectedCharacter, start, start + 1);
            case '.':
                return ScanDot(start);
            case '}': {
                const bool closesArray = m_context.Top() == ContextStack::Context::Array;
                m_context.Pop();
                m_expectField = false;
                return Finish(closesArray ? TokenKind::ArrayEnd : TokenKind::ObjectEnd, start, start + 1);
            }
            case ',':
                m_expectField = m_context.Top() == ContextStack::Context::Object;
                return Finish(TokenKind::Comma, start, start + 1);
            case '=':
                m_expectField = false;
                return Finish(TokenKind::Colon, start, start + 1);
            case '"':
                return ScanString(start);
            case '\'':
                return ScanCharLiteral(start);
            case '\\':
                if (m_cursor.Peek(1) == '\\')
                    return ScanMultilineString(start);
                break;
            default:
                break;
        }

        if (c == '-' || Text::IsDigit(c))
            return ScanNumber(start);
        if (detail::IsIdentifierStart(c))
            return ScanWord(start);

        m_expectField = false;
        return Fail(LexErrorCode::UnexpectedCharacter, start, detail::UnexpectedEnd(m_cursor.Source(), start));
    }

    Token ZonLexer::Finish(TokenKind kind, UInt32 start, UInt32 end, UInt16 flags) noexcept
    {
        m_cursor.AdvanceTo(end);
        return Token {kind, Span {start, end}, flags, LexErrorCode::None};
    }

    Token ZonLexer::Fail(LexErrorCode code, UInt32 start, UInt32 end) noexcept
    {
        m_cursor.AdvanceTo(end);
        return Token {TokenKind::Error, Span {start, end}, TokenFlags::None, code};
    }

    Token ZonLexer::ScanDot(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        const char             next   = m_cursor.Peek(1);

        if (next == '{')
        {
            const bool isStruct = OpensStruct(start + 2);
            if (!m_context.Push(isStruct ? ContextStack::Context::Object : ContextStack::Context::Array))
            {
                m_expectField = false;
                return Fail(LexErrorCode::NestingTooDeep, start, start + 2);
            }
            m_expectField = isStruct;
            return Finish(isStruct ? TokenKind::ObjectStart : TokenKind::ArrayStart, start, start + 2);
        }

        const bool      isField = m_expectField;
        const TokenKind kind    = isField ? TokenKind::PropertyName : TokenKind::String;
        const UInt16    role    = isField ? TokenFlags::None : TokenFlags::EnumLiteral;
        m_expectField           = false;

        if (detail::IsIdentifierStart(next))
            return Finish(kind, start, detail::SkipIdentifier(source, start + 1), role);

        if (next == '@' && m_cursor.Peek(2) == '"')
        {
            UInt16       flags = TokenFlags::QuotedField | role;
            LexErrorCode error = LexErrorCode::None;
            const UInt32 end   = ScanQuoted(start + 3, '"', flags, error);
            if (error != LexErrorCode::None)
                return Fail(error, start, end);
            return Finish(kind, start, end, flags);
        }

        return Fail(LexErrorCode::UnexpectedCharacter, start, start + 1);
    }

    Token ZonLexer::ScanString(UInt32 start) noexcept
    {
        m_expectField = false;
        UInt16       flags = TokenFlags::None;
        LexErrorCode error = LexErrorCode::None;
        const UInt32 end   = ScanQuoted(start + 1, '"', flags, error);
        if (error != LexErrorCode::None)
            return Fail(error, start, end);
        return Finish(TokenKind::String, start, end, flags);
    }

    Token ZonLexer::ScanMultilineString(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        m_expectField                 = false;

        UInt32 end = detail::LineEnd(source, start);
        while (true)
        {
            const UInt32 next = detail::SkipWhitespace(source, end);
            if (m_cursor.At(next) != '\\' || m_cursor.At(next + 1) != '\\')
                break;
            end = detail::LineEnd(source, next);
        }
        return Finish(TokenKind::String, start, end, TokenFlags::Multiline);
    }

    Token ZonLexer::ScanCharLiteral(UInt32 start) noexcept
    {
        m_expectField = false;
        UInt16       flags = TokenFlags::CharLiteral;
        LexErrorCode error = LexErrorCode::None;
        const UInt32 end   = ScanQuoted(start + 1, '\'', flags, error);
        if (error != LexErrorCode::None)
            return Fail(error, start, end);
        if (end - start <= 2)
            return Fail(LexErrorCode::InvalidLiteral, start, end);
        return Finish(TokenKind::Number, start, end, flags);
    }

    Token ZonLexer::ScanNumber(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        m_expectField                 = false;

        UInt16 flags       = TokenFlags::None;
        UInt32 pos         = start;
        bool   malformed   = false;
        bool   leadingZero = false;

        if (source[pos] == '-')
        {
            flags |= TokenFlags::Negative;
            ++pos;
        }

        if (source.substr(pos, 3) == "inf" && !detail::IsIdentifierChar(m_cursor.At(pos + 3)))
            return Finish(TokenKind::Number, start, pos + 3, flags | TokenFlags::Float);

        if (!Text::IsDigit(m_cursor.At(pos)))
            return Fail(LexErrorCode::MalformedNumber, start, std::max(pos, start + 1));

        const auto consume = [&](auto&& accept) {
            while (pos < source.size() && accept(source[pos]))
                ++pos;
        };
        const auto isDecimalPart = [](char c) { return Text::IsDigit(c) || c == '_'; };

        const char marker = m_cursor.At(pos + 1);
        if (source[pos] == '0' && (marker == 'x' || marker == 'o' || marker == 'b'))
        {
            const UInt32 radix = marker == 'x' ? 16 : (marker == 'o' ? 8 : 2);
            flags |= TokenFlags::RadixPrefix;
            pos += 2;
            const UInt32 digitsStart = pos;
            consume(detail::IsIdentifierChar);
            const std::string_view digits = source.substr(digitsStart, pos - digitsStart);
            malformed = digits.empty() || !HasValidSeparators(digits, radix) ||
                        !std::all_of(digits.begin(), digits.end(), [radix](char c) { return c == '_' || IsRadixDigit(c, radix); });
        }
        else
        {
            const UInt32 intStart = pos;
            consume(isDecimalPart);
            leadingZero = source[intStart] == '0' && pos > intStart + 1;

            if (m_cursor.At(pos) == '.' && Text::IsDigit(m_cursor.At(pos + 1)))
            {
                flags |= TokenFlags::Float;
                ++pos;
                consume(isDecimalPart);
            }
            if (m_cursor.At(pos) == 'e' || m_cursor.At(pos) == 'E')
            {
                flags |= TokenFlags::Exponent | TokenFlags::Float;
                ++pos;
                if (m_cursor.At(pos) == '+' || m_cursor.At(pos) == '-')
                    ++pos;
                if (!Text::IsDigit(m_cursor.At(pos)))
                    malformed = true;
                consume(isDecimalPart);
            }

            const std::string_view body = source.substr(intStart, pos - intStart);
            for (UIntSize i = 0; i < body.size() && !malformed; ++i)
            {
                if (body[i] != '_')
                    continue;
                malformed = i == 0 || i + 1 >= body.size() || !Text::IsDigit(body[i - 1]) || !Text::IsDigit(body[i + 1]);
            }
        }

        if (detail::IsIdentifierChar(m_cursor.At(pos)))
        {
            malformed = true;
            pos       = detail::SkipIdentifier(source, pos);
        }

        if (leadingZero)
            return Fail(LexErrorCode::LeadingZero, start, pos);
        if (malformed)
            return Fail(LexErrorCode::MalformedNumber, start, pos);
        return Finish(TokenKind::Number, start, pos, flags);
    }

    Token ZonLexer::ScanWord(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        const UInt32           end    = detail::SkipIdentifier(source, start);
        const std::string_view word   = source.substr(start, end - start);
        m_expectField                 = false;

        if (word == "true")
            return Finish(TokenKind::True, start, end);
        if (word == "false")
            return Finish(TokenKind::False, start, end);
        if (word == "null" || word == "undefined")
            return Finish(TokenKind::Null, start, end);
        if (word == "inf" || word == "nan")
            return Finish(TokenKind::Number, start, end, TokenFlags::Float);
        return Fail(LexErrorCode::InvalidLiteral, start, end);
    }

    UInt32 ZonLexer::ScanQuoted(UInt32 bodyStart, char quote, UInt16& flags, LexErrorCode& error) const noexcept
    {
        const std::string_view source = m_cursor.Source();
        const auto             size   = static_cast<UInt32>(source.size());
        UInt32                 pos    = bodyStart;

        const auto fail = [&](LexErrorCode code) {
            if (error == LexErrorCode::None)
                error = code;
        };

        while (true)
        {
            if (pos >= size)
            {
                error = LexErrorCode::UnterminatedString;
                return size;
            }

            const auto c = static_cast<unsigned char>(source[pos]);
            if (c == static_cast<unsigned char>(quote))
                return pos + 1;
            if (c == '\n' || c == '\r')
            {
                error = LexErrorCode::UnterminatedString;
                return pos;
            }
            if (c < 0x20 && c != '\t')
            {
                fail(LexErrorCode::ControlCharacter);
                ++pos;
                continue;
            }
            if (c != '\\')
            {
                ++pos;
                continue;
            }

            flags |= TokenFlags::HasEscapes;
            if (pos + 1 >= size)
            {
                error = LexErrorCode::UnterminatedString;
                return size;
            }

            switch (source[pos + 1])
            {
                case 'n':
                case 'r':
                case 't':
                case '\\':
                case '\'':
                case '"':
                    pos += 2;
                    break;
                case 'x': {
                    UInt32 value = 0;
                    if (detail::ReadHex(source, pos + 2, 2, value))
                    {
                        pos += 4;
                    }
                    else
                    {
                        fail(LexErrorCode::InvalidEscape);
                        pos += 2;
                    }
                    break;
                }
                case 'u': {
                    pos += 2;
                    if (m_cursor.At(pos) != '{')
                    {
                        fail(LexErrorCode::InvalidUnicodeEscape);
                        break;
                    }
                    ++pos;
                    UInt32 value  = 0;
                    UInt32 digits = 0;
                    while (pos < size && Text::IsHexDigit(source[pos]))
                    {
                        if (digits < 8)
                            value = (value << 4) | Text::HexValue(source[pos]);
                        ++digits;
                        ++pos;
                    }
                    if (m_cursor.At(pos) != '}' || digits == 0 || digits > 6 || value > Text::MaxCodePoint ||
                        Text::IsSurrogate(value))
                    {
                        fail(LexErrorCode::InvalidUnicodeEscape);
                        break;
                    }
                    ++pos;
                    break;
                }
                case '\n':
                case '\r':
                    fail(LexErrorCode::InvalidEscape);
                    ++pos;
                    break;
                default:
                    fail(LexErrorCode::InvalidEscape);
                    pos += 2;
                    break;
            }
        }
    }

    UInt32 ZonLexer::SkipTrivia(UInt32 offset) const noexcept
    {
        const std::string_view source = m_cursor.Source();
        while (true)
        {
            offset = detail::SkipWhitespace(source, offset);
            if (m_cursor.At(offset) == '/' && m_cursor.At(offset + 1) == '/')
            {
                offset = detail::LineEnd(source, offset + 2);
                continue;
            }
            return offset;
        }
    }

    bool ZonLexer::OpensStruct(UInt32 offset) const noexcept
    {
        const std::string_view source = m_cursor.Source();
        UInt32                 pos    = SkipTrivia(offset);

        if (m_cursor.At(pos) == '}')
            return true;
        if (m_cursor.At(pos) != '.')
            return false;

        if (detail::IsIdentifierStart(m_cursor.At(pos + 1)))
        {
            pos = detail::SkipIdentifier(source, pos + 1);
        }
        else if (m_cursor.At(pos + 1) == '@' && m_cursor.At(pos + 2) == '"')
        {
            UInt16       flags = TokenFlags::None;
            LexErrorCode error = LexErrorCode::None;
            pos                = ScanQuoted(pos + 3, '"', flags, error);
        }
        else
        {
            return false;
        }

        return m_cursor.At(SkipTrivia(pos)) == '=';
    }
}// namespace Lattice::Syntax
