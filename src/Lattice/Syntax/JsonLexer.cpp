#include <Lattice/Syntax/JsonLexer.hpp>

#include "LexerCommon.hpp"

namespace Lattice::Syntax
{
    using detail::ReadHex;

    std::optional<Token> JsonLexer::Next() noexcept
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
                return ScanWhitespace(start);
            case '{':
                if (!m_context.Push(ContextStack::Context::Object))
                {
                    m_expectKey = false;
                    return Fail(LexErrorCode::NestingTooDeep, start, start + 1);
                }
                m_expectKey = true;
                return Finish(TokenKind::ObjectStart, start, start + 1);
            case '}':
                m_context.Pop();
                m_expectKey = false;
                return Finish(TokenKind::ObjectEnd, start, start + 1);
            case '[':
                m_expectKey = false;
                if (!m_context.Push(ContextStack::Context::Array))
                    return Fail(LexErrorCode::NestingTooDeep, start, start + 1);
                return Finish(TokenKind::ArrayStart, start, start + 1);
            case ']':
                m_context.Pop();
                m_expectKey = false;
                return Finish(TokenKind::ArrayEnd, start, start + 1);
            case ',':
                m_expectKey = m_context.Top() == ContextStack::Context::Object;
                return Finish(TokenKind::Comma, start, start + 1);
            case ':':
                m_expectKey = false;
                return Finish(TokenKind::Colon, start, start + 1);
            case '"':
                return ScanString(start);
            case '/':
                return ScanComment(start);
            default:
                break;
        }

        if (c == '-' || Text::IsDigit(c))
            return ScanNumber(start);
        if (detail::IsIdentifierStart(c))
            return ScanWord(start);
        return ScanUnexpected(start);
    }

    Token JsonLexer::Finish(TokenKind kind, UInt32 start, UInt32 end, UInt16 flags) noexcept
    {
        m_cursor.AdvanceTo(end);
        return Token {kind, Span {start, end}, flags, LexErrorCode::None};
    }

    Token JsonLexer::Fail(LexErrorCode code, UInt32 start, UInt32 end) noexcept
    {
        m_cursor.AdvanceTo(end);
        return Token {TokenKind::Error, Span {start, end}, TokenFlags::None, code};
    }

    Token JsonLexer::ScanWhitespace(UInt32 start) noexcept
    {
        return Finish(TokenKind::Whitespace, start, detail::SkipWhitespace(m_cursor.Source(), start));
    }

    Token JsonLexer::ScanString(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        const bool             isKey  = m_expectKey;
        m_expectKey                   = false;

        UInt16       flags = TokenFlags::None;
        LexErrorCode error = LexErrorCode::None;
        UInt32       pos   = start + 1;

        while (true)
        {
            if (pos >= source.size())
                return Fail(LexErrorCode::UnterminatedString, start, pos);

            const auto c = static_cast<unsigned char>(source[pos]);
            if (c == '"')
            {
                ++pos;
                break;
            }
            if (c == '\n' || c == '\r')
                return Fail(LexErrorCode::UnterminatedString, start, pos);
            if (c < 0x20)
            {
                if (error == LexErrorCode::None)
                    error = LexErrorCode::ControlCharacter;
                ++pos;
                continue;
            }
            if (c != '\\')
            {
                ++pos;
                continue;
            }

            flags |= TokenFlags::HasEscapes;
            if (pos + 1 >= source.size())
                return Fail(LexErrorCode::UnterminatedString, start, static_cast<UInt32>(source.size()));

            const char escape = source[pos + 1];
            switch (escape)
            {
                case '"':
                case '\\':
                case '/':
                case 'b':
                case 'f':
                case 'n':
                case 'r':
                case 't':
                    pos += 2;
                    break;
                case 'u': {
                    UInt32 codepoint = 0;
                    if (!ReadHex(source, pos + 2, 4, codepoint))
                    {
                        if (error == LexErrorCode::None)
                            error = LexErrorCode::InvalidUnicodeEscape;
                        pos += 2;
                        break;
                    }
                    pos += 6;
                    if (Text::IsHighSurrogate(codepoint))
                    {
                        UInt32 low = 0;
                        const bool paired = pos + 1 < source.size() && source[pos] == '\\' && source[pos + 1] == 'u' &&
                                            ReadHex(source, pos + 2, 4, low) && Text::IsLowSurrogate(low);
                        if (paired)
                            pos += 6;
                        else if (error == LexErrorCode::None)
                            error = LexErrorCode::InvalidUnicodeEscape;
                    }
                    else if (Text::IsLowSurrogate(codepoint) && error == LexErrorCode::None)
                    {
                        error = LexErrorCode::InvalidUnicodeEscape;
                    }
                    break;
                }
                case '\n':
                case '\r':
                    if (error == LexErrorCode::None)
                        error = LexErrorCode::InvalidEscape;
                    ++pos;
                    break;
                default:
                    if (error == LexErrorCode::None)
                        error = LexErrorCode::InvalidEscape;
                    pos += 2;
                    break;
            }
        }

        if (error != LexErrorCode::None)
            return Fail(error, start, pos);
        return Finish(isKey ? TokenKind::PropertyName : TokenKind::String, start, pos, flags);
    }

    Token JsonLexer::ScanNumber(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        m_expectKey                   = false;

        UInt16 flags       = TokenFlags::None;
        UInt32 pos         = start;
        bool   leadingZero = false;
        bool   malformed   = false;

        const auto digitsFrom = [&](UInt32 from) {
            while (from < source.size() && Text::IsDigit(source[from]))
                ++from;
            return from;
        };

        if (source[pos] == '-')
        {
            flags |= TokenFlags::Negative;
            ++pos;
        }
        if (pos >= source.size() || !Text::IsDigit(source[pos]))
            return Fail(LexErrorCode::MalformedNumber, start, pos);

        if (source[pos] == '0')
        {
            ++pos;
            if (pos < source.size() && Text::IsDigit(source[pos]))
            {
                leadingZero = true;
                pos         = digitsFrom(pos);
            }
        }
        else
        {
            pos = digitsFrom(pos);
        }

        if (pos < source.size() && source[pos] == '.')
        {
            flags |= TokenFlags::Float;
            ++pos;
            if (pos >= source.size() || !Text::IsDigit(source[pos]))
                malformed = true;
            pos = digitsFrom(pos);
        }

        if (pos < source.size() && (source[pos] == 'e' || source[pos] == 'E'))
        {
            flags |= TokenFlags::Exponent;
            ++pos;
            if (pos < source.size() && (source[pos] == '+' || source[pos] == '-'))
                ++pos;
            if (pos >= source.size() || !Text::IsDigit(source[pos]))
                malformed = true;
            pos = digitsFrom(pos);
        }

        if (leadingZero)
            return Fail(LexErrorCode::LeadingZero, start, pos);
        if (malformed)
            return Fail(LexErrorCode::MalformedNumber, start, pos);
        return Finish(TokenKind::Number, start, pos, flags);
    }

    Token JsonLexer::ScanWord(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        const UInt32           end    = detail::SkipIdentifier(source, start);
        const std::string_view word   = source.substr(start, end - start);
        m_expectKey                   = false;

        if (word == "true")
            return Finish(TokenKind::True, start, end);
        if (word == "false")
            return Finish(TokenKind::False, start, end);
        if (word == "null")
            return Finish(TokenKind::Null, start, end);
        return Fail(LexErrorCode::InvalidLiteral, start, end);
    }

    Token JsonLexer::ScanComment(UInt32 start) noexcept
    {
        const std::string_view source = m_cursor.Source();
        const char             next   = m_cursor.Peek(1);

        if (next == '/')
        {
            const UInt32 end = detail::LineEnd(source, start + 2);
            if (!m_options.allowComments)
                return Fail(LexErrorCode::CommentNotAllowed, start, end);
            return Finish(TokenKind::Comment, start, end);
        }

        if (next == '*')
        {
            const auto close = source.find("*/", start + 2);
            if (close == std::string_view::npos)
                return Fail(LexErrorCode::UnterminatedComment, start, static_cast<UInt32>(source.size()));
            const auto end = static_cast<UInt32>(close + 2);
            if (!m_options.allowComments)
                return Fail(LexErrorCode::CommentNotAllowed, start, end);
            return Finish(TokenKind::Comment, start, end, TokenFlags::BlockComment);
        }

        return Fail(LexErrorCode::UnexpectedCharacter, start, start + 1);
    }

    Token JsonLexer::ScanUnexpected(UInt32 start) noexcept
    {
        m_expectKey = false;
        return Fail(LexErrorCode::UnexpectedCharacter, start, detail::UnexpectedEnd(m_cursor.Source(), start));
    }
}// namespace Lattice::Syntax
