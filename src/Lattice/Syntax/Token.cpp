#include <Lattice/Syntax/Token.hpp>

namespace Lattice::Syntax
{
    std::string_view ToString(TokenKind kind) noexcept
    {
        switch (kind)
        {
            case TokenKind::String:
                return "string";
            case TokenKind::Number:
                return "number";
            case TokenKind::True:
                return "true";
            case TokenKind::False:
                return "false";
            case TokenKind::Null:
                return "null";
            case TokenKind::ObjectStart:
                return "object start";
            case TokenKind::ObjectEnd:
                return "object end";
            case TokenKind::ArrayStart:
                return "array start";
            case TokenKind::ArrayEnd:
                return "array end";
            case TokenKind::Comma:
                return "comma";
            case TokenKind::Colon:
                return "separator";
            case TokenKind::PropertyName:
                return "property name";
            case TokenKind::Whitespace:
                return "whitespace";
            case TokenKind::Comment:
                return "comment";
            case TokenKind::Error:
                return "error";
            case TokenKind::Eof:
                return "end of input";
            case TokenKind::Continuation:
                return "continuation";
        }
        return "unknown";
    }

    std::string_view ToString(LexErrorCode code) noexcept
    {
        switch (code)
        {
            case LexErrorCode::None:
                return "no error";
            case LexErrorCode::UnexpectedCharacter:
                return "Unexpected character";
            case LexErrorCode::InvalidLiteral:
                return "Invalid literal";
            case LexErrorCode::UnterminatedString:
                return "Unterminated string";
            case LexErrorCode::InvalidEscape:
                return "Invalid escape sequence";
            case LexErrorCode::InvalidUnicodeEscape:
                return "Invalid Unicode escape sequence";
            case LexErrorCode::ControlCharacter:
                return "Control character in string";
            case LexErrorCode::LeadingZero:
                return "Number has leading zero";
            case LexErrorCode::MalformedNumber:
                return "Malformed number";
            case LexErrorCode::UnterminatedComment:
                return "Unterminated comment";
            case LexErrorCode::CommentNotAllowed:
                return "Comments are not allowed";
            case LexErrorCode::NestingTooDeep:
                return "Nesting too deep";
        }
        return "unknown";
    }
}// namespace Lattice::Syntax
