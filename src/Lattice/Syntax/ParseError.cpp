#include <Lattice/Syntax/ParseError.hpp>

namespace Lattice::Syntax
{
    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None:
                return "None";
            case ParseErrorCode::UnexpectedEnd:
                return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedToken:
                return "UnexpectedToken";
            case ParseErrorCode::InvalidToken:
                return "InvalidToken";
            case ParseErrorCode::InvalidNumber:
                return "InvalidNumber";
            case ParseErrorCode::InvalidStringEscape:
                return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape:
                return "InvalidUnicodeEscape";
            case ParseErrorCode::InvalidEncoding:
                return "InvalidEncoding";
            case ParseErrorCode::MissingValue:
                return "MissingValue";
            case ParseErrorCode::MissingSeparator:
                return "MissingSeparator";
            case ParseErrorCode::TrailingComma:
                return "TrailingComma";
            case ParseErrorCode::CommentNotAllowed:
                return "CommentNotAllowed";
            case ParseErrorCode::DepthExceeded:
                return "DepthExceeded";
            case ParseErrorCode::TrailingCharacters:
                return "TrailingCharacters";
            case ParseErrorCode::OutOfMemory:
                return "OutOfMemory";
            case ParseErrorCode::ReadFailed:
                return "ReadFailed";
        }
        return "Unknown";
    }
}// namespace Lattice::Syntax
