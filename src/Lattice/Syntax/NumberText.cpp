#include <Lattice/Syntax/NumberText.hpp>

#include <Lattice/Syntax/Escapes.hpp>
#include <Lattice/Syntax/Token.hpp>
#include <Lattice/Text/Utf8.hpp>

#include <charconv>
#include <limits>
#include <string>

namespace Lattice::Syntax
{
    namespace
    {
        /// @brief Checks `-? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?`.
        [[nodiscard]] bool IsJsonNumber(std::string_view text, bool& integral) noexcept
        {
            UIntSize i = 0;
            integral   = true;
            if (i < text.size() && text[i] == '-')
                ++i;
            if (i >= text.size() || !Text::IsDigit(text[i]))
                return false;
            if (text[i] == '0')
            {
                ++i;
            }
            else
            {
                while (i < text.size() && Text::IsDigit(text[i]))
                    ++i;
            }
            if (i < text.size() && text[i] == '.')
            {
                integral = false;
                ++i;
                if (i >= text.size() || !Text::IsDigit(text[i]))
                    return false;
                while (i < text.size() && Text::IsDigit(text[i]))
                    ++i;
            }
            if (i < text.size() && (text[i] == 'e' || text[i] == 'E'))
            {
                integral = false;
                ++i;
                if (i < text.size() && (text[i] == '+' || text[i] == '-'))
                    ++i;
                if (i >= text.size() || !Text::IsDigit(text[i]))
                    return false;
                while (i < text.size() && Text::IsDigit(text[i]))
                    ++i;
            }
            return i == text.size();
        }

        [[nodiscard]] std::optional<F64> ParseGeneral(std::string_view text) noexcept
        {
            F64        value  = 0.0;
            const auto result = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::general);
            if (result.ec == std::errc::result_out_of_range)
            {
                const bool negative = !text.empty() && text.front() == '-';
                const auto exponent = text.find_first_of("eE");
                const bool tiny     = exponent != std::string_view::npos && exponent + 1 < text.size() && text[exponent + 1] == '-';
                if (tiny)
                    return negative ? -0.0 : 0.0;
                return negative ? -std::numeric_limits<F64>::infinity() : std::numeric_limits<F64>::infinity();
            }
            if (result.ec != std::errc {} || result.ptr != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        [[nodiscard]] std::optional<F64> ParseJson(std::string_view text) noexcept
        {
            bool integral = true;
            if (!IsJsonNumber(text, integral))
                return std::nullopt;

            if (integral)
            {
                const bool       negative = text.front() == '-';
                std::string_view digits   = negative ? text.substr(1) : text;
                if (digits.size() <= 16)
                {
                    UInt64 value = 0;
                    for (const char c : digits)
                        value = value * 10ULL + static_cast<UInt64>(c - '0');
                    if (value <= MaxExactInteger)
                        return negative ? -static_cast<F64>(value) : static_cast<F64>(value);
                }
            }
            return ParseGeneral(text);
        }

        [[nodiscard]] std::optional<F64> ParseCharLiteral(std::string_view text, UInt16 flags)
        {
            Token token {TokenKind::Number, Span {}, flags, LexErrorCode::None};
            std::string decoded;
            if (DecodeLiteral(Grammar::Zon, LiteralBody(text, token), token, decoded) != DecodeStatus::Ok || decoded.empty())
                return std::nullopt;

            const auto   lead   = static_cast<unsigned char>(decoded[0]);
            const UInt32 length = Text::SequenceLength(lead);
            if (length <= 1)
                return decoded.size() == 1 ? std::optional<F64>(static_cast<F64>(lead)) : std::nullopt;
            if (decoded.size() != length || !Text::IsValidUtf8(decoded))
                return std::nullopt;

            static constexpr unsigned char leadMask[] = {0, 0, 0x1F, 0x0F, 0x07};
            UInt32                         codepoint  = lead & leadMask[length];
            for (UInt32 i = 1; i < length; ++i)
                codepoint = (codepoint << 6) | (static_cast<unsigned char>(decoded[i]) & 0x3F);
            return static_cast<F64>(codepoint);
        }

        [[nodiscard]] std::optional<F64> ParseZon(std::string_view text, UInt16 flags)
        {
            if (flags & TokenFlags::CharLiteral)
                return ParseCharLiteral(text, flags);

            bool             negative = false;
            std::string_view body     = text;
            if (!body.empty() && body.front() == '-')
            {
                negative = true;
                body.remove_prefix(1);
            }
            if (body == "inf")
                return negative ? -std::numeric_limits<F64>::infinity() : std::numeric_limits<F64>::infinity();
            if (body == "nan" && !negative)
                return std::numeric_limits<F64>::quiet_NaN();
            if (body.empty() || !Text::IsDigit(body.front()))
                return std::nullopt;

            std::string digits;
            digits.reserve(body.size());
            for (UIntSize i = 0; i < body.size(); ++i)
            {
                if (body[i] != '_')
                {
                    digits.push_back(body[i]);
                    continue;
                }
                if (i == 0 || i + 1 >= body.size() || body[i - 1] == '_' || body[i + 1] == '_')
                    return std::nullopt;
            }

            int radix = 10;
            if (digits.size() > 2 && digits[0] == '0')
            {
                if (digits[1] == 'x')
                    radix = 16;
                else if (digits[1] == 'o')
                    radix = 8;
                else if (digits[1] == 'b')
                    radix = 2;
            }

            if (radix != 10)
            {
                const char* first = digits.data() + 2;
                const char* last  = digits.data() + digits.size();
                UInt64      value = 0;
                const auto  result = std::from_chars(first, last, value, radix);
                if (result.ec == std::errc::result_out_of_range)
                {
                    // Wider than 64 bits: accumulate in floating point.
                    F64 wide = 0.0;
                    for (const char* p = first; p < last; ++p)
                        wide = wide * radix + static_cast<F64>(Text::HexValue(*p));
                    return negative ? -wide : wide;
                }
                if (result.ec != std::errc {} || result.ptr != last)
                    return std::nullopt;
                return negative ? -static_cast<F64>(value) : static_cast<F64>(value);
            }

            if (digits.size() > 1 && digits[0] == '0' && Text::IsDigit(digits[1]))
                return std::nullopt;
            if (negative)
                digits.insert(digits.begin(), '-');
            return ParseJson(digits);
        }
    }// namespace

    std::optional<F64> ParseNumberText(Grammar grammar, std::string_view text, UInt16 flags)
    {
        if (grammar == Grammar::Json)
            return ParseJson(text);
        return ParseZon(text, flags);
    }

    UInt32 FractionDigits(std::string_view text) noexcept
    {
        const auto dot = text.find('.');
        if (dot == std::string_view::npos)
            return 0;
        UInt32 count = 0;
        for (UIntSize i = dot + 1; i < text.size() && (Text::IsDigit(text[i]) || text[i] == '_'); ++i)
        {
            if (text[i] != '_')
                ++count;
        }
        return count;
    }
}// namespace Lattice::Syntax
