#pragma once

#include <Lattice/Primitives.hpp>
#include <Lattice/Text/Utf8.hpp>

#include <string_view>

namespace Lattice::Syntax::detail
{
    [[nodiscard]] inline bool IsWhitespace(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    [[nodiscard]] inline bool IsIdentifierStart(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    [[nodiscard]] inline bool IsIdentifierChar(char c) noexcept
    {
        return IsIdentifierStart(c) || Text::IsDigit(c);
    }

    [[nodiscard]] inline UInt32 SkipWhitespace(std::string_view source, UInt32 offset) noexcept
    {
        while (offset < source.size() && IsWhitespace(source[offset]))
            ++offset;
        return offset;
    }

    [[nodiscard]] inline UInt32 SkipIdentifier(std::string_view source, UInt32 offset) noexcept
    {
        while (offset < source.size() && IsIdentifierChar(source[offset]))
            ++offset;
        return offset;
    }

    /// @brief Offset of the next line break at or after `offset`, or the end of input.
    [[nodiscard]] inline UInt32 LineEnd(std::string_view source, UInt32 offset) noexcept
    {
        while (offset < source.size() && source[offset] != '\n' && source[offset] != '\r')
            ++offset;
        return offset;
    }

    /// @brief End of an unexpected byte run: one whole UTF-8 sequence when well formed, else one byte.
    [[nodiscard]] inline UInt32 UnexpectedEnd(std::string_view source, UInt32 start) noexcept
    {
        const UInt32 length = Text::SequenceLength(static_cast<unsigned char>(source[start]));
        if (length <= 1 || start + length > source.size())
            return start + 1;
        for (UInt32 k = 1; k < length; ++k)
        {
            if ((static_cast<unsigned char>(source[start + k]) & 0xC0) != 0x80)
                return start + 1;
        }
        return start + length;
    }

    /// @brief Reads exactly `count` hex digits starting at `offset`.
    [[nodiscard]] inline bool ReadHex(std::string_view source, UInt32 offset, UInt32 count, UInt32& out) noexcept
    {
        if (offset + count > source.size())
            return false;
        out = 0;
        for (UInt32 i = 0; i < count; ++i)
        {
            const char c = source[offset + i];
            if (!Text::IsHexDigit(c))
                return false;
            out = (out << 4) | Text::HexValue(c);
        }
        return true;
    }
}// namespace Lattice::Syntax::detail
