/// @file Utf8.hpp
/// @brief UTF-8 validation and encoding helpers shared by the lexers, parser and linter.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <string>
#include <string_view>

namespace Lattice::Text
{
    inline constexpr Char32 MaxCodePoint = 0x10FFFF;

    [[nodiscard]] constexpr bool IsSurrogate(Char32 cp) noexcept { return cp >= 0xD800 && cp <= 0xDFFF; }
    [[nodiscard]] constexpr bool IsHighSurrogate(Char32 cp) noexcept { return cp >= 0xD800 && cp <= 0xDBFF; }
    [[nodiscard]] constexpr bool IsLowSurrogate(Char32 cp) noexcept { return cp >= 0xDC00 && cp <= 0xDFFF; }

    [[nodiscard]] constexpr bool IsDigit(char c) noexcept { return c >= '0' && c <= '9'; }

    [[nodiscard]] constexpr bool IsHexDigit(char c) noexcept
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    [[nodiscard]] constexpr UInt32 HexValue(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return static_cast<UInt32>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<UInt32>(c - 'a' + 10);
        return static_cast<UInt32>(c - 'A' + 10);
    }

    /// @brief Number of bytes of the UTF-8 sequence introduced by `lead`, or 0 if `lead` cannot start one.
    [[nodiscard]] constexpr UInt32 SequenceLength(unsigned char lead) noexcept
    {
        if (lead < 0x80)
            return 1;
        if (lead >= 0xC2 && lead <= 0xDF)
            return 2;
        if (lead >= 0xE0 && lead <= 0xEF)
            return 3;
        if (lead >= 0xF0 && lead <= 0xF4)
            return 4;
        return 0;
    }

    /// @brief Returns the offset of the first ill-formed byte, or `text.size()` when `text` is valid UTF-8.
    ///
    /// Rejects overlong encodings, surrogate code points and values above U+10FFFF.
    [[nodiscard]] LATTICE_API UIntSize FindInvalidUtf8(std::string_view text) noexcept;

    [[nodiscard]] inline bool IsValidUtf8(std::string_view text) noexcept
    {
        return FindInvalidUtf8(text) == text.size();
    }

    /// @brief Writes the UTF-8 encoding of `codepoint` to `out` (at least 4 bytes) and returns its length.
    [[nodiscard]] LATTICE_API UIntSize EncodeUtf8(Char32 codepoint, char* out) noexcept;

    LATTICE_API void AppendUtf8(std::string& out, Char32 codepoint);
}// namespace Lattice::Text
