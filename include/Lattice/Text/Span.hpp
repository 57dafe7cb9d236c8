/// @file Span.hpp
/// @brief Half-open byte ranges into a source buffer and line/column locations.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <algorithm>
#include <string_view>

namespace Lattice::Text
{
    /// @brief Half-open byte range `[start, end)` into a source buffer.
    ///
    /// Spans are plain values; they never own or reference the buffer they describe.
    struct Span
    {
        UInt32 start {0};
        UInt32 end {0};

        [[nodiscard]] static constexpr Span FromLength(UInt32 start, UInt32 length) noexcept
        {
            return Span {start, start + length};
        }

        [[nodiscard]] constexpr UInt32 Length() const noexcept { return end - start; }
        [[nodiscard]] constexpr bool   IsEmpty() const noexcept { return start == end; }

        [[nodiscard]] constexpr bool Contains(UInt32 offset) const noexcept
        {
            return offset >= start && offset < end;
        }

        [[nodiscard]] constexpr bool Contains(Span other) const noexcept
        {
            return other.start >= start && other.end <= end;
        }

        /// @brief True when the two ranges share at least one byte.
        [[nodiscard]] constexpr bool Overlaps(Span other) const noexcept
        {
            return start < other.end && other.start < end;
        }

        /// @brief Smallest span covering both `*this` and `other`.
        [[nodiscard]] constexpr Span Merge(Span other) const noexcept
        {
            return Span {std::min(start, other.start), std::max(end, other.end)};
        }

        /// @brief Bytes of `source` covered by this span, clamped to the buffer.
        [[nodiscard]] constexpr std::string_view Slice(std::string_view source) const noexcept
        {
            if (start >= source.size())
                return {};
            const UIntSize last = std::min<UIntSize>(end, source.size());
            return source.substr(start, last - start);
        }

        friend constexpr bool operator==(Span, Span) noexcept = default;
    };

    /// @brief Byte offset plus 1-based line and column.
    struct SourceLocation
    {
        UInt32 offset {0};
        UInt32 line {1};
        UInt32 column {1};

        friend constexpr bool operator==(const SourceLocation&, const SourceLocation&) noexcept = default;
    };

    /// @brief Computes the line and column of `offset` in `source`.
    ///
    /// `\n`, `\r\n` and a lone `\r` each count as one line break. Columns count bytes.
    [[nodiscard]] LATTICE_API SourceLocation LocateOffset(std::string_view source, UInt32 offset) noexcept;
}// namespace Lattice::Text
