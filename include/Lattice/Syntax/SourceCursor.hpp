#pragma once

#include <Lattice/Primitives.hpp>
#include <Lattice/Text/Span.hpp>

#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Byte cursor over a source buffer with line/column bookkeeping.
    ///
    /// Offsets are 32-bit; inputs larger than 4 GiB are not supported by the lexers.
    class SourceCursor
    {
    public:
        SourceCursor() noexcept = default;

        explicit SourceCursor(std::string_view source) noexcept
            : m_source(source)
        {
        }

        [[nodiscard]] bool IsEof() const noexcept { return m_offset >= m_source.size(); }

        [[nodiscard]] char Peek() const noexcept
        {
            return IsEof() ? '\0' : m_source[m_offset];
        }

        [[nodiscard]] char Peek(UIntSize ahead) const noexcept
        {
            const UIntSize index = m_offset + ahead;
            return index < m_source.size() ? m_source[index] : '\0';
        }

        /// @brief Byte at an absolute offset, or `\0` past the end.
        [[nodiscard]] char At(UIntSize offset) const noexcept
        {
            return offset < m_source.size() ? m_source[offset] : '\0';
        }

        void Advance(UIntSize count = 1) noexcept
        {
            while (count-- > 0 && m_offset < m_source.size())
            {
                const char c = m_source[m_offset++];
                if (c == '\n' || (c == '\r' && Peek() != '\n'))
                {
                    ++m_line;
                    m_column = 1;
                }
                else if (c != '\r')
                {
                    ++m_column;
                }
            }
        }

        /// @brief Moves to `offset`, which must not be behind the current position.
        void AdvanceTo(UIntSize offset) noexcept
        {
            if (offset > m_offset)
                Advance(offset - m_offset);
        }

        [[nodiscard]] UInt32 Offset() const noexcept { return static_cast<UInt32>(m_offset); }
        [[nodiscard]] UInt32 Size() const noexcept { return static_cast<UInt32>(m_source.size()); }
        [[nodiscard]] std::string_view Source() const noexcept { return m_source; }

        [[nodiscard]] Text::SourceLocation Location() const noexcept
        {
            return Text::SourceLocation {static_cast<UInt32>(m_offset), m_line, m_column};
        }

    private:
        std::string_view m_source {};
        UIntSize         m_offset {0};
        UInt32           m_line {1};
        UInt32           m_column {1};
    };
}// namespace Lattice::Syntax
