#pragma once

#include <Lattice/Primitives.hpp>

#include <array>

namespace Lattice::Syntax
{
    /// @brief Fixed-size bit stack recording whether each open container is an object or an array.
    ///
    /// Levels beyond `Capacity` are counted so that closers stay balanced, but not recorded;
    /// `Top()` reports `None` for them. Lexers turn such an opener into a `NestingTooDeep`
    /// error token, and the parser and linter never nest deeper than `Capacity`.
    class ContextStack
    {
    public:
        static constexpr UInt32 Capacity = 256;

        enum class Context : UInt8
        {
            None,
            Object,
            Array,
        };

        /// @brief Opens a level; returns false when the level is beyond `Capacity` and was not recorded.
        bool Push(Context context) noexcept
        {
            const bool recorded = m_depth < Capacity;
            if (recorded)
            {
                const UInt64 bit = UInt64 {1} << (m_depth % 64);
                if (context == Context::Object)
                    m_bits[m_depth / 64] |= bit;
                else
                    m_bits[m_depth / 64] &= ~bit;
            }
            ++m_depth;
            return recorded;
        }

        void Pop() noexcept
        {
            if (m_depth > 0)
                --m_depth;
        }

        [[nodiscard]] Context Top() const noexcept
        {
            if (m_depth == 0 || m_depth > Capacity)
                return Context::None;
            const UInt32 level    = m_depth - 1;
            const bool   isObject = (m_bits[level / 64] >> (level % 64)) & 1u;
            return isObject ? Context::Object : Context::Array;
        }

        [[nodiscard]] UInt32 Depth() const noexcept { return m_depth; }

    private:
        std::array<UInt64, Capacity / 64> m_bits {};
        UInt32                            m_depth {0};
    };
}// namespace Lattice::Syntax
