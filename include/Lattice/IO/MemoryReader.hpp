#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IByteReader.hpp>
#include <Lattice/IO/IOError.hpp>

#include <cstring>
#include <string>
#include <string_view>

namespace Lattice::IO
{
    /// @brief In-memory implementation of IByteReader.
    ///
    /// Views caller-owned bytes, or owns a copy when constructed from a `std::string`.
    class LATTICE_API MemoryReader final : public IByteReader
    {
    public:
        explicit MemoryReader(std::span<const Byte> data) noexcept
            : m_data(data.data())
            , m_size(data.size())
        {
        }

        explicit MemoryReader(std::string contents)
            : m_owned(std::move(contents))
            , m_data(reinterpret_cast<const Byte*>(m_owned.data()))
            , m_size(m_owned.size())
        {
        }

        MemoryReader(const MemoryReader&)            = delete;
        MemoryReader& operator=(const MemoryReader&) = delete;

        Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept override
        {
            const UIntSize toRead = Peek(destination).ValueUnsafe();
            m_offset += toRead;
            return Utilities::Expected<UIntSize, IOError>(toRead);
        }

        Utilities::Expected<UIntSize, IOError> Skip(UIntSize bytes) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toSkip    = (bytes < remaining) ? bytes : remaining;
            m_offset += toSkip;
            return Utilities::Expected<UIntSize, IOError>(toSkip);
        }

        Utilities::Expected<UIntSize, IOError> Peek(std::span<Byte> destination) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toRead    = (destination.size() < remaining) ? destination.size() : remaining;
            if (toRead != 0)
                std::memcpy(destination.data(), m_data + m_offset, toRead);
            return Utilities::Expected<UIntSize, IOError>(toRead);
        }

        Utilities::Expected<UIntSize, IOError> Tell() const noexcept override
        {
            return Utilities::Expected<UIntSize, IOError>(m_offset);
        }

        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            return (m_offset < m_size) ? (m_size - m_offset) : 0;
        }

    private:
        std::string m_owned {};
        const Byte* m_data {nullptr};
        UIntSize    m_size {0};
        UIntSize    m_offset {0};
    };
}// namespace Lattice::IO
