#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IOError.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Utilities/Expected.hpp>

#include <span>
#include <string>

namespace Lattice::IO
{
    /// @brief Minimal byte reader interface for streaming inputs.
    class LATTICE_API IByteReader
    {
    public:
        virtual ~IByteReader() = default;

        /// @brief Read up to destination.size() bytes into destination. Returns 0 at end of stream.
        virtual Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept = 0;

        /// @brief Skip forward by up to @p bytes.
        virtual Utilities::Expected<UIntSize, IOError> Skip(UIntSize bytes) noexcept = 0;

        /// @brief Peek up to destination.size() bytes without advancing.
        virtual Utilities::Expected<UIntSize, IOError> Peek(std::span<Byte> destination) noexcept = 0;

        /// @brief Current stream position if known.
        virtual Utilities::Expected<UIntSize, IOError> Tell() const noexcept = 0;
    };

    /// @brief Reads `reader` to completion.
    [[nodiscard]] LATTICE_API Utilities::Expected<std::string, IOError> ReadAll(IByteReader& reader);
}// namespace Lattice::IO
