#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IByteReader.hpp>
#include <Lattice/IO/IOError.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Utilities/Expected.hpp>

#include <string>

namespace Lattice::IO
{
    /// @brief Read-only POSIX file handle exposed as an `IByteReader`.
    class LATTICE_API FileReader final : public IByteReader
    {
    public:
        FileReader() noexcept                    = default;
        FileReader(const FileReader&)            = delete;
        FileReader& operator=(const FileReader&) = delete;
        FileReader(FileReader&& other) noexcept;
        FileReader& operator=(FileReader&& other) noexcept;
        ~FileReader() override;

        Utilities::Expected<void, IOError> Open(const std::string& path) noexcept;
        void                               Close() noexcept;

        [[nodiscard]] bool IsOpen() const noexcept { return m_handle >= 0; }

        Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept override;
        Utilities::Expected<UIntSize, IOError> Skip(UIntSize bytes) noexcept override;
        Utilities::Expected<UIntSize, IOError> Peek(std::span<Byte> destination) noexcept override;
        Utilities::Expected<UIntSize, IOError> Tell() const noexcept override;

        Utilities::Expected<UIntSize, IOError> Size() const noexcept;

    private:
        int m_handle {-1};
    };
}// namespace Lattice::IO
