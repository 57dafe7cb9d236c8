#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IFileSystem.hpp>
#include <Lattice/Logging/Logger.hpp>

namespace Lattice::IO
{
    /// @brief `IFileSystem` backed by POSIX system calls. Failed calls are logged at `Debug`.
    class LATTICE_API RealFileSystem final : public IFileSystem
    {
    public:
        explicit RealFileSystem(const Logging::Logger* logger = nullptr) noexcept
            : m_logger(logger)
        {
        }

        Utilities::Expected<std::unique_ptr<IByteReader>, IOError> Open(std::string_view path) override;
        Utilities::Expected<std::vector<DirectoryEntry>, IOError>  ListDirectory(std::string_view path) override;
        Utilities::Expected<FileStatus, IOError>                   Stat(std::string_view path) override;

    private:
        const Logging::Logger* m_logger {nullptr};
    };
}// namespace Lattice::IO
