#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IFileSystem.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace Lattice::IO
{
    /// @brief In-memory `IFileSystem` double.
    ///
    /// Paths are `/`-separated; trailing separators are ignored. Adding a file also adds every
    /// parent directory.
    class LATTICE_API MemoryFileSystem final : public IFileSystem
    {
    public:
        MemoryFileSystem();

        void AddFile(std::string_view path, std::string contents);
        void AddDirectory(std::string_view path);

        [[nodiscard]] bool Exists(std::string_view path) const;

        Utilities::Expected<std::unique_ptr<IByteReader>, IOError> Open(std::string_view path) override;
        Utilities::Expected<std::vector<DirectoryEntry>, IOError>  ListDirectory(std::string_view path) override;
        Utilities::Expected<FileStatus, IOError>                   Stat(std::string_view path) override;

    private:
        std::map<std::string, std::string, std::less<>> m_files;
        std::set<std::string, std::less<>>              m_directories;
    };
}// namespace Lattice::IO
