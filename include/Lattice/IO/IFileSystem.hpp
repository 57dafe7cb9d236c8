/// @file IFileSystem.hpp
/// @brief File-system abstraction injected into loaders so tests can run against memory.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IByteReader.hpp>
#include <Lattice/IO/IOError.hpp>
#include <Lattice/IO/SourceFile.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Utilities/Expected.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Lattice::IO
{
    enum class EntryType : UInt8
    {
        File,
        Directory,
        Other,
    };

    struct DirectoryEntry
    {
        std::string name {};
        EntryType   type {EntryType::File};
    };

    struct FileStatus
    {
        EntryType type {EntryType::File};
        UIntSize  size {0};
    };

    /// @brief Read-only view of a hierarchical file system.
    ///
    /// Implementations agree on the error contract: a missing path is `NotFound`, opening a
    /// directory is `IsADirectory`, listing a file is `NotADirectory`. Listings are sorted by name.
    class LATTICE_API IFileSystem
    {
    public:
        virtual ~IFileSystem() = default;

        virtual Utilities::Expected<std::unique_ptr<IByteReader>, IOError> Open(std::string_view path) = 0;

        virtual Utilities::Expected<std::vector<DirectoryEntry>, IOError> ListDirectory(std::string_view path) = 0;

        virtual Utilities::Expected<FileStatus, IOError> Stat(std::string_view path) = 0;

        /// @brief Opens `path` and reads it to completion.
        Utilities::Expected<SourceFile, IOError> ReadFile(std::string_view path);
    };
}// namespace Lattice::IO
