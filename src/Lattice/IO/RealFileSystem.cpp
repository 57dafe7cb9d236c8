#include <Lattice/IO/RealFileSystem.hpp>

#include <Lattice/IO/FileReader.hpp>

#include "SystemError.hpp"

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>

namespace Lattice::IO
{
    namespace
    {
        [[nodiscard]] EntryType TypeFromMode(mode_t mode) noexcept
        {
            if (S_ISREG(mode))
                return EntryType::File;
            if (S_ISDIR(mode))
                return EntryType::Directory;
            return EntryType::Other;
        }

        template<typename T>
        [[nodiscard]] Utilities::Expected<T, IOError> Failure(IOError error)
        {
            return Utilities::Expected<T, IOError>(Utilities::Unexpected<IOError>(std::move(error)));
        }
    }// namespace

    Utilities::Expected<FileStatus, IOError> RealFileSystem::Stat(std::string_view path)
    {
        const std::string native(path);
        struct stat       info {};
        if (::stat(native.c_str(), &info) != 0)
        {
            const int code = errno;
            Logging::Log(m_logger, Logging::LogLevel::Debug, "stat '{}' failed (errno {})", native, code);
            return Failure<FileStatus>(detail::MakeSystemError("stat", code));
        }
        return Utilities::Expected<FileStatus, IOError>(FileStatus {TypeFromMode(info.st_mode), static_cast<UIntSize>(info.st_size)});
    }

    Utilities::Expected<std::unique_ptr<IByteReader>, IOError> RealFileSystem::Open(std::string_view path)
    {
        using Result = Utilities::Expected<std::unique_ptr<IByteReader>, IOError>;

        auto status = Stat(path);
        if (!status.HasValue())
            return Failure<std::unique_ptr<IByteReader>>(std::move(status.ErrorUnsafe()));
        if (status.ValueUnsafe().type == EntryType::Directory)
        {
            IOError err;
            err.code       = IOErrorCode::IsADirectory;
            err.systemCode = EISDIR;
            err.message    = std::format("'{}' is a directory", path);
            return Failure<std::unique_ptr<IByteReader>>(std::move(err));
        }

        auto reader = std::make_unique<FileReader>();
        auto opened = reader->Open(std::string(path));
        if (!opened.HasValue())
        {
            Logging::Log(m_logger, Logging::LogLevel::Debug, "open '{}' failed: {}", path, opened.Error().message);
            return Failure<std::unique_ptr<IByteReader>>(std::move(opened).ErrorUnsafe());
        }
        return Result(std::unique_ptr<IByteReader>(std::move(reader)));
    }

    Utilities::Expected<std::vector<DirectoryEntry>, IOError> RealFileSystem::ListDirectory(std::string_view path)
    {
        const std::string native(path);
        DIR*              directory = ::opendir(native.c_str());
        if (!directory)
        {
            const int code = errno;
            Logging::Log(m_logger, Logging::LogLevel::Debug, "opendir '{}' failed (errno {})", native, code);
            return Failure<std::vector<DirectoryEntry>>(detail::MakeSystemError("opendir", code));
        }

        std::vector<DirectoryEntry> entries;
        while (const dirent* entry = ::readdir(directory))
        {
            const std::string_view name = entry->d_name;
            if (name == "." || name == "..")
                continue;

            EntryType         type = EntryType::Other;
            const std::string full = native.ends_with('/') ? native + std::string(name) : native + "/" + std::string(name);
            struct stat       info {};
            if (::stat(full.c_str(), &info) == 0)
                type = TypeFromMode(info.st_mode);
            entries.push_back(DirectoryEntry {std::string(name), type});
        }
        ::closedir(directory);

        std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
        return Utilities::Expected<std::vector<DirectoryEntry>, IOError>(std::move(entries));
    }
}// namespace Lattice::IO
