#include <Lattice/IO/MemoryFileSystem.hpp>

#include <Lattice/IO/MemoryReader.hpp>

#include <algorithm>
#include <format>

namespace Lattice::IO
{
    namespace
    {
        [[nodiscard]] std::string Normalize(std::string_view path)
        {
            while (path.size() > 1 && path.back() == '/')
                path.remove_suffix(1);
            return std::string(path);
        }

        [[nodiscard]] std::string_view ParentOf(std::string_view path) noexcept
        {
            const auto slash = path.rfind('/');
            if (slash == std::string_view::npos)
                return {};
            if (slash == 0)
                return path.substr(0, 1);
            return path.substr(0, slash);
        }

        template<typename T>
        [[nodiscard]] Utilities::Expected<T, IOError> Failure(IOErrorCode code, std::string message)
        {
            IOError err;
            err.code    = code;
            err.message = std::move(message);
            return Utilities::Expected<T, IOError>(Utilities::Unexpected<IOError>(std::move(err)));
        }
    }// namespace

    MemoryFileSystem::MemoryFileSystem()
    {
        m_directories.insert("/");
    }

    void MemoryFileSystem::AddDirectory(std::string_view path)
    {
        std::string normalized = Normalize(path);
        while (!normalized.empty() && m_directories.insert(normalized).second)
            normalized = std::string(ParentOf(normalized));
    }

    void MemoryFileSystem::AddFile(std::string_view path, std::string contents)
    {
        const std::string normalized = Normalize(path);
        AddDirectory(ParentOf(normalized));
        m_files.insert_or_assign(normalized, std::move(contents));
    }

    bool MemoryFileSystem::Exists(std::string_view path) const
    {
        const std::string normalized = Normalize(path);
        return m_files.contains(normalized) || m_directories.contains(normalized);
    }

    Utilities::Expected<std::unique_ptr<IByteReader>, IOError> MemoryFileSystem::Open(std::string_view path)
    {
        const std::string normalized = Normalize(path);
        if (m_directories.contains(normalized))
            return Failure<std::unique_ptr<IByteReader>>(IOErrorCode::IsADirectory, std::format("'{}' is a directory", normalized));

        const auto file = m_files.find(normalized);
        if (file == m_files.end())
            return Failure<std::unique_ptr<IByteReader>>(IOErrorCode::NotFound, std::format("'{}' not found", normalized));

        return Utilities::Expected<std::unique_ptr<IByteReader>, IOError>(
                std::unique_ptr<IByteReader>(std::make_unique<MemoryReader>(file->second)));
    }

    Utilities::Expected<std::vector<DirectoryEntry>, IOError> MemoryFileSystem::ListDirectory(std::string_view path)
    {
        const std::string normalized = Normalize(path);
        if (m_files.contains(normalized))
            return Failure<std::vector<DirectoryEntry>>(IOErrorCode::NotADirectory, std::format("'{}' is not a directory", normalized));
        if (!m_directories.contains(normalized))
            return Failure<std::vector<DirectoryEntry>>(IOErrorCode::NotFound, std::format("'{}' not found", normalized));

        std::vector<DirectoryEntry> entries;
        const auto collect = [&](std::string_view candidate, EntryType type) {
            if (candidate != normalized && ParentOf(candidate) == normalized)
                entries.push_back(DirectoryEntry {std::string(candidate.substr(candidate.rfind('/') + 1)), type});
        };
        for (const auto& [filePath, contents] : m_files)
            collect(filePath, EntryType::File);
        for (const auto& directory : m_directories)
            collect(directory, EntryType::Directory);

        std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
        return Utilities::Expected<std::vector<DirectoryEntry>, IOError>(std::move(entries));
    }

    Utilities::Expected<FileStatus, IOError> MemoryFileSystem::Stat(std::string_view path)
    {
        const std::string normalized = Normalize(path);
        if (const auto file = m_files.find(normalized); file != m_files.end())
            return Utilities::Expected<FileStatus, IOError>(FileStatus {EntryType::File, file->second.size()});
        if (m_directories.contains(normalized))
            return Utilities::Expected<FileStatus, IOError>(FileStatus {EntryType::Directory, 0});
        return Failure<FileStatus>(IOErrorCode::NotFound, std::format("'{}' not found", normalized));
    }
}// namespace Lattice::IO
