#include <Lattice/IO/FileReader.hpp>

#include "SystemError.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <utility>

namespace Lattice::IO
{
    namespace
    {
        using SizeResult = Utilities::Expected<UIntSize, IOError>;

        [[nodiscard]] SizeResult Fail(const char* operation, int code)
        {
            return SizeResult(Utilities::Unexpected<IOError>(detail::MakeSystemError(operation, code)));
        }

        [[nodiscard]] SizeResult NotOpen()
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "file is not open";
            return SizeResult(Utilities::Unexpected<IOError>(std::move(err)));
        }
    }// namespace

    FileReader::FileReader(FileReader&& other) noexcept
        : m_handle(std::exchange(other.m_handle, -1))
    {
    }

    FileReader& FileReader::operator=(FileReader&& other) noexcept
    {
        if (this != &other)
        {
            Close();
            m_handle = std::exchange(other.m_handle, -1);
        }
        return *this;
    }

    FileReader::~FileReader()
    {
        Close();
    }

    Utilities::Expected<void, IOError> FileReader::Open(const std::string& path) noexcept
    {
        Close();
        const int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0)
        {
            const int code = errno;
            return Utilities::Expected<void, IOError>(Utilities::Unexpected<IOError>(detail::MakeSystemError("open", code)));
        }
        m_handle = fd;
        return {};
    }

    void FileReader::Close() noexcept
    {
        if (m_handle >= 0)
        {
            ::close(m_handle);
            m_handle = -1;
        }
    }

    Utilities::Expected<UIntSize, IOError> FileReader::Read(std::span<Byte> destination) noexcept
    {
        if (!IsOpen())
            return NotOpen();
        while (true)
        {
            const ssize_t count = ::read(m_handle, destination.data(), destination.size());
            if (count >= 0)
                return SizeResult(static_cast<UIntSize>(count));
            if (errno != EINTR)
                return Fail("read", errno);
        }
    }

    Utilities::Expected<UIntSize, IOError> FileReader::Skip(UIntSize bytes) noexcept
    {
        auto position = Tell();
        if (!position.HasValue())
            return position;
        auto size = Size();
        if (!size.HasValue())
            return size;

        const UIntSize current   = position.ValueUnsafe();
        const UIntSize total     = size.ValueUnsafe();
        const UIntSize remaining = current < total ? total - current : 0;
        const UIntSize toSkip    = bytes < remaining ? bytes : remaining;
        if (::lseek(m_handle, static_cast<off_t>(toSkip), SEEK_CUR) < 0)
            return Fail("lseek", errno);
        return SizeResult(toSkip);
    }

    Utilities::Expected<UIntSize, IOError> FileReader::Peek(std::span<Byte> destination) noexcept
    {
        auto position = Tell();
        if (!position.HasValue())
            return position;
        while (true)
        {
            const ssize_t count =
                    ::pread(m_handle, destination.data(), destination.size(), static_cast<off_t>(position.ValueUnsafe()));
            if (count >= 0)
                return SizeResult(static_cast<UIntSize>(count));
            if (errno != EINTR)
                return Fail("pread", errno);
        }
    }

    Utilities::Expected<UIntSize, IOError> FileReader::Tell() const noexcept
    {
        if (!IsOpen())
            return NotOpen();
        const off_t offset = ::lseek(m_handle, 0, SEEK_CUR);
        if (offset < 0)
            return Fail("lseek", errno);
        return SizeResult(static_cast<UIntSize>(offset));
    }

    Utilities::Expected<UIntSize, IOError> FileReader::Size() const noexcept
    {
        if (!IsOpen())
            return NotOpen();
        struct stat info {};
        if (::fstat(m_handle, &info) != 0)
            return Fail("fstat", errno);
        return SizeResult(static_cast<UIntSize>(info.st_size));
    }
}// namespace Lattice::IO
