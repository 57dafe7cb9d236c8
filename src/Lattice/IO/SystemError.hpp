#pragma once

#include <Lattice/IO/IOError.hpp>

#include <cerrno>
#include <cstring>
#include <format>

namespace Lattice::IO::detail
{
    [[nodiscard]] inline IOErrorCode CodeFromErrno(int code) noexcept
    {
        switch (code)
        {
            case ENOENT:
                return IOErrorCode::NotFound;
            case EACCES:
            case EPERM:
                return IOErrorCode::PermissionDenied;
            case ENOTDIR:
                return IOErrorCode::NotADirectory;
            case EISDIR:
                return IOErrorCode::IsADirectory;
            case EINVAL:
                return IOErrorCode::InvalidArgument;
            default:
                return IOErrorCode::SystemError;
        }
    }

    [[nodiscard]] inline IOError MakeSystemError(const char* operation, int code)
    {
        IOError err;
        err.code       = CodeFromErrno(code);
        err.systemCode = code;
        err.message    = std::format("{} failed: {}", operation, std::strerror(code));
        return err;
    }
}// namespace Lattice::IO::detail
