#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <string>
#include <string_view>

namespace Lattice::IO
{
    /// @brief Error codes for byte sources and file systems.
    enum class IOErrorCode : UInt8
    {
        None,
        EndOfStream,
        InvalidArgument,
        NotFound,
        PermissionDenied,
        NotADirectory,
        IsADirectory,
        SystemError,
        NotSupported,
    };

    /// @brief IO error payload with optional system code.
    struct IOError
    {
        IOErrorCode code {IOErrorCode::None};
        Int32       systemCode {0};
        std::string message {};
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(IOErrorCode code) noexcept;
}// namespace Lattice::IO
