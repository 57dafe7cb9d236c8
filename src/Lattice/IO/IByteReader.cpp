#include <Lattice/IO/IByteReader.hpp>

#include <array>

namespace Lattice::IO
{
    std::string_view ToString(IOErrorCode code) noexcept
    {
        switch (code)
        {
            case IOErrorCode::None:
                return "None";
            case IOErrorCode::EndOfStream:
                return "EndOfStream";
            case IOErrorCode::InvalidArgument:
                return "InvalidArgument";
            case IOErrorCode::NotFound:
                return "NotFound";
            case IOErrorCode::PermissionDenied:
                return "PermissionDenied";
            case IOErrorCode::NotADirectory:
                return "NotADirectory";
            case IOErrorCode::IsADirectory:
                return "IsADirectory";
            case IOErrorCode::SystemError:
                return "SystemError";
            case IOErrorCode::NotSupported:
                return "NotSupported";
        }
        return "Unknown";
    }

    Utilities::Expected<std::string, IOError> ReadAll(IByteReader& reader)
    {
        static constexpr UIntSize chunkSize = 16 * 1024;
        std::array<Byte, chunkSize> temp {};
        std::string                 buffer;
        while (true)
        {
            auto readResult = reader.Read(std::span<Byte>(temp.data(), temp.size()));
            if (!readResult.HasValue())
                return Utilities::Expected<std::string, IOError>(Utilities::Unexpected<IOError>(std::move(readResult.ErrorUnsafe())));
            const UIntSize readBytes = readResult.ValueUnsafe();
            if (readBytes == 0)
                break;
            buffer.append(reinterpret_cast<const char*>(temp.data()), readBytes);
        }
        return Utilities::Expected<std::string, IOError>(std::move(buffer));
    }
}// namespace Lattice::IO
