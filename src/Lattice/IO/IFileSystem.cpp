#include <Lattice/IO/IFileSystem.hpp>

namespace Lattice::IO
{
    Utilities::Expected<SourceFile, IOError> IFileSystem::ReadFile(std::string_view path)
    {
        auto reader = Open(path);
        if (!reader.HasValue())
            return Utilities::Expected<SourceFile, IOError>(Utilities::Unexpected<IOError>(std::move(reader.ErrorUnsafe())));

        auto contents = ReadAll(*reader.ValueUnsafe());
        if (!contents.HasValue())
            return Utilities::Expected<SourceFile, IOError>(Utilities::Unexpected<IOError>(std::move(contents.ErrorUnsafe())));

        return Utilities::Expected<SourceFile, IOError>(SourceFile {std::string(path), std::move(contents.ValueUnsafe())});
    }
}// namespace Lattice::IO
