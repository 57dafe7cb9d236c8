#include <Lattice/Text/Span.hpp>

namespace Lattice::Text
{
    SourceLocation LocateOffset(std::string_view source, UInt32 offset) noexcept
    {
        SourceLocation location {};
        const UIntSize limit = std::min<UIntSize>(offset, source.size());
        for (UIntSize i = 0; i < limit; ++i)
        {
            const char c = source[i];
            if (c == '\n' || (c == '\r' && (i + 1 >= source.size() || source[i + 1] != '\n')))
            {
                ++location.line;
                location.column = 1;
            }
            else if (c != '\r')
            {
                ++location.column;
            }
        }
        location.offset = offset;
        return location;
    }
}// namespace Lattice::Text
