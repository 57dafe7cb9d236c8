#include <Lattice/Text/Utf8.hpp>

namespace Lattice::Text
{
    UIntSize FindInvalidUtf8(std::string_view text) noexcept
    {
        const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
        const UIntSize size = text.size();
        UIntSize i = 0;
        while (i < size)
        {
            const unsigned char lead = bytes[i];
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            const UInt32 length = SequenceLength(lead);
            if (length == 0 || i + length > size)
                return i;

            const unsigned char second = bytes[i + 1];
            unsigned char lower = 0x80;
            unsigned char upper = 0xBF;
            if (lead == 0xE0)
                lower = 0xA0;
            else if (lead == 0xED)
                upper = 0x9F;
            else if (lead == 0xF0)
                lower = 0x90;
            else if (lead == 0xF4)
                upper = 0x8F;
            if (second < lower || second > upper)
                return i;

            for (UInt32 k = 2; k < length; ++k)
            {
                if ((bytes[i + k] & 0xC0) != 0x80)
                    return i;
            }
            i += length;
        }
        return size;
    }

    UIntSize EncodeUtf8(Char32 codepoint, char* out) noexcept
    {
        if (codepoint <= 0x7F)
        {
            out[0] = static_cast<char>(codepoint);
            return 1;
        }
        if (codepoint <= 0x7FF)
        {
            out[0] = static_cast<char>(0xC0 | (codepoint >> 6));
            out[1] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 2;
        }
        if (codepoint <= 0xFFFF)
        {
            out[0] = static_cast<char>(0xE0 | (codepoint >> 12));
            out[1] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (codepoint & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | (codepoint >> 18));
        out[1] = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 4;
    }

    void AppendUtf8(std::string& out, Char32 codepoint)
    {
        char buffer[4];
        const UIntSize length = EncodeUtf8(codepoint, buffer);
        out.append(buffer, length);
    }
}// namespace Lattice::Text
