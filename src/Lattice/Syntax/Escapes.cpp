#include <Lattice/Syntax/Escapes.hpp>

#include <Lattice/Text/Utf8.hpp>

#include "LexerCommon.hpp"

#include <format>

namespace Lattice::Syntax
{
    namespace
    {
        /// Writes through `out` when it is non-null; otherwise only counts.
        struct DecodeWriter
        {
            char*    out {nullptr};
            UIntSize written {0};

            void Put(char c) noexcept
            {
                if (out)
                    out[written] = c;
                ++written;
            }

            void PutCodePoint(Char32 codepoint) noexcept
            {
                char       buffer[4];
                const auto length = Text::EncodeUtf8(codepoint, buffer);
                for (UIntSize i = 0; i < length; ++i)
                    Put(buffer[i]);
            }
        };

        [[nodiscard]] DecodeStatus DecodeJson(std::string_view body, DecodeWriter& writer) noexcept
        {
            UInt32 i = 0;
            while (i < body.size())
            {
                const char c = body[i];
                if (c != '\\')
                {
                    writer.Put(c);
                    ++i;
                    continue;
                }
                if (i + 1 >= body.size())
                    return DecodeStatus::InvalidEscape;

                const char escape = body[i + 1];
                i += 2;
                switch (escape)
                {
                    case '"':
                    case '\\':
                    case '/':
                        writer.Put(escape);
                        break;
                    case 'b':
                        writer.Put('\b');
                        break;
                    case 'f':
                        writer.Put('\f');
                        break;
                    case 'n':
                        writer.Put('\n');
                        break;
                    case 'r':
                        writer.Put('\r');
                        break;
                    case 't':
                        writer.Put('\t');
                        break;
                    case 'u': {
                        UInt32 codepoint = 0;
                        if (!detail::ReadHex(body, i, 4, codepoint))
                            return DecodeStatus::InvalidUnicodeEscape;
                        i += 4;
                        if (Text::IsHighSurrogate(codepoint))
                        {
                            UInt32 low = 0;
                            if (i + 1 >= body.size() || body[i] != '\\' || body[i + 1] != 'u' ||
                                !detail::ReadHex(body, i + 2, 4, low) || !Text::IsLowSurrogate(low))
                            {
                                return DecodeStatus::InvalidUnicodeEscape;
                            }
                            i += 6;
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        }
                        else if (Text::IsLowSurrogate(codepoint))
                        {
                            return DecodeStatus::InvalidUnicodeEscape;
                        }
                        writer.PutCodePoint(codepoint);
                        break;
                    }
                    default:
                        return DecodeStatus::InvalidEscape;
                }
            }
            return DecodeStatus::Ok;
        }

        [[nodiscard]] DecodeStatus DecodeZon(std::string_view body, DecodeWriter& writer) noexcept
        {
            UInt32 i = 0;
            while (i < body.size())
            {
                const char c = body[i];
                if (c != '\\')
                {
                    writer.Put(c);
                    ++i;
                    continue;
                }
                if (i + 1 >= body.size())
                    return DecodeStatus::InvalidEscape;

                const char escape = body[i + 1];
                i += 2;
                switch (escape)
                {
                    case 'n':
                        writer.Put('\n');
                        break;
                    case 'r':
                        writer.Put('\r');
                        break;
                    case 't':
                        writer.Put('\t');
                        break;
                    case '\\':
                    case '\'':
                    case '"':
                        writer.Put(escape);
                        break;
                    case 'x': {
                        UInt32 value = 0;
                        if (!detail::ReadHex(body, i, 2, value))
                            return DecodeStatus::InvalidEscape;
                        i += 2;
                        writer.Put(static_cast<char>(value));
                        break;
                    }
                    case 'u': {
                        if (i >= body.size() || body[i] != '{')
                            return DecodeStatus::InvalidUnicodeEscape;
                        ++i;
                        UInt32 value  = 0;
                        UInt32 digits = 0;
                        while (i < body.size() && Text::IsHexDigit(body[i]) && digits < 7)
                        {
                            value = (value << 4) | Text::HexValue(body[i]);
                            ++digits;
                            ++i;
                        }
                        if (i >= body.size() || body[i] != '}' || digits == 0 || digits > 6 || value > Text::MaxCodePoint ||
                            Text::IsSurrogate(value))
                        {
                            return DecodeStatus::InvalidUnicodeEscape;
                        }
                        ++i;
                        writer.PutCodePoint(value);
                        break;
                    }
                    default:
                        return DecodeStatus::InvalidEscape;
                }
            }
            return DecodeStatus::Ok;
        }

        void DecodeMultiline(std::string_view text, DecodeWriter& writer) noexcept
        {
            bool   first = true;
            UInt32 pos   = 0;
            while (pos < text.size())
            {
                const auto marker = text.find("\\\\", pos);
                if (marker == std::string_view::npos)
                    break;
                const UInt32 lineStart = static_cast<UInt32>(marker + 2);
                const UInt32 lineEnd   = detail::LineEnd(text, lineStart);
                if (!first)
                    writer.Put('\n');
                first = false;
                for (UInt32 i = lineStart; i < lineEnd; ++i)
                    writer.Put(text[i]);
                pos = lineEnd;
            }
        }

        [[nodiscard]] DecodeStatus Decode(Grammar grammar, std::string_view body, const Token* token, DecodeWriter& writer) noexcept
        {
            if (token && token->Has(TokenFlags::Multiline))
            {
                DecodeMultiline(body, writer);
                return DecodeStatus::Ok;
            }
            return grammar == Grammar::Json ? DecodeJson(body, writer) : DecodeZon(body, writer);
        }
    }// namespace

    std::string_view LiteralBody(std::string_view tokenText, const Token& token) noexcept
    {
        if (token.Has(TokenFlags::Multiline) || tokenText.empty())
            return tokenText;
        if (tokenText.front() == '.')
        {
            if (tokenText.size() >= 4 && tokenText[1] == '@')
                return tokenText.substr(3, tokenText.size() - 4);
            return tokenText.substr(1);
        }
        if ((tokenText.front() == '"' || tokenText.front() == '\'') && tokenText.size() >= 2)
            return tokenText.substr(1, tokenText.size() - 2);
        return tokenText;
    }

    DecodeStatus DecodeLiteral(Grammar grammar, std::string_view body, const Token& token, char* out, UIntSize& written) noexcept
    {
        DecodeWriter writer {out, 0};
        const auto   status = Decode(grammar, body, &token, writer);
        written             = writer.written;
        return status;
    }

    DecodeStatus DecodeLiteral(Grammar grammar, std::string_view body, const Token& token, std::string& out)
    {
        out.resize(DecodedCapacity(body));
        UIntSize   written = 0;
        const auto status  = DecodeLiteral(grammar, body, token, out.data(), written);
        out.resize(status == DecodeStatus::Ok ? written : 0);
        return status;
    }

    DecodeStatus ValidateEscapes(Grammar grammar, std::string_view body) noexcept
    {
        DecodeWriter writer {};
        return Decode(grammar, body, nullptr, writer);
    }

    void AppendQuoted(Grammar grammar, std::string_view text, std::string& out)
    {
        out.push_back('"');
        for (const char c : text)
        {
            switch (c)
            {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        if (grammar == Grammar::Json)
                            out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                        else
                            out += std::format("\\x{:02x}", static_cast<unsigned>(c));
                    }
                    else
                    {
                        out.push_back(c);
                    }
                    break;
            }
        }
        out.push_back('"');
    }
}// namespace Lattice::Syntax
