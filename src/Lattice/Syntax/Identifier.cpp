#include <Lattice/Syntax/Identifier.hpp>

#include <Lattice/Syntax/Escapes.hpp>

#include "LexerCommon.hpp"

#include <algorithm>
#include <array>

namespace Lattice::Syntax
{
    namespace
    {
        // Sorted for binary search.
        constexpr std::array<std::string_view, 49> kReservedWords {
                "addrspace", "align", "allowzero", "and", "anyframe", "anytype", "asm",
                "async", "await", "break", "callconv", "catch", "comptime", "const",
                "continue", "defer", "else", "enum", "errdefer", "error", "export",
                "extern", "fn", "for", "if", "inline", "linksection", "noalias",
                "noinline", "nosuspend", "opaque", "or", "orelse", "packed", "pub",
                "resume", "return", "struct", "suspend", "switch", "test", "threadlocal",
                "try", "union", "unreachable", "usingnamespace", "var", "volatile", "while",
        };

        constexpr std::array<std::string_view, 6> kValueWords {"true", "false", "null", "undefined", "inf", "nan"};
    }// namespace

    bool IsReservedWord(std::string_view word) noexcept
    {
        return std::binary_search(kReservedWords.begin(), kReservedWords.end(), word);
    }

    bool IsBareIdentifier(std::string_view name) noexcept
    {
        if (name.empty() || !detail::IsIdentifierStart(name.front()))
            return false;
        if (!std::all_of(name.begin(), name.end(), detail::IsIdentifierChar))
            return false;
        if (std::find(kValueWords.begin(), kValueWords.end(), name) != kValueWords.end())
            return false;
        return !IsReservedWord(name);
    }

    void AppendIdentifier(std::string_view name, std::string& out)
    {
        if (IsBareIdentifier(name))
        {
            out += name;
            return;
        }
        out.push_back('@');
        AppendQuoted(Grammar::Zon, name, out);
    }
}// namespace Lattice::Syntax
