/// @file Identifier.hpp
/// @brief Naming rules for ZON field names and enum literals.
#pragma once

#include <Lattice/Defines.hpp>

#include <string>
#include <string_view>

namespace Lattice::Syntax
{
    /// @brief Zig keywords; a field or enum literal spelled as one needs the `@"..."` form.
    [[nodiscard]] LATTICE_API bool IsReservedWord(std::string_view word) noexcept;

    /// @brief True when `name` can be written after a bare `.`: identifier characters only,
    /// not a keyword and not one of the ZON value words (`true`, `null`, `inf`, ...).
    [[nodiscard]] LATTICE_API bool IsBareIdentifier(std::string_view name) noexcept;

    /// @brief Appends `name` bare when possible, else as `@"..."` with escapes.
    LATTICE_API void AppendIdentifier(std::string_view name, std::string& out);
}// namespace Lattice::Syntax
