/// @file LintConfig.hpp
/// @brief Loads linter options and rule toggles from a JSON or ZON document.
///
/// Recognized keys: `max_depth`, `max_string_length`, `max_number_precision`,
/// `max_object_keys`, `max_array_elements`, `warn_on_deep_nesting` (non-negative integers),
/// `allow_duplicate_keys`, `allow_leading_zeros`, `allow_comments` (booleans) and `rules`, an
/// object mapping rule names to booleans. Keys that are absent keep their defaults.
///
/// ### Example (ZON)
/// @code
/// .{
///     .max_depth = 64,
///     .allow_comments = true,
///     .rules = .{ .large_structure = true, .deep_nesting = false },
/// }
/// @endcode
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/IO/IFileSystem.hpp>
#include <Lattice/Lint/Linter.hpp>
#include <Lattice/Lint/Rule.hpp>
#include <Lattice/Logging/Logger.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>
#include <Lattice/Text/Span.hpp>
#include <Lattice/Utilities/Expected.hpp>

#include <string>
#include <string_view>

namespace Lattice::Config
{
    enum class ConfigErrorCode : UInt8
    {
        None,
        ReadFailed,
        ParseFailed,
        NotAnObject,
        UnknownKey,
        UnknownRule,
        InvalidType,
        InvalidValue,
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(ConfigErrorCode code) noexcept;

    struct ConfigError
    {
        ConfigErrorCode code {ConfigErrorCode::None};
        std::string     path {};
        Text::Span      span {};
        std::string     message {};
    };

    struct LintConfig
    {
        Lint::LinterOptions options {};
        Lint::EnabledRules  rules {Lint::EnabledRules::Defaults()};
    };

    using ConfigResult = Utilities::Expected<LintConfig, ConfigError>;

    /// @brief Reads a configuration from an already parsed document.
    [[nodiscard]] LATTICE_API ConfigResult LoadLintConfig(const Syntax::SyntaxTree& tree);

    /// @brief Parses `text` as `grammar` and reads the configuration from it.
    [[nodiscard]] LATTICE_API ConfigResult ParseLintConfig(std::string_view text, Syntax::Grammar grammar);

    /// @brief Loads `path` from `fileSystem`; the grammar follows the file extension.
    ///
    /// `logger` also becomes the logger of the returned linter options.
    [[nodiscard]] LATTICE_API ConfigResult LoadLintConfig(IO::IFileSystem&       fileSystem,
                                                          std::string_view       path,
                                                          const Logging::Logger* logger = nullptr);
}// namespace Lattice::Config
