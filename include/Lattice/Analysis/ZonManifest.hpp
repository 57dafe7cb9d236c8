/// @file ZonManifest.hpp
/// @brief Package-manifest analysis for `build.zig.zon` documents.
///
/// A manifest is recognized by its root keys (`name`, `version` or `dependencies`). The
/// known-field tables here are shared with the linter, which checks the same schema while
/// streaming tokens.
#pragma once

#include <Lattice/Analysis/JsonSchema.hpp>
#include <Lattice/Defines.hpp>
#include <Lattice/Lint/Rule.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>
#include <Lattice/Text/Span.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Lattice::Analysis
{
    enum class FieldType : UInt8
    {
        String,
        Number,
        Boolean,
        Object,
        Array,
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(FieldType type) noexcept;

    struct FieldSpec
    {
        std::string_view name;
        FieldType        type;
        bool             required {false};
    };

    struct LATTICE_API ManifestSchema
    {
        std::span<const FieldSpec> fields;
        bool                       allowUnknownFields {false};

        [[nodiscard]] const FieldSpec* Find(std::string_view name) const noexcept;
    };

    /// @brief Root of a `build.zig.zon`: `name` and `version` are required.
    [[nodiscard]] LATTICE_API const ManifestSchema& BuildManifestSchema() noexcept;

    /// @brief One entry of the `dependencies` struct.
    [[nodiscard]] LATTICE_API const ManifestSchema& DependencySchema() noexcept;

    /// @brief Root keys that mark a document as a build manifest.
    [[nodiscard]] LATTICE_API bool IsBuildManifestKey(std::string_view key) noexcept;

    /// @brief True when `tree` is rooted at an object with a build-manifest key.
    [[nodiscard]] LATTICE_API bool IsBuildManifest(const Syntax::SyntaxTree& tree) noexcept;

    /// @brief Whether a value of `kind` satisfies `type`. An empty struct counts as an empty array.
    [[nodiscard]] LATTICE_API bool MatchesFieldType(FieldType type, Syntax::NodeKind kind, UIntSize childCount) noexcept;

    struct Dependency
    {
        std::string                name;
        std::optional<std::string> version {};
        std::optional<std::string> url {};
        std::optional<std::string> hash {};
        std::optional<std::string> path {};
        bool                       lazy {false};
        Text::Span                 span {};///< Whole `.name = .{...}` entry.
    };

    /// @brief Lists the entries of the root `dependencies` struct in field order.
    ///
    /// Entries whose value is not a struct are skipped; string members other than the known
    /// ones are ignored. Returns an empty list when the root has no `dependencies` object.
    [[nodiscard]] LATTICE_API std::vector<Dependency> ExtractDependencies(const Syntax::SyntaxTree& tree);

    /// @brief One schema violation found by a manifest validator.
    ///
    /// `path` is the dotted field path (`dependencies.zlib.url`); it is empty for the root.
    struct ValidationIssue
    {
        Lint::RuleType rule {Lint::RuleType::InvalidFieldType};
        Lint::Severity severity {Lint::Severity::Error};
        std::string    path;
        std::string    message;
        Text::Span     range {};
    };

    /// @brief Checks the members of `object` against `schema`: missing required fields, unknown
    /// fields (unless the schema allows them) and values of the wrong type.
    [[nodiscard]] LATTICE_API std::vector<ValidationIssue> ValidateAgainstSchema(const Syntax::SyntaxTree& tree,
                                                                                 Syntax::NodeId           object,
                                                                                 const ManifestSchema&    schema,
                                                                                 std::string_view         path = {});

    /// @brief Validates the root of a `build.zig.zon` and each of its dependencies.
    [[nodiscard]] LATTICE_API std::vector<ValidationIssue> ValidateBuildZon(const Syntax::SyntaxTree& tree);

    /// @brief Validates only the `dependencies` struct.
    ///
    /// A missing struct is a warning; each entry needs exactly one of `url` and `path`, and a
    /// `url` must use the `https`, `http`, `git+https`, `git` or `file` scheme.
    [[nodiscard]] LATTICE_API std::vector<ValidationIssue> ValidateDependencies(const Syntax::SyntaxTree& tree);

    /// @brief Renders `schema` as a Zig declaration: `pub const <typeName> = <type>;\n`.
    ///
    /// Objects become `struct { ... }` with four-space indentation per level, arrays `[]T`
    /// (`[]anytype` without items), strings `[]const u8`, numbers `i64` when every example is
    /// an integer literal and `f64` otherwise, booleans `bool`, null `?anytype` and `Any`
    /// `anytype`. Nullable schemas get a `?` prefix. Names that are not bare identifiers are
    /// written in the `@"..."` form.
    [[nodiscard]] LATTICE_API std::string GenerateZigTypeDefinition(const JsonSchema& schema, std::string_view typeName);
}// namespace Lattice::Analysis
