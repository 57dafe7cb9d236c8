#include <Lattice/Analysis/ZonManifest.hpp>

#include <Lattice/Syntax/Identifier.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <utility>

namespace Lattice::Analysis
{
    namespace
    {
        using Lint::RuleType;
        using Lint::Severity;
        using Syntax::NodeId;
        using Syntax::NodeKind;
        using Syntax::SyntaxTree;

        constexpr std::array<FieldSpec, 10> kBuildFields {{
                {"name", FieldType::String, true},
                {"version", FieldType::String, true},
                {"fingerprint", FieldType::Number},
                {"minimum_zig_version", FieldType::String},
                {"min_zig_version", FieldType::String},
                {"dependencies", FieldType::Object},
                {"paths", FieldType::Array},
                {"description", FieldType::String},
                {"license", FieldType::String},
                {"homepage", FieldType::String},
        }};

        constexpr std::array<FieldSpec, 5> kDependencyFields {{
                {"url", FieldType::String},
                {"hash", FieldType::String},
                {"path", FieldType::String},
                {"lazy", FieldType::Boolean},
                {"version", FieldType::String},
        }};

        const ManifestSchema kBuildSchema {kBuildFields, false};
        const ManifestSchema kDependencySchema {kDependencyFields, false};

        constexpr std::array<std::string_view, 5> kUrlSchemes {"https://", "http://", "git+https://", "git://", "file://"};

        [[nodiscard]] std::string JoinPath(std::string_view parent, std::string_view name)
        {
            return parent.empty() ? std::string(name) : std::format("{}.{}", parent, name);
        }

        [[nodiscard]] NodeId RootObject(const SyntaxTree& tree) noexcept
        {
            const NodeId root = tree.Root();
            if (root == Syntax::InvalidNodeId || tree.GetNode(root).kind != NodeKind::Object)
                return Syntax::InvalidNodeId;
            return root;
        }

        [[nodiscard]] std::optional<std::string> StringMember(const SyntaxTree& tree, NodeId object, std::string_view key)
        {
            const NodeId value = tree.FindMember(object, key);
            if (value == Syntax::InvalidNodeId || tree.GetNode(value).kind != NodeKind::String)
                return std::nullopt;
            return std::string(tree.GetNode(value).text);
        }

        [[nodiscard]] bool HasKnownScheme(std::string_view url) noexcept
        {
            return std::any_of(kUrlSchemes.begin(), kUrlSchemes.end(),
                               [url](std::string_view scheme) { return url.starts_with(scheme); });
        }

        /// @brief Integer literal shapes: decimal, radix-prefixed and character literals.
        [[nodiscard]] bool IsIntegerLiteral(std::string_view text) noexcept
        {
            if (text.starts_with('-'))
                text.remove_prefix(1);
            if (text.empty())
                return false;
            if (text.front() == '\'' || text.starts_with("0x") || text.starts_with("0o") || text.starts_with("0b"))
                return true;
            return std::all_of(text.begin(), text.end(), [](char c) { return (c >= '0' && c <= '9') || c == '_'; });
        }

        void CheckDependencies(const SyntaxTree& tree, NodeId dependencies, std::vector<ValidationIssue>& issues)
        {
            for (const NodeId property : tree.Children(dependencies))
            {
                const std::string_view name      = tree.GetNode(tree.PropertyKey(property)).text;
                const NodeId           value     = tree.PropertyValue(property);
                const Text::Span       range     = tree.GetNode(property).span;
                const std::string      entryPath = JoinPath("dependencies", name);

                if (tree.GetNode(value).kind != NodeKind::Object)
                {
                    issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, entryPath,
                                                      std::format("Dependency '{}' must be a struct", name), tree.GetNode(value).span});
                    continue;
                }

                auto entryIssues = ValidateAgainstSchema(tree, value, kDependencySchema, entryPath);
                std::move(entryIssues.begin(), entryIssues.end(), std::back_inserter(issues));

                const NodeId url  = tree.FindMember(value, "url");
                const NodeId path = tree.FindMember(value, "path");
                if (url == Syntax::InvalidNodeId && path == Syntax::InvalidNodeId)
                {
                    issues.push_back(ValidationIssue {RuleType::MissingRequiredField, Severity::Error, entryPath,
                                                      std::format("Dependency '{}' must have either 'url' or 'path' field", name),
                                                      range});
                }
                else if (url != Syntax::InvalidNodeId && path != Syntax::InvalidNodeId)
                {
                    issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, entryPath,
                                                      std::format("Dependency '{}' cannot have both 'url' and 'path' fields", name),
                                                      range});
                }

                if (url != Syntax::InvalidNodeId && tree.GetNode(url).kind == NodeKind::String &&
                    !HasKnownScheme(tree.GetNode(url).text))
                {
                    issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Warning, JoinPath(entryPath, "url"),
                                                      std::format("Invalid URL format in '{}': {}", name, tree.GetNode(url).text),
                                                      tree.GetNode(url).span});
                }
            }
        }

        void WriteZigType(const JsonSchema& schema, UInt32 indent, std::string& out)
        {
            if (schema.nullable && schema.type != SchemaType::Null)
                out.push_back('?');

            switch (schema.type)
            {
                case SchemaType::Object:
                    if (!schema.properties || schema.properties->empty())
                    {
                        out += "struct {}";
                        break;
                    }
                    out += "struct {\n";
                    for (const SchemaProperty& property : *schema.properties)
                    {
                        out.append(static_cast<UIntSize>(indent + 1) * 4, ' ');
                        Syntax::AppendIdentifier(property.name, out);
                        out += ": ";
                        WriteZigType(property.schema, indent + 1, out);
                        out += ",\n";
                    }
                    out.append(static_cast<UIntSize>(indent) * 4, ' ');
                    out.push_back('}');
                    break;
                case SchemaType::Array:
                    out += "[]";
                    if (schema.items)
                        WriteZigType(*schema.items, indent, out);
                    else
                        out += "anytype";
                    break;
                case SchemaType::String:
                    out += "[]const u8";
                    break;
                case SchemaType::Number:
                    out += std::all_of(schema.examples.begin(), schema.examples.end(), IsIntegerLiteral) ? "i64" : "f64";
                    break;
                case SchemaType::Boolean:
                    out += "bool";
                    break;
                case SchemaType::Null:
                    out += "?anytype";
                    break;
                case SchemaType::Any:
                    out += "anytype";
                    break;
            }
        }
    }// namespace

    std::string_view ToString(FieldType type) noexcept
    {
        switch (type)
        {
            case FieldType::String:
                return "string";
            case FieldType::Number:
                return "number";
            case FieldType::Boolean:
                return "boolean";
            case FieldType::Object:
                return "object";
            case FieldType::Array:
                return "array";
        }
        return "unknown";
    }

    const FieldSpec* ManifestSchema::Find(std::string_view name) const noexcept
    {
        const auto found = std::find_if(fields.begin(), fields.end(), [name](const FieldSpec& spec) { return spec.name == name; });
        return found == fields.end() ? nullptr : &*found;
    }

    const ManifestSchema& BuildManifestSchema() noexcept
    {
        return kBuildSchema;
    }

    const ManifestSchema& DependencySchema() noexcept
    {
        return kDependencySchema;
    }

    bool IsBuildManifestKey(std::string_view key) noexcept
    {
        return key == "name" || key == "version" || key == "dependencies";
    }

    bool IsBuildManifest(const Syntax::SyntaxTree& tree) noexcept
    {
        const NodeId root = RootObject(tree);
        if (root == Syntax::InvalidNodeId)
            return false;
        const auto properties = tree.Children(root);
        return std::any_of(properties.begin(), properties.end(), [&tree](NodeId property) {
            return IsBuildManifestKey(tree.GetNode(tree.PropertyKey(property)).text);
        });
    }

    bool MatchesFieldType(FieldType type, Syntax::NodeKind kind, UIntSize childCount) noexcept
    {
        switch (type)
        {
            case FieldType::String:
                return kind == NodeKind::String;
            case FieldType::Number:
                return kind == NodeKind::Number;
            case FieldType::Boolean:
                return kind == NodeKind::Boolean;
            case FieldType::Object:
                return kind == NodeKind::Object;
            case FieldType::Array:
                return kind == NodeKind::Array || (kind == NodeKind::Object && childCount == 0);
        }
        return false;
    }

    std::vector<Dependency> ExtractDependencies(const Syntax::SyntaxTree& tree)
    {
        std::vector<Dependency> dependencies;
        const NodeId            root = RootObject(tree);
        if (root == Syntax::InvalidNodeId)
            return dependencies;

        const NodeId table = tree.FindMember(root, "dependencies");
        if (table == Syntax::InvalidNodeId || tree.GetNode(table).kind != NodeKind::Object)
            return dependencies;

        for (const NodeId property : tree.Children(table))
        {
            const NodeId value = tree.PropertyValue(property);
            if (tree.GetNode(value).kind != NodeKind::Object)
                continue;

            Dependency dependency;
            dependency.name    = std::string(tree.GetNode(tree.PropertyKey(property)).text);
            dependency.version = StringMember(tree, value, "version");
            dependency.url     = StringMember(tree, value, "url");
            dependency.hash    = StringMember(tree, value, "hash");
            dependency.path    = StringMember(tree, value, "path");
            dependency.span    = tree.GetNode(property).span;

            const NodeId lazy = tree.FindMember(value, "lazy");
            dependency.lazy   = lazy != Syntax::InvalidNodeId && tree.GetNode(lazy).kind == NodeKind::Boolean && tree.GetNode(lazy).boolean;
            dependencies.push_back(std::move(dependency));
        }
        return dependencies;
    }

    std::vector<ValidationIssue> ValidateAgainstSchema(const Syntax::SyntaxTree& tree,
                                                       Syntax::NodeId           object,
                                                       const ManifestSchema&    schema,
                                                       std::string_view         path)
    {
        std::vector<ValidationIssue> issues;
        if (object == Syntax::InvalidNodeId)
        {
            issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, std::string(path), "Expected object", {}});
            return issues;
        }

        const Syntax::Node& node = tree.GetNode(object);
        if (node.kind != NodeKind::Object)
        {
            issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, std::string(path),
                                              std::format("Expected object, got {}", Syntax::ToString(node.kind)), node.span});
            return issues;
        }

        for (const FieldSpec& spec : schema.fields)
        {
            if (spec.required && tree.FindMember(object, spec.name) == Syntax::InvalidNodeId)
            {
                issues.push_back(ValidationIssue {RuleType::MissingRequiredField, Severity::Error, JoinPath(path, spec.name),
                                                  std::format("Missing required field '{}'", spec.name),
                                                  Text::Span {node.span.start, node.span.start}});
            }
        }

        for (const NodeId property : tree.Children(object))
        {
            const Syntax::Node& key   = tree.GetNode(tree.PropertyKey(property));
            const Syntax::Node& value = tree.GetNode(tree.PropertyValue(property));
            const FieldSpec*    spec  = schema.Find(key.text);
            if (!spec)
            {
                if (!schema.allowUnknownFields)
                {
                    issues.push_back(ValidationIssue {RuleType::UnknownField, Severity::Warning, JoinPath(path, key.text),
                                                      std::format("Unknown field '{}'", key.text), key.span});
                }
                continue;
            }
            if (!MatchesFieldType(spec->type, value.kind, value.childCount))
            {
                issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, JoinPath(path, key.text),
                                                  std::format("Expected {}, got {}", ToString(spec->type), Syntax::ToString(value.kind)),
                                                  value.span});
            }
        }
        return issues;
    }

    std::vector<ValidationIssue> ValidateBuildZon(const Syntax::SyntaxTree& tree)
    {
        const NodeId root   = tree.Root();
        auto         issues = ValidateAgainstSchema(tree, root, kBuildSchema);
        if (RootObject(tree) == Syntax::InvalidNodeId)
            return issues;

        const NodeId dependencies = tree.FindMember(root, "dependencies");
        if (dependencies != Syntax::InvalidNodeId && tree.GetNode(dependencies).kind == NodeKind::Object)
            CheckDependencies(tree, dependencies, issues);
        return issues;
    }

    std::vector<ValidationIssue> ValidateDependencies(const Syntax::SyntaxTree& tree)
    {
        std::vector<ValidationIssue> issues;
        const NodeId                 root         = RootObject(tree);
        const NodeId                 dependencies = root == Syntax::InvalidNodeId ? Syntax::InvalidNodeId : tree.FindMember(root, "dependencies");
        if (dependencies == Syntax::InvalidNodeId)
        {
            const Text::Span range = tree.Root() == Syntax::InvalidNodeId ? Text::Span {} : tree.GetNode(tree.Root()).span;
            issues.push_back(ValidationIssue {RuleType::MissingRequiredField, Severity::Warning, std::string {},
                                              "Missing 'dependencies' field", Text::Span {range.start, range.start}});
            return issues;
        }

        const Syntax::Node& table = tree.GetNode(dependencies);
        if (table.kind != NodeKind::Object)
        {
            issues.push_back(ValidationIssue {RuleType::InvalidFieldType, Severity::Error, "dependencies",
                                              std::format("Expected object, got {}", Syntax::ToString(table.kind)), table.span});
            return issues;
        }

        CheckDependencies(tree, dependencies, issues);
        return issues;
    }

    std::string GenerateZigTypeDefinition(const JsonSchema& schema, std::string_view typeName)
    {
        std::string out = "pub const ";
        Syntax::AppendIdentifier(typeName, out);
        out += " = ";
        WriteZigType(schema, 0, out);
        out += ";\n";
        return out;
    }
}// namespace Lattice::Analysis
