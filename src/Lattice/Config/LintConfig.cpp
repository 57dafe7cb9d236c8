#include <Lattice/Config/LintConfig.hpp>

#include <Lattice/Syntax/Parser.hpp>

#include <cmath>
#include <format>
#include <limits>
#include <optional>

namespace Lattice::Config
{
    namespace
    {
        using Syntax::NodeId;
        using Syntax::NodeKind;
        using Syntax::SyntaxTree;

        [[nodiscard]] ConfigResult Fail(ConfigErrorCode code, std::string path, Text::Span span, std::string message)
        {
            return ConfigResult(Utilities::Unexpected<ConfigError>(ConfigError {code, std::move(path), span, std::move(message)}));
        }

        /// @brief Reads a non-negative integral number into `out`; returns the failure otherwise.
        [[nodiscard]] std::optional<ConfigError> ReadCount(const SyntaxTree& tree, NodeId id, std::string_view key, UInt32& out)
        {
            const Syntax::Node& node = tree.GetNode(id);
            if (node.kind != NodeKind::Number)
                return ConfigError {ConfigErrorCode::InvalidType, std::string(key), node.span, std::format("'{}' must be a number", key)};

            const F64 value = node.number;
            if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value ||
                value > static_cast<F64>(std::numeric_limits<UInt32>::max()))
            {
                return ConfigError {ConfigErrorCode::InvalidValue, std::string(key), node.span,
                                    std::format("'{}' must be a non-negative integer, got {}", key, node.text)};
            }
            out = static_cast<UInt32>(value);
            return std::nullopt;
        }

        [[nodiscard]] std::optional<ConfigError> ReadFlag(const SyntaxTree& tree, NodeId id, std::string_view key, bool& out)
        {
            const Syntax::Node& node = tree.GetNode(id);
            if (node.kind != NodeKind::Boolean)
                return ConfigError {ConfigErrorCode::InvalidType, std::string(key), node.span, std::format("'{}' must be a boolean", key)};
            out = node.boolean;
            return std::nullopt;
        }

        [[nodiscard]] std::optional<ConfigError> ReadRules(const SyntaxTree& tree, NodeId id, Lint::EnabledRules& rules)
        {
            const Syntax::Node& node = tree.GetNode(id);
            if (node.kind != NodeKind::Object)
                return ConfigError {ConfigErrorCode::InvalidType, "rules", node.span, "'rules' must be an object"};

            for (const NodeId property : tree.Children(id))
            {
                const Syntax::Node& key  = tree.GetNode(tree.PropertyKey(property));
                const std::string   path = std::format("rules.{}", key.text);

                const auto rule = Lint::RuleFromName(key.text);
                if (!rule)
                    return ConfigError {ConfigErrorCode::UnknownRule, path, key.span, std::format("Unknown rule '{}'", key.text)};

                bool enabled = false;
                if (auto error = ReadFlag(tree, tree.PropertyValue(property), path, enabled))
                    return error;
                rules.Set(*rule, enabled);
            }
            return std::nullopt;
        }

        [[nodiscard]] std::optional<ConfigError> ReadEntry(const SyntaxTree& tree, NodeId property, LintConfig& config)
        {
            const Syntax::Node&    key   = tree.GetNode(tree.PropertyKey(property));
            const NodeId           value = tree.PropertyValue(property);
            const std::string_view name  = key.text;
            Lint::LinterOptions&   opts  = config.options;

            if (name == "max_depth")
                return ReadCount(tree, value, name, opts.maxDepth);
            if (name == "max_string_length")
                return ReadCount(tree, value, name, opts.maxStringLength);
            if (name == "max_number_precision")
                return ReadCount(tree, value, name, opts.maxNumberPrecision);
            if (name == "max_object_keys")
                return ReadCount(tree, value, name, opts.maxObjectKeys);
            if (name == "max_array_elements")
                return ReadCount(tree, value, name, opts.maxArrayElements);
            if (name == "warn_on_deep_nesting")
                return ReadCount(tree, value, name, opts.warnOnDeepNesting);
            if (name == "allow_duplicate_keys")
                return ReadFlag(tree, value, name, opts.allowDuplicateKeys);
            if (name == "allow_leading_zeros")
                return ReadFlag(tree, value, name, opts.allowLeadingZeros);
            if (name == "allow_comments")
                return ReadFlag(tree, value, name, opts.allowComments);
            if (name == "rules")
                return ReadRules(tree, value, config.rules);

            return ConfigError {ConfigErrorCode::UnknownKey, std::string(name), key.span, std::format("Unknown key '{}'", name)};
        }
    }// namespace

    std::string_view ToString(ConfigErrorCode code) noexcept
    {
        switch (code)
        {
            case ConfigErrorCode::None:
                return "None";
            case ConfigErrorCode::ReadFailed:
                return "ReadFailed";
            case ConfigErrorCode::ParseFailed:
                return "ParseFailed";
            case ConfigErrorCode::NotAnObject:
                return "NotAnObject";
            case ConfigErrorCode::UnknownKey:
                return "UnknownKey";
            case ConfigErrorCode::UnknownRule:
                return "UnknownRule";
            case ConfigErrorCode::InvalidType:
                return "InvalidType";
            case ConfigErrorCode::InvalidValue:
                return "InvalidValue";
        }
        return "Unknown";
    }

    ConfigResult LoadLintConfig(const SyntaxTree& tree)
    {
        if (tree.Root() == Syntax::InvalidNodeId || tree.GetNode(tree.Root()).kind != NodeKind::Object)
        {
            const Text::Span span = tree.Root() == Syntax::InvalidNodeId ? Text::Span {} : tree.GetNode(tree.Root()).span;
            return Fail(ConfigErrorCode::NotAnObject, {}, span, "Configuration root must be an object");
        }

        LintConfig config;
        for (const NodeId property : tree.Children(tree.Root()))
        {
            if (auto error = ReadEntry(tree, property, config))
                return ConfigResult(Utilities::Unexpected<ConfigError>(std::move(*error)));
        }
        return ConfigResult(std::move(config));
    }

    ConfigResult ParseLintConfig(std::string_view text, Syntax::Grammar grammar)
    {
        Syntax::ParseOptions options;
        options.copyStrings = true;

        auto tree = Syntax::Parser::Parse(text, grammar, options);
        if (!tree.HasValue())
        {
            const Syntax::ParseError& error = tree.ErrorUnsafe();
            return Fail(ConfigErrorCode::ParseFailed, {}, error.span,
                        std::format("{}:{}: {}", error.location.line, error.location.column, error.message));
        }
        return LoadLintConfig(tree.ValueUnsafe());
    }

    ConfigResult LoadLintConfig(IO::IFileSystem& fileSystem, std::string_view path, const Logging::Logger* logger)
    {
        auto file = fileSystem.ReadFile(path);
        if (!file.HasValue())
        {
            const IO::IOError& error = file.ErrorUnsafe();
            return Fail(ConfigErrorCode::ReadFailed, std::string(path), {},
                        std::format("Cannot read '{}': {}", path, error.message));
        }

        const IO::SourceFile& source = file.ValueUnsafe();
        auto                  result = ParseLintConfig(source.Text(), source.DetectGrammar());
        if (!result.HasValue())
        {
            ConfigError error = std::move(result).ErrorUnsafe();
            if (error.code == ConfigErrorCode::ParseFailed)
                error.message = std::format("{}:{}", path, error.message);
            return ConfigResult(Utilities::Unexpected<ConfigError>(std::move(error)));
        }

        result.ValueUnsafe().options.logger = logger;
        Logging::Log(logger, Logging::LogLevel::Info, "loaded lint configuration from {} ({} rules enabled)", path,
                     result.ValueUnsafe().rules.Count());
        return result;
    }
}// namespace Lattice::Config
