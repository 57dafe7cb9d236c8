// main.cpp
#include <iostream>
#include <string>
#include <string_view>

#include <Lattice/Lattice.hpp>

using namespace Lattice;

namespace
{
    constexpr std::string_view kManifest = R"(.{
    .name = "lattice-demo",
    .version = "0.3.1",
    .minimum_zig_version = "0.13.0",
    // Dependencies are fetched by URL.
    .dependencies = .{
        .zlib = .{
            .url = "https://example.com/zlib-1.3.tar.gz",
            .hash = "1220aa55",
        },
    },
    .paths = .{ "build.zig", "build.zig.zon", "src" },
})";

    constexpr std::string_view kUsers = R"({
    "users": [
        {"id": 1, "email": "ada@example.com", "roles": ["admin"]},
        {"id": 2, "email": "grace@example.com", "roles": []}
    ],
    "item_0": 7,
    "item_1": 3.14159265358979323846,
    "id": 1,
    "id": 2
})";

    void PrintDiagnostics(std::string_view source, const std::vector<Lint::Diagnostic>& diagnostics)
    {
        for (const Lint::Diagnostic& diagnostic : diagnostics)
        {
            const auto location = Text::LocateOffset(source, diagnostic.range.start);
            std::cout << "  " << location.line << ':' << location.column << ' ' << Lint::ToString(diagnostic.severity) << " ["
                      << Lint::ToString(diagnostic.rule) << "] " << diagnostic.message << '\n';
        }
        if (diagnostics.empty())
            std::cout << "  no diagnostics\n";
    }

    void PrintSchema(const Analysis::JsonSchema& schema, std::string_view name, int indent)
    {
        std::cout << std::string(static_cast<std::size_t>(indent) * 2, ' ') << name << ": " << Analysis::ToString(schema.type);
        if (!schema.examples.empty())
            std::cout << " (e.g. " << schema.examples.front() << ')';
        std::cout << '\n';

        if (schema.properties)
        {
            for (const Analysis::SchemaProperty& property : *schema.properties)
                PrintSchema(property.schema, property.name, indent + 1);
        }
        if (schema.items)
            PrintSchema(*schema.items, "[]", indent + 1);
    }

    void Inspect(std::string_view title, std::string_view source, Syntax::Grammar grammar)
    {
        std::cout << "== " << title << " (" << Syntax::ToString(grammar) << ") ==\n";

        Lint::Linter linter;
        std::cout << "lint:\n";
        PrintDiagnostics(source, linter.Lint(source, grammar, Lint::EnabledRules::All()));

        Syntax::ParseOptions options;
        options.allowComments = true;
        options.logger        = &Logging::Logger::Stderr();

        auto parsed = Syntax::Parser::Parse(source, grammar, options);
        if (!parsed.HasValue())
        {
            const Syntax::ParseError& error = parsed.ErrorUnsafe();
            std::cout << "parse failed at " << error.location.line << ':' << error.location.column << ": " << error.message << "\n\n";
            return;
        }

        const Syntax::SyntaxTree& tree = parsed.ValueUnsafe();
        std::cout << "json: " << Syntax::WriteJson(tree) << '\n';

        Analysis::SchemaAnalyzer analyzer;
        const Analysis::JsonSchema schema = analyzer.InferSchema(tree);
        std::cout << "schema:\n";
        PrintSchema(schema, "root", 1);

        for (const std::string& hint : analyzer.SuggestOptimizations(schema))
            std::cout << "hint: " << hint << '\n';

        if (Analysis::IsBuildManifest(tree))
        {
            for (const Analysis::Dependency& dependency : Analysis::ExtractDependencies(tree))
                std::cout << "dependency: " << dependency.name << ' ' << dependency.url.value_or(dependency.path.value_or("?")) << '\n';
            for (const Analysis::ValidationIssue& issue : Analysis::ValidateBuildZon(tree))
                std::cout << "manifest " << Lint::ToString(issue.severity) << ": " << issue.path << ": " << issue.message << '\n';
            std::cout << Analysis::GenerateZigTypeDefinition(schema, "Manifest");
        }

        const Analysis::DocumentStatistics stats = Analysis::GenerateStatistics(tree);
        std::cout << "depth " << stats.maxDepth << ", keys " << stats.totalKeys << ", values " << stats.totalValues
                  << ", complexity " << stats.complexityScore << "\n\n";
    }
}// namespace

int main()
{
    Inspect("build manifest", kManifest, Syntax::Grammar::Zon);
    Inspect("user export", kUsers, Syntax::Grammar::Json);
    return 0;
}
