#include <Lattice/Analysis/SymbolExtractor.hpp>
#include <Lattice/Syntax/Parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>
#include <utility>

using namespace Lattice::Analysis;
using Lattice::Syntax::Grammar;
using Lattice::Syntax::Parser;
using Lattice::Syntax::SyntaxTree;

namespace
{
    SyntaxTree MustParse(std::string_view source, Grammar grammar = Grammar::Json)
    {
        auto result = Parser::Parse(source, grammar);
        REQUIRE(result.HasValue());
        return std::move(result).ValueUnsafe();
    }
}// namespace

TEST_CASE("SymbolExtractor: symbols follow document order", "[Analysis][SymbolExtractor]")
{
    constexpr std::string_view source  = R"({"name": "x", "deps": [{"url": "u"}, 3]})";
    const auto                 symbols = ExtractSymbols(MustParse(source));

    REQUIRE(symbols.size() == 6);
    CHECK(symbols[0].name == "root");
    CHECK(symbols[0].kind == SymbolKind::Object);
    CHECK(symbols[0].signature == "object");
    CHECK(symbols[0].range.Slice(source) == source);

    CHECK(symbols[1].name == "name");
    CHECK(symbols[1].kind == SymbolKind::Property);
    CHECK(symbols[1].signature == "string");
    CHECK(symbols[1].range.Slice(source) == R"("x")");

    CHECK(symbols[2].name == "deps");
    CHECK(symbols[2].kind == SymbolKind::Array);

    CHECK(symbols[3].name == "deps[0]");
    CHECK(symbols[3].kind == SymbolKind::Object);

    CHECK(symbols[4].name == "deps[0].url");
    CHECK(symbols[4].kind == SymbolKind::Property);

    CHECK(symbols[5].name == "deps[1]");
    CHECK(symbols[5].kind == SymbolKind::Element);
    CHECK(symbols[5].signature == "number");
}

TEST_CASE("SymbolExtractor: root arrays and scalars", "[Analysis][SymbolExtractor]")
{
    const auto elements = ExtractSymbols(MustParse("[true, null]"));
    REQUIRE(elements.size() == 3);
    CHECK(elements[0].kind == SymbolKind::Array);
    CHECK(elements[1].name == "[0]");
    CHECK(elements[1].signature == "boolean");
    CHECK(elements[2].name == "[1]");
    CHECK(elements[2].kind == SymbolKind::Element);

    const auto scalar = ExtractSymbols(MustParse("42"));
    REQUIRE(scalar.size() == 1);
    CHECK(scalar[0].name == "root");
    CHECK(scalar[0].kind == SymbolKind::Value);

    CHECK(ExtractSymbols(SyntaxTree {}).empty());
}

TEST_CASE("SymbolExtractor: ZON field names", "[Analysis][SymbolExtractor]")
{
    const auto symbols = ExtractSymbols(MustParse(R"(.{ .@"odd name" = .{ .inner = .yes } })", Grammar::Zon));
    REQUIRE(symbols.size() == 3);
    CHECK(symbols[1].name == "odd name");
    CHECK(symbols[2].name == "odd name.inner");
    CHECK(symbols[2].kind == SymbolKind::Property);
    CHECK(ToString(symbols[2].kind) == "property");
}
