#include <Lattice/Syntax/Parser.hpp>
#include <Lattice/Syntax/TreeWriter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <utility>

using namespace Lattice::Syntax;

namespace
{
    SyntaxTree MustParse(std::string_view source, Grammar grammar)
    {
        auto result = Parser::Parse(source, grammar);
        REQUIRE(result.HasValue());
        return std::move(result).ValueUnsafe();
    }
}// namespace

TEST_CASE("TreeWriter: compact JSON output", "[Syntax][TreeWriter]")
{
    const SyntaxTree tree = MustParse(R"({ "a" : [1, 2.5, "x\ny"], "b": null, "c": true })", Grammar::Json);
    CHECK(WriteJson(tree) == R"({"a":[1,2.5,"x\ny"],"b":null,"c":true})");
}

TEST_CASE("TreeWriter: ZON output uses field syntax", "[Syntax][TreeWriter]")
{
    const SyntaxTree tree = MustParse(R"({"name": "x", "list": [1, false], "two words": -3, "null": 0})", Grammar::Json);
    CHECK(WriteZon(tree) == R"(.{.name="x",.list=.{1,false},.@"two words"=-3,.@"null"=0})");
    CHECK(WriteTree(tree, Grammar::Zon) == WriteZon(tree));

    const SyntaxTree keywords = MustParse(R"({"fn": 1, "error": 2, "errors": 3})", Grammar::Json);
    CHECK(WriteZon(keywords) == R"(.{.@"fn"=1,.@"error"=2,.errors=3})");
}

TEST_CASE("TreeWriter: non-finite numbers", "[Syntax][TreeWriter]")
{
    const SyntaxTree tree = MustParse(".{ .up = inf, .down = -inf, .none = nan }", Grammar::Zon);
    CHECK(WriteJson(tree) == R"({"up":1e999,"down":-1e999,"none":null})");
    CHECK(WriteZon(tree) == ".{.up=inf,.down=-inf,.none=nan}");
}

TEST_CASE("TreeWriter: JSON numbers that overflow survive a round trip", "[Syntax][TreeWriter]")
{
    const SyntaxTree json = MustParse("[-0.5e311, 1e400, 2E+500, -1e-400]", Grammar::Json);

    const std::string text = WriteJson(json);
    CHECK(text == "[-1e999,1e999,1e999,0]");
    CHECK(StructurallyEqual(json, MustParse(text, Grammar::Json)));

    const SyntaxTree zon = MustParse(WriteZon(json), Grammar::Zon);
    CHECK(StructurallyEqual(json, zon));
    CHECK(WriteJson(zon) == text);
}

TEST_CASE("TreeWriter: converting JSON to ZON preserves structure", "[Syntax][TreeWriter]")
{
    constexpr std::string_view source = R"({
        "package": "lattice",
        "version": [0, 3, 1],
        "ratio": 0.125,
        "quote": "say \"hi\"",
        "nested": {"deep": {"flag": true, "list": [null, "tab\there"]}}
    })";

    const SyntaxTree json = MustParse(source, Grammar::Json);

    const std::string zonText = WriteZon(json);
    const SyntaxTree  zon     = MustParse(zonText, Grammar::Zon);
    CHECK(StructurallyEqual(json, zon));

    const std::string jsonText = WriteJson(zon);
    const SyntaxTree  again    = MustParse(jsonText, Grammar::Json);
    CHECK(StructurallyEqual(json, again));
    CHECK(WriteJson(again) == jsonText);
}

TEST_CASE("TreeWriter: StructurallyEqual compares values, not spelling", "[Syntax][TreeWriter]")
{
    const SyntaxTree a = MustParse(R"({"n": 1.0, "s": "A"})", Grammar::Json);
    const SyntaxTree b = MustParse(R"({ "n" : 1, "s" : "A" })", Grammar::Json);
    const SyntaxTree c = MustParse(R"({"n": 2, "s": "A"})", Grammar::Json);
    const SyntaxTree d = MustParse(R"({"n": 1, "s": "A", "extra": null})", Grammar::Json);

    CHECK(StructurallyEqual(a, b));
    CHECK_FALSE(StructurallyEqual(a, c));
    CHECK_FALSE(StructurallyEqual(a, d));
}

TEST_CASE("TreeWriter: empty tree writes nothing", "[Syntax][TreeWriter]")
{
    const SyntaxTree empty;
    CHECK(WriteJson(empty).empty());
    CHECK(StructurallyEqual(empty, SyntaxTree {}));
}
