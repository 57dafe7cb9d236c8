#include <Lattice/Analysis/SchemaAnalyzer.hpp>
#include <Lattice/Syntax/Parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

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

    bool Contains(const std::vector<std::string>& suggestions, std::string_view text)
    {
        return std::find(suggestions.begin(), suggestions.end(), text) != suggestions.end();
    }
}// namespace

TEST_CASE("JsonSchema: property bookkeeping", "[Analysis][JsonSchema]")
{
    JsonSchema schema = JsonSchema::Object();
    CHECK(schema.HasProperties());
    CHECK(schema.PropertyCount() == 0);

    schema.SetProperty("id", JsonSchema(SchemaType::Number));
    schema.SetProperty("name", JsonSchema(SchemaType::String));
    schema.SetProperty("id", JsonSchema(SchemaType::String));

    REQUIRE(schema.PropertyCount() == 2);
    CHECK((*schema.properties)[0].name == "id");
    CHECK(schema.FindProperty("id")->type == SchemaType::String);
    CHECK(schema.FindProperty("missing") == nullptr);

    const JsonSchema copy = schema.Clone();
    CHECK(copy.PropertyCount() == 2);
    CHECK(copy.FindProperty("name") != schema.FindProperty("name"));

    const JsonSchema list = JsonSchema::Array(JsonSchema(SchemaType::Boolean));
    REQUIRE(list.HasItems());
    CHECK(list.items->type == SchemaType::Boolean);
    CHECK(ToString(SchemaType::Any) == "any");
    CHECK(ToString(SchemaType::Object) == "object");
}

TEST_CASE("SchemaAnalyzer: wide objects keep field order and lookups", "[Analysis][SchemaAnalyzer]")
{
    std::string source = "{";
    for (int i = 0; i < 1000; ++i)
        source += std::format("{}\"k{}\": {}", i == 0 ? "" : ", ", i, i);
    source += ", \"k500\": \"again\"}";

    const SchemaAnalyzer analyzer;
    const JsonSchema     schema = analyzer.InferSchema(MustParse(source));

    REQUIRE(schema.PropertyCount() == 1000);
    CHECK((*schema.properties)[0].name == "k0");
    CHECK((*schema.properties)[500].name == "k500");
    CHECK((*schema.properties)[999].name == "k999");
    CHECK(schema.FindProperty("k999")->type == SchemaType::Number);
    CHECK(schema.FindProperty("k500")->type == SchemaType::String);
    CHECK(schema.FindProperty("k1000") == nullptr);

    const JsonSchema copy = schema.Clone();
    REQUIRE(copy.PropertyCount() == 1000);
    CHECK((*copy.properties)[500].name == "k500");
    CHECK(copy.FindProperty("k500")->type == SchemaType::String);
}

TEST_CASE("SchemaAnalyzer: scalar schemas keep examples", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;

    const JsonSchema text = analyzer.InferSchema(MustParse(R"("hello")"));
    CHECK(text.type == SchemaType::String);
    CHECK(text.examples == std::vector<std::string> {"hello"});

    const JsonSchema number = analyzer.InferSchema(MustParse("12.50"));
    CHECK(number.type == SchemaType::Number);
    CHECK(number.examples == std::vector<std::string> {"12.50"});

    CHECK(analyzer.InferSchema(MustParse("false")).examples == std::vector<std::string> {"false"});

    const JsonSchema null = analyzer.InferSchema(MustParse("null"));
    CHECK(null.type == SchemaType::Null);
    CHECK(null.examples.empty());
    CHECK_FALSE(null.nullable);
}

TEST_CASE("SchemaAnalyzer: objects and homogeneous arrays", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;
    const JsonSchema     schema = analyzer.InferSchema(MustParse(R"({"x": [1, 2, 3], "tag": "a"})"));

    REQUIRE(schema.type == SchemaType::Object);
    REQUIRE(schema.PropertyCount() == 2);
    CHECK((*schema.properties)[0].name == "x");
    CHECK((*schema.properties)[1].name == "tag");

    const JsonSchema* x = schema.FindProperty("x");
    REQUIRE(x != nullptr);
    CHECK(x->type == SchemaType::Array);
    REQUIRE(x->HasItems());
    CHECK(x->items->type == SchemaType::Number);
    CHECK(x->items->examples == std::vector<std::string> {"1", "2", "3"});
}

TEST_CASE("SchemaAnalyzer: mixed or empty arrays have Any items", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;

    const JsonSchema mixed = analyzer.InferSchema(MustParse(R"({"x": [1, "a"]})"));
    CHECK(mixed.FindProperty("x")->items->type == SchemaType::Any);

    const JsonSchema empty = analyzer.InferSchema(MustParse("[]"));
    REQUIRE(empty.HasItems());
    CHECK(empty.items->type == SchemaType::Any);

    AnalyzerOptions options;
    options.inferArrayItemTypes = false;
    const JsonSchema untyped    = SchemaAnalyzer {options}.InferSchema(MustParse("[1, 2]"));
    CHECK(untyped.items->type == SchemaType::Any);
}

TEST_CASE("SchemaAnalyzer: example count is capped", "[Analysis][SchemaAnalyzer]")
{
    AnalyzerOptions options;
    options.maxExamples = 2;

    const JsonSchema schema = SchemaAnalyzer {options}.InferSchema(MustParse("[1, 2, 3, 4]"));
    CHECK(schema.items->examples == std::vector<std::string> {"1", "2"});
}

TEST_CASE("SchemaAnalyzer: depth limit collapses to Any", "[Analysis][SchemaAnalyzer]")
{
    AnalyzerOptions options;
    options.maxSchemaDepth = 1;

    const JsonSchema schema = SchemaAnalyzer {options}.InferSchema(MustParse(R"({"a": {"b": {"c": 1}}})"));
    const JsonSchema* a     = schema.FindProperty("a");
    REQUIRE(a != nullptr);
    CHECK(a->type == SchemaType::Object);
    REQUIRE(a->FindProperty("b") != nullptr);
    CHECK(a->FindProperty("b")->type == SchemaType::Any);
}

TEST_CASE("SchemaAnalyzer: ZON documents infer the same shapes", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;
    const JsonSchema     json = analyzer.InferSchema(MustParse(R"({"name": "x", "deps": [{"url": "u"}]})"));
    const JsonSchema     zon  = analyzer.InferSchema(MustParse(R"(.{ .name = "x", .deps = .{ .{ .url = "u" } } })", Grammar::Zon));
    CHECK(SchemaAnalyzer::IsCompatible(json, zon));
    CHECK(SchemaAnalyzer::IsCompatible(zon, json));
}

TEST_CASE("SchemaAnalyzer: single nodes and node lists", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;
    const SyntaxTree     tree = MustParse(R"([{"id": 1}, {"id": 2, "name": "b"}, {"id": 3, "tags": [true]}])");

    const auto       elements = tree.Children(tree.Root());
    const JsonSchema first    = analyzer.InferSchema(tree, elements[0]);
    CHECK(first.PropertyCount() == 1);

    const JsonSchema merged = analyzer.InferSchemaFromValues(tree, elements);
    REQUIRE(merged.type == SchemaType::Object);
    CHECK(merged.PropertyCount() == 3);
    CHECK(merged.FindProperty("id")->examples == std::vector<std::string> {"1", "2", "3"});
    CHECK(merged.FindProperty("name")->type == SchemaType::String);
    REQUIRE(merged.FindProperty("tags") != nullptr);
    CHECK(merged.FindProperty("tags")->items->type == SchemaType::Boolean);

    CHECK(analyzer.InferSchema(tree, Lattice::Syntax::InvalidNodeId).type == SchemaType::Any);
    CHECK(analyzer.InferSchemaFromValues(tree, {}).type == SchemaType::Any);
}

TEST_CASE("SchemaAnalyzer: merging documents", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;

    std::vector<SyntaxTree> documents;
    documents.push_back(MustParse(R"({"user": {"id": 1}, "active": true})"));
    documents.push_back(MustParse(R"({"user": {"id": 2, "email": "b@example.com"}})"));

    const JsonSchema merged = analyzer.InferSchemaFromDocuments(documents);
    REQUIRE(merged.type == SchemaType::Object);
    CHECK(merged.FindProperty("active") != nullptr);
    const JsonSchema* user = merged.FindProperty("user");
    REQUIRE(user != nullptr);
    CHECK(user->PropertyCount() == 2);
    CHECK(user->FindProperty("email")->type == SchemaType::String);

    documents.push_back(MustParse("[1]"));
    CHECK(analyzer.InferSchemaFromDocuments(documents).type == SchemaType::Any);
    CHECK(analyzer.InferSchemaFromDocuments({}).type == SchemaType::Any);
}

TEST_CASE("SchemaAnalyzer: compatibility", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;
    const JsonSchema     small = analyzer.InferSchema(MustParse(R"({"a": 1})"));
    const JsonSchema     large = analyzer.InferSchema(MustParse(R"({"a": 2, "b": "x"})"));
    const JsonSchema     other = analyzer.InferSchema(MustParse(R"({"a": "one"})"));

    CHECK(SchemaAnalyzer::IsCompatible(small, small));
    CHECK(SchemaAnalyzer::IsCompatible(large, large));
    CHECK(SchemaAnalyzer::IsCompatible(small, large));
    CHECK_FALSE(SchemaAnalyzer::IsCompatible(large, small));
    CHECK_FALSE(SchemaAnalyzer::IsCompatible(small, other));

    const JsonSchema numbers = analyzer.InferSchema(MustParse("[1]"));
    const JsonSchema strings = analyzer.InferSchema(MustParse(R"(["s"])"));
    CHECK_FALSE(SchemaAnalyzer::IsCompatible(numbers, strings));

    JsonSchema nullableNumber(SchemaType::Number);
    nullableNumber.nullable = true;
    CHECK(SchemaAnalyzer::IsCompatible(nullableNumber, JsonSchema(SchemaType::Number)));
}

TEST_CASE("SchemaAnalyzer: optimization hints", "[Analysis][SchemaAnalyzer]")
{
    const SchemaAnalyzer analyzer;
    const JsonSchema     schema = analyzer.InferSchema(MustParse(R"({
        "homepage": "https://example.com",
        "contact": {"email": "dev@example.com"},
        "item_0": 1,
        "values": [1, "two"]
    })"));

    const auto hints = analyzer.SuggestOptimizations(schema);
    CHECK(Contains(hints, "homepage: String appears to be URL - consider URL validation"));
    CHECK(Contains(hints, "contact.email: String appears to be email - consider email validation"));
    CHECK(Contains(hints, "Property 'item_0' suggests array-like structure"));
    CHECK(Contains(hints, "values: Array has mixed types - consider using consistent types"));
    CHECK(hints.size() == 4);
}

TEST_CASE("SchemaAnalyzer: wide objects suggest splitting", "[Analysis][SchemaAnalyzer]")
{
    std::string source = "{";
    for (int i = 0; i < 51; ++i)
        source += std::string(i == 0 ? "" : ",") + "\"key" + std::to_string(i) + "\": " + std::to_string(i);
    source += "}";

    const SchemaAnalyzer analyzer;
    const auto           hints = analyzer.SuggestOptimizations(analyzer.InferSchema(MustParse(source)));
    CHECK(Contains(hints, "Consider splitting large objects with >50 properties"));
    CHECK(analyzer.SuggestOptimizations(JsonSchema(SchemaType::Null)).empty());
}
