#include <Lattice/IO/MemoryReader.hpp>
#include <Lattice/Syntax/Parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <string_view>

using namespace Lattice::Syntax;

namespace
{
    ParseError ParseFailure(std::string_view source, Grammar grammar, const ParseOptions& options = {})
    {
        auto result = Parser::Parse(source, grammar, options);
        REQUIRE_FALSE(result.HasValue());
        return result.ErrorUnsafe();
    }

    class FailingReader final : public Lattice::IO::IByteReader
    {
    public:
        using SizeResult = Lattice::Utilities::Expected<Lattice::UIntSize, Lattice::IO::IOError>;

        SizeResult Read(std::span<Lattice::Byte>) noexcept override { return Failure(); }
        SizeResult Skip(Lattice::UIntSize) noexcept override { return Failure(); }
        SizeResult Peek(std::span<Lattice::Byte>) noexcept override { return Failure(); }
        SizeResult Tell() const noexcept override { return SizeResult(Lattice::UIntSize {0}); }

    private:
        static SizeResult Failure() noexcept
        {
            return SizeResult(Lattice::Utilities::Unexpected<Lattice::IO::IOError>(
                    Lattice::IO::IOError {Lattice::IO::IOErrorCode::SystemError, 5, "device unplugged"}));
        }
    };
}// namespace

TEST_CASE("Parser: JSON object with nested values", "[Syntax][Parser]")
{
    constexpr std::string_view source = R"({"name": "lattice", "version": 3, "tags": ["a", "b"], "stable": false, "parent": null})";

    auto result = Parser::Parse(source, Grammar::Json);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree = result.ValueUnsafe();

    const Node& root = tree.GetNode(tree.Root());
    CHECK(root.kind == NodeKind::Object);
    CHECK(root.childCount == 5);
    CHECK(root.span == Lattice::Text::Span {0, static_cast<Lattice::UInt32>(source.size())});

    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "name")).text == "lattice");
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "version")).number == 3.0);
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "version")).text == "3");
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "stable")).kind == NodeKind::Boolean);
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "parent")).kind == NodeKind::Null);
    CHECK(tree.FindMember(tree.Root(), "missing") == InvalidNodeId);

    const NodeId tags = tree.FindMember(tree.Root(), "tags");
    REQUIRE(tree.GetNode(tags).kind == NodeKind::Array);
    REQUIRE(tree.Children(tags).size() == 2);
    CHECK(tree.GetNode(tree.Children(tags)[1]).text == "b");

    const NodeId property = tree.Children(tree.Root())[0];
    CHECK(tree.GetNode(property).kind == NodeKind::Property);
    CHECK(tree.GetNode(property).span.Slice(source) == R"("name": "lattice")");
}

TEST_CASE("Parser: unescaped strings view the source", "[Syntax][Parser]")
{
    constexpr std::string_view source = R"(["plain", "esc\naped"])";

    auto result = Parser::Parse(source, Grammar::Json);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree = result.ValueUnsafe();

    const Node& plain   = tree.GetNode(tree.Children(tree.Root())[0]);
    const Node& escaped = tree.GetNode(tree.Children(tree.Root())[1]);
    CHECK(plain.text.data() == source.data() + 2);
    CHECK(escaped.text == "esc\naped");
    CHECK(tree.GetArena().Owns(escaped.text.data()));
}

TEST_CASE("Parser: copyStrings detaches the tree from the source", "[Syntax][Parser]")
{
    std::string source = R"({"key": "value", "n": 12.5})";

    ParseOptions options;
    options.copyStrings = true;
    auto result         = Parser::Parse(source, Grammar::Json, options);
    REQUIRE(result.HasValue());
    source.assign(source.size(), 'x');

    const SyntaxTree& tree = result.ValueUnsafe();
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "key")).text == "value");
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "n")).text == "12.5");
}

TEST_CASE("Parser: duplicate keys resolve to the last member", "[Syntax][Parser]")
{
    auto result = Parser::Parse(R"({"id": 1, "id": 2})", Grammar::Json);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree = result.ValueUnsafe();
    CHECK(tree.GetNode(tree.Root()).childCount == 2);
    CHECK(tree.GetNode(tree.FindMember(tree.Root(), "id")).number == 2.0);
}

TEST_CASE("Parser: ZON structs, tuples and literals", "[Syntax][Parser]")
{
    constexpr std::string_view source = R"(.{
    // comments are always allowed
    .name = "lattice",
    .mode = .fast,
    .@"quoted key" = 0x10,
    .ratio = 1_000.5,
    .letter = 'z',
    .items = .{ 1, "two", true, null },
    .empty = .{},
})";

    auto result = Parser::Parse(source, Grammar::Zon);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree = result.ValueUnsafe();
    const NodeId      root = tree.Root();

    CHECK(tree.GetNode(root).kind == NodeKind::Object);
    CHECK(tree.GetNode(tree.FindMember(root, "name")).text == "lattice");
    CHECK(tree.GetNode(tree.FindMember(root, "mode")).text == "fast");
    CHECK(tree.GetNode(tree.FindMember(root, "quoted key")).number == 16.0);
    CHECK(tree.GetNode(tree.FindMember(root, "ratio")).number == 1000.5);
    CHECK(tree.GetNode(tree.FindMember(root, "letter")).number == 122.0);

    const NodeId items = tree.FindMember(root, "items");
    CHECK(tree.GetNode(items).kind == NodeKind::Array);
    CHECK(tree.Children(items).size() == 4);

    const NodeId empty = tree.FindMember(root, "empty");
    CHECK(tree.GetNode(empty).kind == NodeKind::Object);
    CHECK(tree.GetNode(empty).childCount == 0);
}

TEST_CASE("Parser: ZON special floats", "[Syntax][Parser]")
{
    auto result = Parser::Parse(".{ inf, -inf, nan }", Grammar::Zon);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree     = result.ValueUnsafe();
    const auto        elements = tree.Children(tree.Root());
    REQUIRE(elements.size() == 3);
    CHECK(std::isinf(tree.GetNode(elements[0]).number));
    CHECK(tree.GetNode(elements[1]).number < 0.0);
    CHECK(std::isnan(tree.GetNode(elements[2]).number));
}

TEST_CASE("Parser: ZON separator errors", "[Syntax][Parser]")
{
    const ParseError doubled = ParseFailure(R"(.{ .field = = "value" })", Grammar::Zon);
    CHECK(doubled.code == ParseErrorCode::UnexpectedToken);
    CHECK(doubled.span == Lattice::Text::Span {12, 13});

    const ParseError missing = ParseFailure(".{ .name = }", Grammar::Zon);
    CHECK(missing.code == ParseErrorCode::MissingValue);
    CHECK(missing.span == Lattice::Text::Span {9, 10});
    CHECK(missing.message == "Missing value after '='");
}

TEST_CASE("Parser: empty input", "[Syntax][Parser]")
{
    for (std::string_view source : {"", "   \n\t"})
    {
        const ParseError error = ParseFailure(source, Grammar::Json);
        CHECK(error.code == ParseErrorCode::UnexpectedEnd);
        CHECK(error.message == "Empty input");
    }
}

TEST_CASE("Parser: trailing commas", "[Syntax][Parser]")
{
    const ParseError array = ParseFailure("[1, 2,]", Grammar::Json);
    CHECK(array.code == ParseErrorCode::TrailingComma);
    CHECK(array.span == Lattice::Text::Span {5, 6});

    CHECK(ParseFailure(R"({"a": 1,})", Grammar::Json).code == ParseErrorCode::TrailingComma);

    ParseOptions lenient;
    lenient.allowTrailingCommas = true;
    CHECK(Parser::Parse("[1, 2,]", Grammar::Json, lenient).HasValue());
    CHECK(Parser::Parse(".{ 1, 2, }", Grammar::Zon).HasValue());
}

TEST_CASE("Parser: JSON comments are opt-in", "[Syntax][Parser]")
{
    constexpr std::string_view source = "/* header */ [1, // one\n 2]";

    CHECK(ParseFailure(source, Grammar::Json).code == ParseErrorCode::CommentNotAllowed);

    ParseOptions options;
    options.allowComments = true;
    auto result           = Parser::Parse(source, Grammar::Json, options);
    REQUIRE(result.HasValue());
    CHECK(result.ValueUnsafe().GetNode(result.ValueUnsafe().Root()).childCount == 2);
}

TEST_CASE("Parser: depth limit", "[Syntax][Parser]")
{
    ParseOptions options;
    options.maxDepth = 3;

    CHECK(Parser::Parse("[[[1]]]", Grammar::Json, options).HasValue());

    const ParseError error = ParseFailure("[[[[1]]]]", Grammar::Json, options);
    CHECK(error.code == ParseErrorCode::DepthExceeded);
    CHECK(error.span == Lattice::Text::Span {3, 4});
}

TEST_CASE("Parser: depth limit is capped at the lexer context capacity", "[Syntax][Parser]")
{
    ParseOptions options;
    options.maxDepth = 1000;

    constexpr Lattice::UInt32 capacity = ContextStack::Capacity;

    const std::string fits = std::string(capacity - 1, '[') + R"({"a":1,"b":2})" + std::string(capacity - 1, ']');
    auto              parsed = Parser::Parse(fits, Grammar::Json, options);
    REQUIRE(parsed.HasValue());
    CHECK(parsed.ValueUnsafe().NodeCount() > capacity);

    std::string zon;
    for (Lattice::UInt32 i = 0; i + 1 < capacity; ++i)
        zon += ".{";
    zon += ".{ .a = 1, .b = 2 }" + std::string(capacity - 1, '}');
    CHECK(Parser::Parse(zon, Grammar::Zon, options).HasValue());

    const std::string tooDeep = std::string(300, '[') + R"({"a":1,"b":2})" + std::string(300, ']');
    const ParseError  error   = ParseFailure(tooDeep, Grammar::Json, options);
    CHECK(error.code == ParseErrorCode::DepthExceeded);
    CHECK(error.span == Lattice::Text::Span {capacity, capacity + 1});
    CHECK(error.message == "Nesting exceeds maximum depth of 256");
}

TEST_CASE("Parser: structural errors", "[Syntax][Parser]")
{
    CHECK(ParseFailure("1 2", Grammar::Json).code == ParseErrorCode::TrailingCharacters);
    CHECK(ParseFailure(R"({"a" 1})", Grammar::Json).code == ParseErrorCode::MissingSeparator);
    CHECK(ParseFailure("[1 2]", Grammar::Json).code == ParseErrorCode::MissingSeparator);
    CHECK(ParseFailure(R"({"a": 1)", Grammar::Json).code == ParseErrorCode::UnexpectedEnd);
    CHECK(ParseFailure("[1,", Grammar::Json).code == ParseErrorCode::UnexpectedEnd);
    CHECK(ParseFailure(R"({"a": })", Grammar::Json).code == ParseErrorCode::MissingValue);
    CHECK(ParseFailure("[01]", Grammar::Json).code == ParseErrorCode::InvalidNumber);
    CHECK(ParseFailure(R"(["\q"])", Grammar::Json).code == ParseErrorCode::InvalidStringEscape);
    CHECK(ParseFailure(R"(["\uZZZZ"])", Grammar::Json).code == ParseErrorCode::InvalidUnicodeEscape);
    CHECK(ParseFailure("[,]", Grammar::Json).code == ParseErrorCode::UnexpectedToken);
}

TEST_CASE("Parser: errors carry line and column", "[Syntax][Parser]")
{
    const ParseError error = ParseFailure("{\n  \"a\": tru\n}", Grammar::Json);
    CHECK(error.code == ParseErrorCode::InvalidToken);
    CHECK(error.location.line == 2);
    CHECK(error.location.column == 8);
    CHECK(error.span == Lattice::Text::Span {9, 12});
}

TEST_CASE("Parser: invalid UTF-8 is rejected up front", "[Syntax][Parser]")
{
    const ParseError error = ParseFailure("[\"ok\", \"\xFF\"]", Grammar::Json);
    CHECK(error.code == ParseErrorCode::InvalidEncoding);
    CHECK(error.span == Lattice::Text::Span {8, 9});

    ParseOptions options;
    options.validateUtf8 = false;
    CHECK(Parser::Parse("[\"ok\", \"\xFF\"]", Grammar::Json, options).HasValue());
}

TEST_CASE("Parser: arena exhaustion reports OutOfMemory", "[Syntax][Parser]")
{
    const std::string source = "\"" + std::string(40, 'a') + "\"";

    ParseOptions options;
    options.copyStrings     = true;
    options.arenaChunkBytes = 16;
    options.arenaLimitBytes = 16;

    const ParseError error = ParseFailure(source, Grammar::Json, options);
    CHECK(error.code == ParseErrorCode::OutOfMemory);
    CHECK(error.span == Lattice::Text::Span {0, 42});
}

TEST_CASE("Parser: reader input is owned by the tree", "[Syntax][Parser]")
{
    Lattice::IO::MemoryReader reader {std::string(R"({"k": [true, null]})")};

    auto result = Parser::Parse(reader, Grammar::Json);
    REQUIRE(result.HasValue());
    const SyntaxTree& tree = result.ValueUnsafe();

    CHECK(tree.Source() == R"({"k": [true, null]})");
    const NodeId list = tree.FindMember(tree.Root(), "k");
    REQUIRE(list != InvalidNodeId);
    CHECK(tree.Children(list).size() == 2);

    const Node& key = tree.GetNode(tree.PropertyKey(tree.Children(tree.Root())[0]));
    CHECK(key.text.data() == tree.Source().data() + 2);
}

TEST_CASE("Parser: reader failures become ReadFailed", "[Syntax][Parser]")
{
    FailingReader reader;
    auto          result = Parser::Parse(reader, Grammar::Json);
    REQUIRE_FALSE(result.HasValue());
    CHECK(result.ErrorUnsafe().code == ParseErrorCode::ReadFailed);
    CHECK(result.ErrorUnsafe().message == "Failed to read from reader: device unplugged");
}
