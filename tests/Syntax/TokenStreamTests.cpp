#include <Lattice/Syntax/Parser.hpp>
#include <Lattice/Syntax/TokenStream.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string_view>
#include <vector>

using namespace Lattice::Syntax;

namespace
{
    constexpr std::string_view kJson = R"({"name": "lattice", "tags": [1, 2]})";
    constexpr std::string_view kZon  = R"(.{ .name = "lattice", .tags = .{ 1, 2 } })";

    std::vector<Token> Direct(std::string_view source)
    {
        JsonLexer          lexer {source};
        std::vector<Token> tokens;
        while (auto token = lexer.Next())
            tokens.push_back(*token);
        return tokens;
    }

    /// Yields a fixed list of tokens, then stops without an Eof.
    struct ScriptedProducer
    {
        std::vector<Token> script;
        std::size_t        index {0};

        std::optional<Token> Next()
        {
            if (index >= script.size())
                return std::nullopt;
            return script[index++];
        }
    };
}// namespace

static_assert(TokenProducer<JsonLexer>);
static_assert(TokenProducer<ZonLexer>);
static_assert(TokenProducer<BufferedTokenSource>);
static_assert(TokenProducer<ScriptedProducer>);

TEST_CASE("TokenStream: Tokenize matches the lexer", "[Syntax][TokenStream]")
{
    TokenStream stream = Tokenize(kJson, Grammar::Json);
    CHECK_FALSE(stream.IsDynamic());
    CHECK(CollectTokens(stream) == Direct(kJson));
}

TEST_CASE("TokenStream: type-erased sources produce the same tokens", "[Syntax][TokenStream]")
{
    const auto expected = Direct(kJson);

    JsonLexer   borrowed {kJson};
    TokenStream fromBorrowed {TokenSource::From(borrowed)};
    CHECK(fromBorrowed.IsDynamic());
    CHECK(CollectTokens(fromBorrowed) == expected);

    TokenStream fromOwned {TokenSource::Own(std::make_unique<JsonLexer>(kJson))};
    CHECK(CollectTokens(fromOwned) == expected);

    BufferedTokenSource buffered {expected};
    TokenStream         fromBuffer {buffered};
    CHECK(CollectTokens(fromBuffer) == expected);
}

TEST_CASE("TokenStream: Eof is delivered once", "[Syntax][TokenStream]")
{
    TokenStream stream = Tokenize("[]", Grammar::Json);
    const auto  tokens = CollectTokens(stream);
    REQUIRE(tokens.size() == 3);
    CHECK(tokens.back().kind == TokenKind::Eof);
    CHECK_FALSE(stream.Next().has_value());
}

TEST_CASE("TokenStream: an empty TokenSource ends immediately", "[Syntax][TokenStream]")
{
    TokenSource source;
    CHECK_FALSE(source.IsValid());
    CHECK_FALSE(source.Next().has_value());

    TokenStream stream {std::move(source)};
    CHECK(CollectTokens(stream).empty());
}

TEST_CASE("BufferedTokenSource: synthesizes Eof after the last token", "[Syntax][TokenStream]")
{
    const std::vector<Token> tokens {
            Token {TokenKind::ArrayStart, {0, 1}},
            Token {TokenKind::ArrayEnd, {1, 2}},
    };
    BufferedTokenSource source {tokens};

    REQUIRE(source.Next()->kind == TokenKind::ArrayStart);
    REQUIRE(source.Next()->kind == TokenKind::ArrayEnd);
    CHECK(source.Position() == 2);

    const auto eof = source.Next();
    REQUIRE(eof);
    CHECK(eof->kind == TokenKind::Eof);
    CHECK(eof->span == Lattice::Text::Span {2, 2});
    CHECK_FALSE(source.Next().has_value());
}

TEST_CASE("TokenStream: parser accepts any token producer", "[Syntax][TokenStream]")
{
    auto zonLexer = std::make_unique<ZonLexer>(kZon);
    TokenStream owned {TokenSource::Own(std::move(zonLexer))};
    auto        fromOwned = Parser::Parse(kZon, owned, Grammar::Zon);
    REQUIRE(fromOwned.HasValue());

    auto direct = Parser::Parse(kZon, Grammar::Zon);
    REQUIRE(direct.HasValue());
    CHECK(StructurallyEqual(fromOwned.ValueUnsafe(), direct.ValueUnsafe()));

    ScriptedProducer scripted;
    scripted.script = {
            Token {TokenKind::ArrayStart, {0, 1}},
            Token {TokenKind::Number, {1, 2}},
            Token {TokenKind::ArrayEnd, {2, 3}},
    };
    TokenStream custom {TokenSource::From(scripted)};
    auto        parsed = Parser::Parse("[7]", custom, Grammar::Json);
    REQUIRE(parsed.HasValue());

    const SyntaxTree& tree = parsed.ValueUnsafe();
    REQUIRE(tree.Children(tree.Root()).size() == 1);
    CHECK(tree.GetNode(tree.Children(tree.Root())[0]).number == 7.0);
}
