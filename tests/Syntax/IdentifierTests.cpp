#include <Lattice/Syntax/Identifier.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace Lattice::Syntax;

TEST_CASE("Identifier: reserved words", "[Syntax][Identifier]")
{
    CHECK(IsReservedWord("fn"));
    CHECK(IsReservedWord("addrspace"));
    CHECK(IsReservedWord("while"));
    CHECK(IsReservedWord("usingnamespace"));
    CHECK_FALSE(IsReservedWord("name"));
    CHECK_FALSE(IsReservedWord("Fn"));
    CHECK_FALSE(IsReservedWord(""));
}

TEST_CASE("Identifier: bare names", "[Syntax][Identifier]")
{
    CHECK(IsBareIdentifier("name"));
    CHECK(IsBareIdentifier("_private"));
    CHECK(IsBareIdentifier("min_zig_version"));
    CHECK(IsBareIdentifier("v2"));

    CHECK_FALSE(IsBareIdentifier(""));
    CHECK_FALSE(IsBareIdentifier("2fast"));
    CHECK_FALSE(IsBareIdentifier("kebab-case"));
    CHECK_FALSE(IsBareIdentifier("two words"));
    CHECK_FALSE(IsBareIdentifier("const"));
    CHECK_FALSE(IsBareIdentifier("null"));
    CHECK_FALSE(IsBareIdentifier("inf"));
}

TEST_CASE("Identifier: quoted form escapes its contents", "[Syntax][Identifier]")
{
    std::string out;
    AppendIdentifier("paths", out);
    CHECK(out == "paths");

    out.clear();
    AppendIdentifier("test", out);
    CHECK(out == R"(@"test")");

    out.clear();
    AppendIdentifier("say \"hi\"", out);
    CHECK(out == R"(@"say \"hi\"")");
}
