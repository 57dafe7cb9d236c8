#include <Lattice/Syntax/NumberText.hpp>
#include <Lattice/Syntax/Token.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace Lattice::Syntax;

TEST_CASE("ParseNumberText: JSON numbers", "[Syntax][NumberText]")
{
    CHECK(ParseNumberText(Grammar::Json, "0", 0) == 0.0);
    CHECK(ParseNumberText(Grammar::Json, "-17", 0) == -17.0);
    CHECK(ParseNumberText(Grammar::Json, "2.5", 0) == 2.5);
    CHECK(ParseNumberText(Grammar::Json, "1e3", 0) == 1000.0);
    CHECK(ParseNumberText(Grammar::Json, "9007199254740991", 0) == 9007199254740991.0);

    CHECK_FALSE(ParseNumberText(Grammar::Json, "01", 0).has_value());
    CHECK_FALSE(ParseNumberText(Grammar::Json, "1.", 0).has_value());
    CHECK_FALSE(ParseNumberText(Grammar::Json, "+1", 0).has_value());
    CHECK_FALSE(ParseNumberText(Grammar::Json, "0x10", 0).has_value());
}

TEST_CASE("ParseNumberText: out of range magnitudes saturate", "[Syntax][NumberText]")
{
    const auto huge = ParseNumberText(Grammar::Json, "1e400", 0);
    REQUIRE(huge.has_value());
    CHECK(std::isinf(*huge));

    const auto tiny = ParseNumberText(Grammar::Json, "-1e-400", 0);
    REQUIRE(tiny.has_value());
    CHECK(*tiny == 0.0);
    CHECK(std::signbit(*tiny));
}

TEST_CASE("ParseNumberText: ZON numbers", "[Syntax][NumberText]")
{
    CHECK(ParseNumberText(Grammar::Zon, "0xff", TokenFlags::RadixPrefix) == 255.0);
    CHECK(ParseNumberText(Grammar::Zon, "0o17", TokenFlags::RadixPrefix) == 15.0);
    CHECK(ParseNumberText(Grammar::Zon, "-0b101", TokenFlags::RadixPrefix | TokenFlags::Negative) == -5.0);
    CHECK(ParseNumberText(Grammar::Zon, "1_000_000", 0) == 1000000.0);
    CHECK(ParseNumberText(Grammar::Zon, "'A'", TokenFlags::CharLiteral) == 65.0);
    CHECK(ParseNumberText(Grammar::Zon, "'\xC3\xA9'", TokenFlags::CharLiteral) == 233.0);

    const auto inf = ParseNumberText(Grammar::Zon, "-inf", TokenFlags::Float | TokenFlags::Negative);
    REQUIRE(inf.has_value());
    CHECK(std::isinf(*inf));
    CHECK(*inf < 0.0);

    const auto nan = ParseNumberText(Grammar::Zon, "nan", TokenFlags::Float);
    REQUIRE(nan.has_value());
    CHECK(std::isnan(*nan));

    CHECK_FALSE(ParseNumberText(Grammar::Zon, "1__0", 0).has_value());
    CHECK_FALSE(ParseNumberText(Grammar::Zon, "007", 0).has_value());
}

TEST_CASE("FractionDigits counts digits after the point", "[Syntax][NumberText]")
{
    CHECK(FractionDigits("12") == 0);
    CHECK(FractionDigits("3.14159") == 5);
    CHECK(FractionDigits("1.50e10") == 2);
    CHECK(FractionDigits("0.000_001") == 6);
}
