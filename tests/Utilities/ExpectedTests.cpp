#include <Lattice/Utilities/Expected.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <utility>

namespace
{
    struct MoveOnly
    {
        int value {0};

        explicit MoveOnly(int v) noexcept
            : value {v}
        {
        }

        MoveOnly(const MoveOnly&)            = delete;
        MoveOnly& operator=(const MoveOnly&) = delete;

        MoveOnly(MoveOnly&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        MoveOnly& operator=(MoveOnly&& other) noexcept
        {
            value       = other.value;
            other.value = -1;
            return *this;
        }
    };

    struct CountingError
    {
        inline static int s_destructCount = 0;

        int value {0};

        explicit CountingError(int v) noexcept
            : value {v}
        {
        }

        CountingError(const CountingError& other) noexcept
            : value {other.value}
        {
        }

        CountingError(CountingError&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        ~CountingError() { ++s_destructCount; }

        static void Reset() { s_destructCount = 0; }
    };

    Lattice::Utilities::Expected<int, std::string> ParsePort(int raw)
    {
        if (raw <= 0 || raw > 65535)
            return Lattice::Utilities::Expected<int, std::string>(Lattice::Utilities::Unexpected<std::string>(std::string("port out of range")));
        return Lattice::Utilities::Expected<int, std::string>(raw);
    }
}// namespace

TEST_CASE("Expected<T,E> basic value construction", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<int, int>;

    Expected a {Lattice::Utilities::InPlaceType<int> {}, 42};
    REQUIRE(a.HasValue());
    REQUIRE(a.Value() == 42);

    Expected b {123};
    REQUIRE(b.HasValue());
    REQUIRE(static_cast<bool>(b));
    REQUIRE(b.Value() == 123);
}

TEST_CASE("Expected<T,E> basic error construction", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<int, int>;

    Expected e {Lattice::Utilities::Unexpected<int> {7}};
    REQUIRE_FALSE(e.HasValue());
    REQUIRE_FALSE(static_cast<bool>(e));
    REQUIRE(e.Error() == 7);
}

TEST_CASE("Expected<T,E> carries distinct value and error types", "[Utilities][Expected]")
{
    auto ok = ParsePort(8080);
    REQUIRE(ok.HasValue());
    CHECK(ok.ValueUnsafe() == 8080);

    auto bad = ParsePort(70000);
    REQUIRE_FALSE(bad.HasValue());
    CHECK(bad.ErrorUnsafe() == "port out of range");
}

TEST_CASE("Expected<T,E> move-only value", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<MoveOnly, int>;

    Expected a {Lattice::Utilities::InPlaceType<MoveOnly> {}, 5};
    REQUIRE(a.HasValue());
    REQUIRE(a.Value().value == 5);

    Expected b {std::move(a)};
    REQUIRE(b.HasValue());
    REQUIRE(b.Value().value == 5);
}

TEST_CASE("Expected<T,E> holds unique_ptr payloads", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<std::unique_ptr<int>, int>;

    Expected a {std::make_unique<int>(9)};
    REQUIRE(a.HasValue());

    std::unique_ptr<int> owned = std::move(a).ValueUnsafe();
    REQUIRE(owned != nullptr);
    CHECK(*owned == 9);
}

TEST_CASE("Expected<T,E> ValueOr", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<int, int>;

    const Expected hasValue {Lattice::Utilities::InPlaceType<int> {}, 3};
    const Expected hasError {Lattice::Utilities::Unexpected<int> {11}};

    REQUIRE(hasValue.ValueOr(99) == 3);
    REQUIRE(hasError.ValueOr(99) == 99);

    Expected rvalueHasValue {Lattice::Utilities::InPlaceType<int> {}, 4};
    REQUIRE(std::move(rvalueHasValue).ValueOr(77) == 4);

    Expected rvalueHasError {Lattice::Utilities::Unexpected<int> {12}};
    REQUIRE(std::move(rvalueHasError).ValueOr(77) == 77);
}

TEST_CASE("Expected<T,E> rvalue Value/Error accessors move", "[Utilities][Expected]")
{
    using ExpectedValue = Lattice::Utilities::Expected<MoveOnly, int>;
    ExpectedValue a {Lattice::Utilities::InPlaceType<MoveOnly> {}, 42};

    MoveOnly extracted = std::move(a).Value();
    REQUIRE(extracted.value == 42);
    REQUIRE(a.HasValue());
    REQUIRE(a.ValueUnsafe().value == -1);

    using ExpectedError = Lattice::Utilities::Expected<int, CountingError>;
    ExpectedError b {Lattice::Utilities::Unexpected<CountingError> {CountingError {7}}};
    CountingError extractedError = std::move(b).Error();
    REQUIRE(extractedError.value == 7);
    REQUIRE_FALSE(b.HasValue());
    REQUIRE(b.ErrorUnsafe().value == -1);
}

TEST_CASE("Expected<T,E> move assignment switches alternatives", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<std::string, int>;

    Expected a {std::string("value")};
    Expected b {Lattice::Utilities::Unexpected<int> {3}};

    a = std::move(b);
    REQUIRE_FALSE(a.HasValue());
    CHECK(a.Error() == 3);

    a = Expected {std::string("again")};
    REQUIRE(a.HasValue());
    CHECK(a.Value() == "again");
}

TEST_CASE("Expected<void,E> success and error", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<void, int>;

    Expected ok;
    REQUIRE(ok.HasValue());

    Expected err {Lattice::Utilities::Unexpected<int> {8}};
    REQUIRE_FALSE(err.HasValue());
    REQUIRE(err.Error() == 8);
}

TEST_CASE("Expected<void,E> destroys its error exactly once", "[Utilities][Expected]")
{
    using Expected = Lattice::Utilities::Expected<void, CountingError>;

    {
        Expected e {Lattice::Utilities::Unexpected<CountingError> {CountingError {17}}};
        CountingError::Reset();
        REQUIRE_FALSE(e.HasValue());
        REQUIRE(e.Error().value == 17);
    }

    REQUIRE(CountingError::s_destructCount == 1);
}
