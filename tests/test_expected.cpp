#include "catch2_custom.hpp"

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/expected.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>

using namespace std::literals;
using judgebox::ErrorKind;
using judgebox::Expected;
using judgebox::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Et parse_digit(char chr) {
    if (chr < '0' || chr > '9') {
        return fmt::format("'{}' is not a digit", chr);
    }
    return chr - '0';
}

Et sum_digits(std::string_view str) {
    int sum = 0;
    for (char chr : str) {
        sum += TRY(parse_digit(chr));
    }
    return sum;
}

Result<int> checked_half(int n) {
    if (n % 2 != 0) {
        return ErrorKind::BadArgument;
    }
    return n / 2;
}

Result<int> quarter(int n) {
    int half = TRY(checked_half(n));
    return TRYE(checked_half(half), ArtifactFailure);
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());

    REQUIRE(Et{judgebox::unexpected, "tagged"}.error() == "tagged");
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});
    REQUIRE(Et{123} != Et{"123"});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234"s);

    REQUIRE(Et{"Unexpected!"} == "Unexpected!"s);
    REQUIRE(Et{"Unexpected!"} != "Exp!"s);
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(123.5) == 123);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no"s);
}

TEST_CASE("TRY propagates the first error and forwards values") {
    REQUIRE(sum_digits("1234") == 10);
    REQUIRE(sum_digits("") == 0);
    REQUIRE(sum_digits("12x4") == "'x' is not a digit"s);

    REQUIRE(quarter(8) == 2);
    REQUIRE(quarter(7) == ErrorKind::BadArgument);
    // TRYE replaces the error of the second step
    REQUIRE(quarter(6) == ErrorKind::ArtifactFailure);
}

TEST_CASE("Expected is formatted with its state") {
    REQUIRE(fmt::format("{}", Et{5}) == "Expected(5)");
    REQUIRE(fmt::format("{}", Et{"bad"}) == "Error(bad)");
    REQUIRE(fmt::format("{}", Result<void>{}) == "Expected(void)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::TimedOut}) == "Error(TimedOut)");
}
