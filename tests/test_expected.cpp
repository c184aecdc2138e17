#include "catch2_custom.hpp"

#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/expected.hpp>
#include <bridgegrader/common/unique_fd.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using namespace std::literals;
using bridgegrader::ErrorKind;
using bridgegrader::Expected;
using bridgegrader::Result;

// Simple types
using Et = Expected<int, std::string>;

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no");

    auto shout = [](const std::string& str) { return str + "!"; };
    REQUIRE(Et{"no"}.transform_error(shout) == "no!");
}

namespace {

Result<int> half(int n) {
    if (n % 2 != 0) {
        return ErrorKind::BadConfig;
    }

    return n / 2;
}

Result<int> quarter(int n) {
    int res = TRY(half(n));
    return TRY(half(res));
}

Result<int> quarter_or_timeout(int n) {
    return TRYE(quarter(n), TimedOut);
}

Expected<bridgegrader::UniqueFd> forward_fd(Expected<bridgegrader::UniqueFd> fd) {
    // Move-only values have to make it through TRY untouched
    auto owned = TRY(std::move(fd));
    return owned;
}

} // namespace

TEST_CASE("TRY and TRYE propagate errors") {
    REQUIRE(quarter(8) == 2);
    REQUIRE(quarter(6) == ErrorKind::BadConfig);
    REQUIRE(quarter(7) == ErrorKind::BadConfig);

    REQUIRE(quarter_or_timeout(12) == 3);
    REQUIRE(quarter_or_timeout(2) == ErrorKind::TimedOut);

    auto err = forward_fd(std::make_error_code(std::errc::bad_file_descriptor));
    REQUIRE(err.has_error());
    REQUIRE(err.error() == std::errc::bad_file_descriptor);

    auto fd = forward_fd(bridgegrader::UniqueFd{});
    REQUIRE(fd.has_value());
    REQUIRE(!fd.value().valid());
}

TEST_CASE("Error kinds are formatted by name") {
    REQUIRE(fmt::format("{}", ErrorKind::SyscallFailure) == "SyscallFailure");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::TimedOut}) == "Error(TimedOut)");
    REQUIRE(fmt::format("{}", Result<int>{5}) == "Expected(5)");
}
