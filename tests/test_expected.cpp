#include "catch2_custom.hpp"

#include <iojudge/common/error_types.hpp>
#include <iojudge/common/expected.hpp>

#include <memory>
#include <string>
#include <utility>

using iojudge::ErrorKind;
using iojudge::Expected;
using iojudge::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Result<int> half(int value) {
    if (value % 2 != 0) {
        return ErrorKind::UnknownError;
    }
    return value / 2;
}

Result<int> quarter(int value) {
    int halved = TRY(half(value));
    return TRY(half(halved));
}

Result<int> quarter_or_timeout(int value) {
    int halved = TRYE(half(value), TimedOut);
    return TRYE(half(halved), TimedOut);
}

Result<std::unique_ptr<int>> boxed(int value) {
    return std::make_unique<int>(value);
}

Result<int> unboxed(int value) {
    std::unique_ptr<int> box = TRY(boxed(value));
    return *box;
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
    REQUIRE(Et{"Hello"}.error() == "Hello");
}

TEST_CASE("Equality with values and errors") {
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);

    REQUIRE(Result<int>{ErrorKind::TimedOut} == ErrorKind::TimedOut);
    REQUIRE(Result<int>{ErrorKind::TimedOut} != ErrorKind::ExecFailure);
    REQUIRE(Result<int>{5} != ErrorKind::TimedOut);
}

TEST_CASE("value_or") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);
}

TEST_CASE("TRY and TRYE propagate errors") {
    REQUIRE(quarter(8).value() == 2);
    REQUIRE(quarter(6).error() == ErrorKind::UnknownError);
    REQUIRE(quarter(3).error() == ErrorKind::UnknownError);

    REQUIRE(quarter_or_timeout(12).value() == 3);
    REQUIRE(quarter_or_timeout(6).error() == ErrorKind::TimedOut);
}

TEST_CASE("TRY moves out move-only values") {
    REQUIRE(unboxed(42).value() == 42);

    Result<std::unique_ptr<int>> res = boxed(7);
    std::unique_ptr<int> taken = std::move(res).value();
    REQUIRE(*taken == 7);
}

TEST_CASE("Expected is formattable") {
    REQUIRE(fmt::format("{}", ErrorKind::ChannelClosed) == "ChannelClosed");
}
