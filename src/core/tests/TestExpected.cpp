/**
 * @file TestExpected.cpp
 * @brief Unit tests for core::Expected, makeError and the VGL_TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include <vgl/core/Expected.hpp>

using namespace vgl::core;

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int v = VGL_TRY(parsePositive(value));
    return v * 2;
}

Expected<void> checkBoth(int a, int b)
{
    VGL_TRY_VOID(parsePositive(a).transform([](int) {}));
    VGL_TRY_VOID(parsePositive(b).transform([](int) {}));
    return {};
}

} // namespace

TEST_CASE("makeError carries code and message", "[core][expected]")
{
    auto result = parsePositive(-1);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(result.error().message() == "not positive");
    REQUIRE(result.error().location().line() > 0);
    REQUIRE(toString(result.error().code()) == "InvalidArgument");
}

TEST_CASE("VGL_TRY yields the value or returns the error", "[core][expected]")
{
    SECTION("success path")
    {
        auto result = doubled(21);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("error path")
    {
        auto result = doubled(0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("VGL_TRY_VOID stops at the first failure", "[core][expected]")
{
    REQUIRE(checkBoth(1, 2).has_value());
    REQUIRE_FALSE(checkBoth(1, -2).has_value());
    REQUIRE_FALSE(checkBoth(-1, 2).has_value());
}
