/**
 * @file TestError.cpp
 * @brief Unit tests for Error, Expected and the MTR_TRY macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <mtr/core/Expected.hpp>

#include <string>

namespace mtr::core {


namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = MTR_TRY(parsePositive(value));
    return parsed * 2;
}

ExpectedVoid requirePositive(int value)
{
    MTR_TRY_VOID(parsePositive(value));
    return {};
}

} // namespace

TEST_CASE("errorCodeName names every code", "[core][error]")
{
    CHECK(errorCodeName(ErrorCode::kNone) == "None");
    CHECK(errorCodeName(ErrorCode::kInvalidLength) == "InvalidLength");
    CHECK(errorCodeName(ErrorCode::kInvalidArgument) == "InvalidArgument");
    CHECK(errorCodeName(ErrorCode::kInternalError) == "InternalError");
}

TEST_CASE("makeError carries code, message and call site", "[core][error]")
{
    const Expected<int> result = makeError(ErrorCode::kInvalidLength, "Vec3 expects 3 elements, got 2");

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::kInvalidLength);
    CHECK(result.error().message() == "Vec3 expects 3 elements, got 2");
    CHECK(std::string{result.error().location().file_name()}.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("MTR_TRY unwraps values and propagates errors", "[core][error]")
{
    const auto ok = doubled(21);
    REQUIRE(ok.has_value());
    CHECK(ok.value() == 42);

    const auto failed = doubled(-1);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == ErrorCode::kInvalidArgument);
    CHECK(failed.error().message() == "not positive");
}

TEST_CASE("MTR_TRY_VOID propagates errors from void results", "[core][error]")
{
    CHECK(requirePositive(3).has_value());

    const auto failed = requirePositive(0);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == ErrorCode::kInvalidArgument);
}

} // namespace mtr::core
