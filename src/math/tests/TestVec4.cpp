/**
 * @file TestVec4.cpp
 * @brief Unit tests for Vec4.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <mtr/math/Vec4.hpp>

#include <vector>

namespace mtr::math {

using core::f32;
using Catch::Matchers::WithinAbs;

TEST_CASE("Vec4 construction and conversion", "[math][vec4]")
{
    constexpr Vec4 v = Vec4::fromValues(1.0f, 2.0f, 3.0f, 4.0f);
    STATIC_REQUIRE(Vec4::fromArray(v.toArray()) == v);
    CHECK(Vec4{} == Vec4::zero());
    CHECK(Vec4::unitW() == Vec4{0.0f, 0.0f, 0.0f, 1.0f});
    CHECK(v[3] == 4.0f);
}

TEST_CASE("Vec4 fromSpan validates the element count", "[math][vec4]")
{
    const std::vector<f32> input{1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    const auto failed = Vec4::fromSpan(input);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == core::ErrorCode::kInvalidLength);

    const auto ok = Vec4::fromSpan(std::span{input}.first(4));
    REQUIRE(ok.has_value());
    CHECK(*ok == Vec4{1.0f, 2.0f, 3.0f, 4.0f});
}

TEST_CASE("Vec4 arithmetic", "[math][vec4]")
{
    const Vec4 lhs{1.0f, 2.0f, 3.0f, 4.0f};
    const Vec4 rhs{0.5f, -1.0f, 2.0f, -4.0f};

    CHECK(lhs + rhs == Vec4{1.5f, 1.0f, 5.0f, 0.0f});
    CHECK(lhs - rhs == Vec4{0.5f, 3.0f, 1.0f, 8.0f});
    CHECK(lhs * 0.5f == Vec4{0.5f, 1.0f, 1.5f, 2.0f});
    CHECK(lhs.dot(rhs) == -11.5f);
    CHECK(-lhs == Vec4{-1.0f, -2.0f, -3.0f, -4.0f});

    Vec4 acc = lhs;
    acc += rhs;
    acc -= rhs;
    CHECK(acc == lhs);
}

TEST_CASE("Vec4 length and normalize", "[math][vec4]")
{
    CHECK(Vec4{1.0f, 2.0f, 2.0f, 4.0f}.length() == 5.0f);

    const Vec4 unit = Vec4{0.0f, 3.0f, 0.0f, 4.0f}.normalize();
    CHECK_THAT(unit.y, WithinAbs(0.6, 1e-6));
    CHECK_THAT(unit.w, WithinAbs(0.8, 1e-6));
}

} // namespace mtr::math
