/**
 * @file TestVec3.cpp
 * @brief Unit tests for Vec3.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <mtr/math/Vec3.hpp>

#include <array>
#include <vector>

namespace mtr::math {

using core::f32;
using Catch::Matchers::WithinAbs;

TEST_CASE("Vec3 construction", "[math][vec3]")
{
    CHECK(Vec3{} == Vec3::zero());
    CHECK(Vec3::fromValues(1.0f, 2.0f, 3.0f) == Vec3{1.0f, 2.0f, 3.0f});
    CHECK(Vec3::fromArray({1.0f, 2.0f, 3.0f}).toArray() == std::array<f32, 3>{1.0f, 2.0f, 3.0f});
    CHECK(Vec3::unitX() + Vec3::unitY() + Vec3::unitZ() == Vec3{1.0f, 1.0f, 1.0f});
}

TEST_CASE("Vec3 fromSpan validates the element count", "[math][vec3]")
{
    const std::vector<f32> shortInput{1.0f, 2.0f};
    const auto failed = Vec3::fromSpan(shortInput);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == core::ErrorCode::kInvalidLength);
    CHECK(failed.error().message() == "Vec3 expects 3 elements, got 2");

    const std::vector<f32> exact{4.0f, 5.0f, 6.0f};
    REQUIRE(Vec3::fromSpan(exact).has_value());
    CHECK(Vec3::fromSpan(exact).value() == Vec3{4.0f, 5.0f, 6.0f});
}

TEST_CASE("Vec3 arithmetic", "[math][vec3]")
{
    const Vec3 lhs{1.0f, 2.0f, 3.0f};
    const Vec3 rhs{4.0f, -5.0f, 6.0f};

    CHECK(lhs + rhs == Vec3{5.0f, -3.0f, 9.0f});
    CHECK(lhs - rhs == Vec3{-3.0f, 7.0f, -3.0f});
    CHECK(lhs.scale(2.0f) == Vec3{2.0f, 4.0f, 6.0f});
    CHECK(-1.0f * lhs == lhs.negate());
    CHECK(lhs.dot(rhs) == 12.0f);
    CHECK(lhs[2] == 3.0f);
}

TEST_CASE("Vec3 cross product", "[math][vec3]")
{
    CHECK(Vec3{2.0f, 4.5f, 0.0f}.cross(Vec3{3.0f, 1.5f, 4.0f}) == Vec3{18.0f, -8.0f, -10.5f});
    CHECK(Vec3::unitX().cross(Vec3::unitY()) == Vec3::unitZ());
    CHECK(Vec3::unitY().cross(Vec3::unitX()) == -Vec3::unitZ());

    const Vec3 lhs{1.0f, -2.0f, 3.0f};
    const Vec3 rhs{-4.0f, 5.0f, 0.5f};
    const Vec3 normal = lhs.cross(rhs);
    CHECK(normal.dot(lhs) == 0.0f);
    CHECK(normal.dot(rhs) == 0.0f);
}

TEST_CASE("Vec3 length and normalize", "[math][vec3]")
{
    CHECK(Vec3{2.0f, 3.0f, 6.0f}.length() == 7.0f);
    CHECK_THAT(Vec3{2.0f, 3.0f, 6.0f}.normalize().length(), WithinAbs(1.0, 1e-6));
}

} // namespace mtr::math
