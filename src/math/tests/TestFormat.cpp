/**
 * @file TestFormat.cpp
 * @brief std::format output of the vector and matrix types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <mtr/math/Format.hpp>

#include <format>

namespace mtr::math {


TEST_CASE("Vectors format component-wise", "[math][format]")
{
    CHECK(std::format("{}", Vec2{2.0f, 2.5f}) == "Vec2{2, 2.5}");
    CHECK(std::format("{}", Vec3{1.0f, 2.0f, 3.0f}) == "Vec3{1, 2, 3}");
    CHECK(std::format("{}", Vec4{0.0f, -1.0f, 0.5f, 8.0f}) == "Vec4{0, -1, 0.5, 8}");
}

TEST_CASE("Matrices format row by row", "[math][format]")
{
    CHECK(std::format("{}", Mat2{2.0f, 3.0f, 7.0f, 1.0f}) == "Mat2{[2, 3], [7, 1]}");
    CHECK(std::format("{}", Mat3::identity()) == "Mat3{[1, 0, 0], [0, 1, 0], [0, 0, 1]}");
    CHECK(std::format("{}", Mat4::zero())
          == "Mat4{[0, 0, 0, 0], [0, 0, 0, 0], [0, 0, 0, 0], [0, 0, 0, 0]}");
}

TEST_CASE("Format spec applies to every component", "[math][format]")
{
    CHECK(std::format("{:.1f}", Mat2::identity()) == "Mat2{[1.0, 0.0], [0.0, 1.0]}");
    CHECK(std::format("{:.2f}", Vec2{0.5f, -1.0f}) == "Vec2{0.50, -1.00}");
}

} // namespace mtr::math
