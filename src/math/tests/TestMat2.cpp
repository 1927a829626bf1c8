/**
 * @file TestMat2.cpp
 * @brief Unit tests for Mat2.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <mtr/math/Mat2.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <vector>

namespace mtr::math {

using core::f32;

TEST_CASE("Mat2 named fields are row-major", "[math][mat2]")
{
    constexpr Mat2 mat = Mat2::fromArray({1.0f, 2.0f, 3.0f, 4.0f});
    STATIC_REQUIRE(mat.a == 1.0f);
    STATIC_REQUIRE(mat.b == 2.0f);
    STATIC_REQUIRE(mat.c == 3.0f);
    STATIC_REQUIRE(mat.d == 4.0f);
    STATIC_REQUIRE(mat(1, 0) == 3.0f);
    CHECK(mat.row(1) == Vec2{3.0f, 4.0f});
    CHECK(mat.toColArray() == std::array<f32, 4>{1.0f, 3.0f, 2.0f, 4.0f});
}

TEST_CASE("Mat2 column views", "[math][mat2]")
{
    const Mat2 mat{1.0f, 2.0f, 3.0f, 4.0f};
    const auto columns = mat.toVectorColumns();
    CHECK(columns[0] == Vec2{1.0f, 3.0f});
    CHECK(columns[1] == Vec2{2.0f, 4.0f});
    CHECK(Mat2::fromColumns(columns[0], columns[1]) == mat);
    CHECK(Mat2::fromColArray({1.0f, 3.0f, 2.0f, 4.0f}) == mat);
}

TEST_CASE("Mat2 span constructors validate the element count", "[math][mat2]")
{
    const std::vector<f32> input{1.0f, 2.0f, 3.0f, 4.0f};

    const auto rowMajor = Mat2::fromSpan(input);
    REQUIRE(rowMajor.has_value());
    CHECK(*rowMajor == Mat2{1.0f, 2.0f, 3.0f, 4.0f});

    const auto colMajor = Mat2::fromColSpan(input);
    REQUIRE(colMajor.has_value());
    CHECK(*colMajor == Mat2{1.0f, 3.0f, 2.0f, 4.0f});

    const auto failed = Mat2::fromColSpan(std::span{input}.first(3));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == core::ErrorCode::kInvalidLength);
    CHECK(failed.error().message() == "Mat2 expects 4 elements, got 3");
}

TEST_CASE("Mat2 determinant", "[math][mat2]")
{
    CHECK(Mat2{2.0f, 3.0f, 7.0f, 1.0f}.determinant() == -19.0f);
    CHECK(Mat2{2.0f, 3.0f, 4.0f, 6.0f}.determinant() == 0.0f);
    CHECK(Mat2::identity().determinant() == 1.0f);
}

TEST_CASE("Mat2 multiply is the row-by-column product", "[math][mat2]")
{
    const Mat2 lhs{1.0f, 2.0f, 1.0f, 3.0f};
    const Mat2 rhs{1.5f, 2.25f, 1.25f, 2.0f};
    const Mat2 expected{4.0f, 6.25f, 5.25f, 8.25f};

    CHECK(lhs.multiply(rhs) == expected);
    CHECK(lhs * rhs == expected);
}

TEST_CASE("Mat2 multiply by vector and scalar", "[math][mat2]")
{
    CHECK(Mat2{1.0f, 2.0f, 3.0f, 2.0f} * Vec2{4.0f, 5.0f} == Vec2{14.0f, 22.0f});

    const Mat2 mat{1.0f, 3.0f, 1.5f, 2.0f};
    const Mat2 doubled{2.0f, 6.0f, 3.0f, 4.0f};
    CHECK(mat.scale(2.0f) == doubled);
    CHECK(2.0f * mat == doubled);
    CHECK(mat * 2.0f == doubled);
}

TEST_CASE("Mat2 determinant propagates NaN", "[math][mat2]")
{
    const f32 nan = std::numeric_limits<f32>::quiet_NaN();
    CHECK(std::isnan(Mat2{nan, 0.0f, 0.0f, 1.0f}.determinant()));
}

} // namespace mtr::math
