/**
 * @file TestMat3.cpp
 * @brief Unit tests for Mat3.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>
#include <mtr/math/Mat3.hpp>

#include <vector>

namespace mtr::math {

using core::f32;

namespace {

constexpr Mat3 kCounting = Mat3::fromArray({1.0f, 2.0f, 3.0f,
                                            4.0f, 5.0f, 6.0f,
                                            7.0f, 8.0f, 9.0f});

} // namespace

TEST_CASE("Mat3 element access", "[math][mat3]")
{
    STATIC_REQUIRE(kCounting.e == 5.0f);
    STATIC_REQUIRE(kCounting(2, 1) == 8.0f);
    CHECK(kCounting.row(0) == Vec3{1.0f, 2.0f, 3.0f});
    CHECK(kCounting.toVectorColumns()[2] == Vec3{3.0f, 6.0f, 9.0f});
    CHECK(kCounting.transpose() == Mat3::fromColArray(kCounting.toArray()));
}

TEST_CASE("Mat3 determinant", "[math][mat3]")
{
    const std::vector<f32> input{2.0f, 3.0f, 5.0f, 7.0f, 1.0f, 2.0f, 5.0f, 1.0f, 0.0f};
    const auto mat = Mat3::fromSpan(input);
    REQUIRE(mat.has_value());
    CHECK(mat->determinant() == 36.0f);

    CHECK(kCounting.determinant() == 0.0f);
    CHECK(Mat3::identity().determinant() == 1.0f);
}

TEST_CASE("Mat3 multiply", "[math][mat3]")
{
    const Mat3 rhs{9.0f, 8.0f, 7.0f,
                   6.0f, 5.0f, 4.0f,
                   3.0f, 2.0f, 1.0f};

    CHECK(kCounting * rhs == Mat3{30.0f, 24.0f, 18.0f,
                                  84.0f, 69.0f, 54.0f,
                                  138.0f, 114.0f, 90.0f});
    CHECK(rhs * kCounting == Mat3{90.0f, 114.0f, 138.0f,
                                  54.0f, 69.0f, 84.0f,
                                  18.0f, 24.0f, 30.0f});
}

TEST_CASE("Mat3 multiply by vector and scalar", "[math][mat3]")
{
    CHECK(kCounting * Vec3{1.0f, 0.0f, -1.0f} == Vec3{-2.0f, -2.0f, -2.0f});
    CHECK(0.5f * kCounting == Mat3{0.5f, 1.0f, 1.5f,
                                   2.0f, 2.5f, 3.0f,
                                   3.5f, 4.0f, 4.5f});
}

TEST_CASE("Mat3 span constructors", "[math][mat3]")
{
    const std::vector<f32> input{1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f, 7.0f, 8.0f, 9.0f};

    const auto colMajor = Mat3::fromColSpan(input);
    REQUIRE(colMajor.has_value());
    CHECK(*colMajor == kCounting.transpose());

    const std::vector<f32> tooShort{1.0f, 2.0f, 3.0f, 4.0f};
    const auto failed = Mat3::fromSpan(tooShort);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().message() == "Mat3 expects 9 elements, got 4");
}

} // namespace mtr::math
