/**
 * @file Mat3.cpp
 * @brief Mat3 kernels.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/math/Mat3.hpp"

#include "SpanCheck.hpp"

namespace mtr::math {

core::Expected<Mat3> Mat3::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Mat3"));
    return Mat3{input[0], input[1], input[2],
                input[3], input[4], input[5],
                input[6], input[7], input[8]};
}

core::Expected<Mat3> Mat3::fromColSpan(std::span<const core::f32> input)
{
    const Mat3 rowMajor = MTR_TRY(fromSpan(input));
    return rowMajor.transpose();
}

Vec3 Mat3::row(core::u32 r) const
{
    MTR_ASSERT(r < kOrder);
    return {(*this)(r, 0), (*this)(r, 1), (*this)(r, 2)};
}

core::f32 Mat3::determinant() const
{
    return (a * ((e * i) - (f * h)))
         + (b * ((f * g) - (d * i)))
         + (c * ((d * h) - (e * g)));
}

Mat3 Mat3::multiply(const Mat3 &rhs) const
{
    return {
        (a * rhs.a) + (b * rhs.d) + (c * rhs.g),
        (a * rhs.b) + (b * rhs.e) + (c * rhs.h),
        (a * rhs.c) + (b * rhs.f) + (c * rhs.i),
        (d * rhs.a) + (e * rhs.d) + (f * rhs.g),
        (d * rhs.b) + (e * rhs.e) + (f * rhs.h),
        (d * rhs.c) + (e * rhs.f) + (f * rhs.i),
        (g * rhs.a) + (h * rhs.d) + (i * rhs.g),
        (g * rhs.b) + (h * rhs.e) + (i * rhs.h),
        (g * rhs.c) + (h * rhs.f) + (i * rhs.i)
    };
}

Vec3 Mat3::multiply(Vec3 v) const
{
    return {
        (a * v.x) + (b * v.y) + (c * v.z),
        (d * v.x) + (e * v.y) + (f * v.z),
        (g * v.x) + (h * v.y) + (i * v.z)
    };
}

Mat3 Mat3::scale(core::f32 s) const
{
    return {s * a, s * b, s * c,
            s * d, s * e, s * f,
            s * g, s * h, s * i};
}

} // namespace mtr::math
