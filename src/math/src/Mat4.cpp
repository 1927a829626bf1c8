/**
 * @file Mat4.cpp
 * @brief Mat4 kernels.
 *
 * Every sum below is written in the order it must be evaluated.  The
 * library is built with floating-point contraction disabled, so no term is
 * fused or reassociated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/math/Mat4.hpp"

#include "SpanCheck.hpp"

namespace mtr::math {

core::Expected<Mat4> Mat4::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Mat4"));
    return Mat4{input[0],  input[1],  input[2],  input[3],
                input[4],  input[5],  input[6],  input[7],
                input[8],  input[9],  input[10], input[11],
                input[12], input[13], input[14], input[15]};
}

core::Expected<Mat4> Mat4::fromColSpan(std::span<const core::f32> input)
{
    const Mat4 rowMajor = MTR_TRY(fromSpan(input));
    return rowMajor.transpose();
}

Vec4 Mat4::row(core::u32 r) const
{
    MTR_ASSERT(r < kOrder);
    return {(*this)(r, 0), (*this)(r, 1), (*this)(r, 2), (*this)(r, 3)};
}

core::f32 Mat4::determinant() const
{
    // First level: one group per first-row element.  Second level: inside a
    // group, one term per fourth-row element, each multiplying a 2x2 minor
    // of rows two and three.  Do not regroup.
    return (a * (
                (p * ((f * k) - (g * j)))
              + (o * (-(f * l) + (h * j)))
              + (n * ((g * l) - (h * k)))
           ))

         + (b * (
                (p * (-(e * k) + (g * i)))
              + (o * ((e * l) - (h * i)))
              + (m * (-(g * l) + (h * k)))
           ))

         + (c * (
                (p * ((e * j) - (f * i)))
              + (n * (-(e * l) + (h * i)))
              + (m * ((f * l) - (h * j)))
           ))

         + (d * (
                (o * (-(e * j) + (f * i)))
              + (n * ((e * k) - (g * i)))
              + (m * (-(f * k) + (g * j)))
           ));
}

Mat4 Mat4::multiply(const Mat4 &rhs) const
{
    return {
        (a * rhs.a) + (b * rhs.e) + (c * rhs.i) + (d * rhs.m),
        (a * rhs.b) + (b * rhs.f) + (c * rhs.j) + (d * rhs.n),
        (a * rhs.c) + (b * rhs.g) + (c * rhs.k) + (d * rhs.o),
        (a * rhs.d) + (b * rhs.h) + (c * rhs.l) + (d * rhs.p),

        (e * rhs.a) + (f * rhs.e) + (g * rhs.i) + (h * rhs.m),
        (e * rhs.b) + (f * rhs.f) + (g * rhs.j) + (h * rhs.n),
        (e * rhs.c) + (f * rhs.g) + (g * rhs.k) + (h * rhs.o),
        (e * rhs.d) + (f * rhs.h) + (g * rhs.l) + (h * rhs.p),

        (i * rhs.a) + (j * rhs.e) + (k * rhs.i) + (l * rhs.m),
        (i * rhs.b) + (j * rhs.f) + (k * rhs.j) + (l * rhs.n),
        (i * rhs.c) + (j * rhs.g) + (k * rhs.k) + (l * rhs.o),
        (i * rhs.d) + (j * rhs.h) + (k * rhs.l) + (l * rhs.p),

        (m * rhs.a) + (n * rhs.e) + (o * rhs.i) + (p * rhs.m),
        (m * rhs.b) + (n * rhs.f) + (o * rhs.j) + (p * rhs.n),
        (m * rhs.c) + (n * rhs.g) + (o * rhs.k) + (p * rhs.o),
        (m * rhs.d) + (n * rhs.h) + (o * rhs.l) + (p * rhs.p)
    };
}

Vec4 Mat4::multiply(Vec4 v) const
{
    return {
        (a * v.x) + (b * v.y) + (c * v.z) + (d * v.w),
        (e * v.x) + (f * v.y) + (g * v.z) + (h * v.w),
        (i * v.x) + (j * v.y) + (k * v.z) + (l * v.w),
        (m * v.x) + (n * v.y) + (o * v.z) + (p * v.w)
    };
}

Mat4 Mat4::scale(core::f32 s) const
{
    return {s * a, s * b, s * c, s * d,
            s * e, s * f, s * g, s * h,
            s * i, s * j, s * k, s * l,
            s * m, s * n, s * o, s * p};
}

} // namespace mtr::math
