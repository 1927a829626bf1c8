/**
 * @file Mat2.cpp
 * @brief Mat2 kernels.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/math/Mat2.hpp"

#include "SpanCheck.hpp"

namespace mtr::math {

core::Expected<Mat2> Mat2::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Mat2"));
    return Mat2{input[0], input[1],
                input[2], input[3]};
}

core::Expected<Mat2> Mat2::fromColSpan(std::span<const core::f32> input)
{
    const Mat2 rowMajor = MTR_TRY(fromSpan(input));
    return rowMajor.transpose();
}

Vec2 Mat2::row(core::u32 r) const
{
    MTR_ASSERT(r < kOrder);
    return {(*this)(r, 0), (*this)(r, 1)};
}

core::f32 Mat2::determinant() const
{
    return (a * d) - (b * c);
}

// Naive row-by-column product.  A 7-multiplication Strassen split was
// measured about twice as slow at this size.
Mat2 Mat2::multiply(const Mat2 &rhs) const
{
    return {
        (a * rhs.a) + (b * rhs.c),
        (a * rhs.b) + (b * rhs.d),
        (c * rhs.a) + (d * rhs.c),
        (c * rhs.b) + (d * rhs.d)
    };
}

Vec2 Mat2::multiply(Vec2 v) const
{
    return {
        (a * v.x) + (b * v.y),
        (c * v.x) + (d * v.y)
    };
}

Mat2 Mat2::scale(core::f32 s) const
{
    return {s * a, s * b,
            s * c, s * d};
}

} // namespace mtr::math
