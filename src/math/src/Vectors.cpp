/**
 * @file Vectors.cpp
 * @brief Fallible construction of Vec2, Vec3 and Vec4.
 *
 * The arithmetic is inline (see the .inl files); only the buffer readers
 * live here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/math/Vec2.hpp"
#include "mtr/math/Vec3.hpp"
#include "mtr/math/Vec4.hpp"

#include "SpanCheck.hpp"

namespace mtr::math {

core::Expected<Vec2> Vec2::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Vec2"));
    return Vec2{input[0], input[1]};
}

core::Expected<Vec3> Vec3::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Vec3"));
    return Vec3{input[0], input[1], input[2]};
}

core::Expected<Vec4> Vec4::fromSpan(std::span<const core::f32> input)
{
    MTR_TRY_VOID(detail::checkLength(input, kSize, "Vec4"));
    return Vec4{input[0], input[1], input[2], input[3]};
}

} // namespace mtr::math
