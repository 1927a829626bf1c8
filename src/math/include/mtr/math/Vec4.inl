/**
 * @file Vec4.inl
 * @brief Inline implementation of Vec4 operations.
 * @see   Vec4.hpp
 */

#ifndef MTR_MATH_VEC4_INL
    #define MTR_MATH_VEC4_INL

#include <cmath>

namespace mtr::math {

constexpr Vec4::Vec4(core::f32 x_, core::f32 y_, core::f32 z_, core::f32 w_)
    : x(x_), y(y_), z(z_), w(w_) {}

constexpr Vec4 Vec4::zero()  { return {0.0f, 0.0f, 0.0f, 0.0f}; }
constexpr Vec4 Vec4::unitX() { return {1.0f, 0.0f, 0.0f, 0.0f}; }
constexpr Vec4 Vec4::unitY() { return {0.0f, 1.0f, 0.0f, 0.0f}; }
constexpr Vec4 Vec4::unitZ() { return {0.0f, 0.0f, 1.0f, 0.0f}; }
constexpr Vec4 Vec4::unitW() { return {0.0f, 0.0f, 0.0f, 1.0f}; }

constexpr Vec4 Vec4::fromValues(core::f32 x_, core::f32 y_, core::f32 z_, core::f32 w_)
{
    return {x_, y_, z_, w_};
}

constexpr Vec4 Vec4::fromArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[1], input[2], input[3]};
}

constexpr std::array<core::f32, Vec4::kSize> Vec4::toArray() const { return {x, y, z, w}; }

constexpr Vec4 Vec4::add(Vec4 rhs)      const { return {x + rhs.x, y + rhs.y, z + rhs.z, w + rhs.w}; }
constexpr Vec4 Vec4::subtract(Vec4 rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z, w - rhs.w}; }
constexpr Vec4 Vec4::negate()           const { return {-x, -y, -z, -w}; }
constexpr Vec4 Vec4::scale(core::f32 s) const { return {s * x, s * y, s * z, s * w}; }

constexpr core::f32 Vec4::dot(Vec4 rhs) const
{
    return (x * rhs.x) + (y * rhs.y)
         + (z * rhs.z) + (w * rhs.w);
}

constexpr core::f32 Vec4::lengthSquared() const { return dot(*this); }

inline core::f32 Vec4::length() const { return std::sqrt(lengthSquared()); }

inline Vec4 Vec4::normalize() const
{
    const core::f32 inv = 1.0f / length();
    return *this * inv;
}

constexpr Vec4 Vec4::operator+(Vec4 rhs)    const { return add(rhs); }
constexpr Vec4 Vec4::operator-(Vec4 rhs)    const { return subtract(rhs); }
constexpr Vec4 Vec4::operator*(core::f32 s) const { return scale(s); }
constexpr Vec4 Vec4::operator/(core::f32 s) const { return {x / s, y / s, z / s, w / s}; }
constexpr Vec4 Vec4::operator-()            const { return negate(); }

constexpr core::f32 Vec4::operator[](core::u32 idx) const
{
    MTR_ASSERT(idx < kSize);
    return toArray()[idx];
}

constexpr Vec4 &Vec4::operator+=(Vec4 rhs)    { *this = add(rhs);      return *this; }
constexpr Vec4 &Vec4::operator-=(Vec4 rhs)    { *this = subtract(rhs); return *this; }
constexpr Vec4 &Vec4::operator*=(core::f32 s) { *this = scale(s);      return *this; }

constexpr Vec4 operator*(core::f32 s, Vec4 v) { return v.scale(s); }

} // namespace mtr::math

#endif // MTR_MATH_VEC4_INL
