/**
 * @file Vec2.inl
 * @brief Inline implementation of Vec2 operations.
 * @see   Vec2.hpp
 */

#ifndef MTR_MATH_VEC2_INL
    #define MTR_MATH_VEC2_INL

#include <cmath>

namespace mtr::math {

constexpr Vec2::Vec2(core::f32 x_, core::f32 y_) : x(x_), y(y_) {}

constexpr Vec2 Vec2::zero()  { return {0.0f, 0.0f}; }
constexpr Vec2 Vec2::unitX() { return {1.0f, 0.0f}; }
constexpr Vec2 Vec2::unitY() { return {0.0f, 1.0f}; }

constexpr Vec2 Vec2::fromValues(core::f32 x_, core::f32 y_) { return {x_, y_}; }

constexpr Vec2 Vec2::fromArray(const std::array<core::f32, kSize> &input) { return {input[0], input[1]}; }

constexpr std::array<core::f32, Vec2::kSize> Vec2::toArray() const { return {x, y}; }

constexpr Vec2 Vec2::add(Vec2 rhs)      const { return {x + rhs.x, y + rhs.y}; }
constexpr Vec2 Vec2::subtract(Vec2 rhs) const { return {x - rhs.x, y - rhs.y}; }
constexpr Vec2 Vec2::negate()           const { return {-x, -y}; }
constexpr Vec2 Vec2::scale(core::f32 s) const { return {s * x, s * y}; }

constexpr core::f32 Vec2::dot(Vec2 rhs) const { return (x * rhs.x) + (y * rhs.y); }

constexpr Vec3 Vec2::cross(Vec2 rhs) const
{
    // Both operands have z = 0: x and y of the product are 0 * z - z * 0.
    return {0.0f, 0.0f, (x * rhs.y) - (y * rhs.x)};
}

constexpr core::f32 Vec2::lengthSquared() const { return dot(*this); }

inline core::f32 Vec2::length() const { return std::sqrt(lengthSquared()); }

inline Vec2 Vec2::normalize() const
{
    const core::f32 inv = 1.0f / length();
    return *this * inv;
}

constexpr Vec2 Vec2::operator+(Vec2 rhs)    const { return add(rhs); }
constexpr Vec2 Vec2::operator-(Vec2 rhs)    const { return subtract(rhs); }
constexpr Vec2 Vec2::operator*(core::f32 s) const { return scale(s); }
constexpr Vec2 Vec2::operator/(core::f32 s) const { return {x / s, y / s}; }
constexpr Vec2 Vec2::operator-()            const { return negate(); }

constexpr core::f32 Vec2::operator[](core::u32 idx) const
{
    MTR_ASSERT(idx < kSize);
    return toArray()[idx];
}

constexpr Vec2 &Vec2::operator+=(Vec2 rhs)    { *this = add(rhs);      return *this; }
constexpr Vec2 &Vec2::operator-=(Vec2 rhs)    { *this = subtract(rhs); return *this; }
constexpr Vec2 &Vec2::operator*=(core::f32 s) { *this = scale(s);      return *this; }

constexpr Vec2 operator*(core::f32 s, Vec2 v) { return v.scale(s); }

} // namespace mtr::math

#endif // MTR_MATH_VEC2_INL
