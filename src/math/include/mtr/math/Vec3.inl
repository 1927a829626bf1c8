/**
 * @file Vec3.inl
 * @brief Inline implementation of Vec3 operations.
 * @see   Vec3.hpp
 */

#ifndef MTR_MATH_VEC3_INL
    #define MTR_MATH_VEC3_INL

#include <cmath>

namespace mtr::math {

constexpr Vec3::Vec3(core::f32 x_, core::f32 y_, core::f32 z_) : x(x_), y(y_), z(z_) {}

constexpr Vec3 Vec3::zero()  { return {0.0f, 0.0f, 0.0f}; }
constexpr Vec3 Vec3::unitX() { return {1.0f, 0.0f, 0.0f}; }
constexpr Vec3 Vec3::unitY() { return {0.0f, 1.0f, 0.0f}; }
constexpr Vec3 Vec3::unitZ() { return {0.0f, 0.0f, 1.0f}; }

constexpr Vec3 Vec3::fromValues(core::f32 x_, core::f32 y_, core::f32 z_) { return {x_, y_, z_}; }

constexpr Vec3 Vec3::fromArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[1], input[2]};
}

constexpr std::array<core::f32, Vec3::kSize> Vec3::toArray() const { return {x, y, z}; }

constexpr Vec3 Vec3::add(Vec3 rhs)      const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
constexpr Vec3 Vec3::subtract(Vec3 rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
constexpr Vec3 Vec3::negate()           const { return {-x, -y, -z}; }
constexpr Vec3 Vec3::scale(core::f32 s) const { return {s * x, s * y, s * z}; }

constexpr core::f32 Vec3::dot(Vec3 rhs) const
{
    return (x * rhs.x) + (y * rhs.y) + (z * rhs.z);
}

constexpr Vec3 Vec3::cross(Vec3 rhs) const
{
    return {
        (y * rhs.z) - (z * rhs.y),
        (z * rhs.x) - (x * rhs.z),
        (x * rhs.y) - (y * rhs.x)
    };
}

constexpr core::f32 Vec3::lengthSquared() const { return dot(*this); }

inline core::f32 Vec3::length() const { return std::sqrt(lengthSquared()); }

inline Vec3 Vec3::normalize() const
{
    const core::f32 inv = 1.0f / length();
    return *this * inv;
}

constexpr Vec3 Vec3::operator+(Vec3 rhs)    const { return add(rhs); }
constexpr Vec3 Vec3::operator-(Vec3 rhs)    const { return subtract(rhs); }
constexpr Vec3 Vec3::operator*(core::f32 s) const { return scale(s); }
constexpr Vec3 Vec3::operator/(core::f32 s) const { return {x / s, y / s, z / s}; }
constexpr Vec3 Vec3::operator-()            const { return negate(); }

constexpr core::f32 Vec3::operator[](core::u32 idx) const
{
    MTR_ASSERT(idx < kSize);
    return toArray()[idx];
}

constexpr Vec3 &Vec3::operator+=(Vec3 rhs)    { *this = add(rhs);      return *this; }
constexpr Vec3 &Vec3::operator-=(Vec3 rhs)    { *this = subtract(rhs); return *this; }
constexpr Vec3 &Vec3::operator*=(core::f32 s) { *this = scale(s);      return *this; }

constexpr Vec3 operator*(core::f32 s, Vec3 v) { return v.scale(s); }

} // namespace mtr::math

#endif // MTR_MATH_VEC3_INL
