/**
 * @file Vec2.hpp
 * @brief 2-component single-precision vector.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_VEC2_HPP
    #define MTR_MATH_VEC2_HPP

    #include "Vec3.hpp"

namespace mtr::math {

struct Vec2 final {
    static constexpr core::u32 kSize = 2;

    core::f32 x{};
    core::f32 y{};

    constexpr Vec2() = default;
    constexpr Vec2(core::f32 x, core::f32 y);

    static constexpr Vec2 zero();
    static constexpr Vec2 unitX();
    static constexpr Vec2 unitY();
    static constexpr Vec2 fromValues(core::f32 x, core::f32 y);
    static constexpr Vec2 fromArray(const std::array<core::f32, kSize> &input);

    /**
     * @brief Build from a loosely-sized buffer.
     * @return The vector, or ErrorCode::kInvalidLength unless
     *         @p input holds exactly two elements.
     */
    [[nodiscard]] static core::Expected<Vec2> fromSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize> toArray() const;

    [[nodiscard]] constexpr Vec2 add(Vec2 rhs)        const;
    [[nodiscard]] constexpr Vec2 subtract(Vec2 rhs)   const;
    [[nodiscard]] constexpr Vec2 negate()             const;
    [[nodiscard]] constexpr Vec2 scale(core::f32 s)   const;
    [[nodiscard]] constexpr core::f32 dot(Vec2 rhs)   const;

    /**
     * @brief Cross product of the two vectors lifted to 3-space with z = 0.
     *
     * The x and y components of such a product are always zero, so only
     * z = x * rhs.y - y * rhs.x is computed.
     */
    [[nodiscard]] constexpr Vec3 cross(Vec2 rhs)      const;

    [[nodiscard]] constexpr core::f32 lengthSquared() const;
    [[nodiscard]] core::f32 length()                         const;
    [[nodiscard]] Vec2      normalize()                      const;

    [[nodiscard]] constexpr Vec2 operator+(Vec2 rhs)       const;
    [[nodiscard]] constexpr Vec2 operator-(Vec2 rhs)       const;
    [[nodiscard]] constexpr Vec2 operator*(core::f32 s)    const;
    [[nodiscard]] constexpr Vec2 operator/(core::f32 s)    const;
    [[nodiscard]] constexpr Vec2 operator-()               const;
    [[nodiscard]] constexpr core::f32   operator[](core::u32 idx) const;

    constexpr Vec2 &operator+=(Vec2 rhs);
    constexpr Vec2 &operator-=(Vec2 rhs);
    constexpr Vec2 &operator*=(core::f32 s);

    friend constexpr bool operator==(const Vec2 &, const Vec2 &) = default;
};

[[nodiscard]] constexpr Vec2 operator*(core::f32 s, Vec2 v);

static_assert(core::Blittable<Vec2>);

} // namespace mtr::math

    #include "Vec2.inl"

#endif // MTR_MATH_VEC2_HPP
