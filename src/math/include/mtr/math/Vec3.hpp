/**
 * @file Vec3.hpp
 * @brief 3-component single-precision vector.
 *
 * Flat value type: copying duplicates the three fields, nothing is shared.
 * Every operation returns a new vector except the compound assignments,
 * which replace the receiver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_VEC3_HPP
    #define MTR_MATH_VEC3_HPP

    #include <mtr/core/Assert.hpp>
    #include <mtr/core/Concepts.hpp>
    #include <mtr/core/Expected.hpp>
    #include <mtr/core/Types.hpp>

    #include <array>
    #include <span>

namespace mtr::math {

struct Vec3 final {
    static constexpr core::u32 kSize = 3;

    core::f32 x{};
    core::f32 y{};
    core::f32 z{};

    constexpr Vec3() = default;
    constexpr Vec3(core::f32 x, core::f32 y, core::f32 z);

    static constexpr Vec3 zero();
    static constexpr Vec3 unitX();
    static constexpr Vec3 unitY();
    static constexpr Vec3 unitZ();
    static constexpr Vec3 fromValues(core::f32 x, core::f32 y, core::f32 z);
    static constexpr Vec3 fromArray(const std::array<core::f32, kSize> &input);

    /**
     * @brief Build from a loosely-sized buffer.
     * @return The vector, or ErrorCode::kInvalidLength unless
     *         @p input holds exactly three elements.
     */
    [[nodiscard]] static core::Expected<Vec3> fromSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize> toArray() const;

    [[nodiscard]] constexpr Vec3 add(Vec3 rhs)        const;
    [[nodiscard]] constexpr Vec3 subtract(Vec3 rhs)   const;
    [[nodiscard]] constexpr Vec3 negate()             const;
    [[nodiscard]] constexpr Vec3 scale(core::f32 s)   const;

    /// @brief Sum of component-wise products.
    [[nodiscard]] constexpr core::f32 dot(Vec3 rhs)   const;

    /// @brief Right-handed cross product.
    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs)      const;

    [[nodiscard]] constexpr core::f32 lengthSquared() const;
    [[nodiscard]] core::f32 length()                         const;
    [[nodiscard]] Vec3      normalize()                      const;

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs)       const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs)       const;
    [[nodiscard]] constexpr Vec3 operator*(core::f32 s)    const;
    [[nodiscard]] constexpr Vec3 operator/(core::f32 s)    const;
    [[nodiscard]] constexpr Vec3 operator-()               const;
    [[nodiscard]] constexpr core::f32   operator[](core::u32 idx) const;

    constexpr Vec3 &operator+=(Vec3 rhs);
    constexpr Vec3 &operator-=(Vec3 rhs);
    constexpr Vec3 &operator*=(core::f32 s);

    friend constexpr bool operator==(const Vec3 &, const Vec3 &) = default;
};

[[nodiscard]] constexpr Vec3 operator*(core::f32 s, Vec3 v);

static_assert(core::Blittable<Vec3>);

} // namespace mtr::math

    #include "Vec3.inl"

#endif // MTR_MATH_VEC3_HPP
