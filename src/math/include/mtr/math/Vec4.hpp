/**
 * @file Vec4.hpp
 * @brief 4-component single-precision vector (homogeneous coordinates).
 *
 * There is no cross product at this arity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_VEC4_HPP
    #define MTR_MATH_VEC4_HPP

    #include <mtr/core/Assert.hpp>
    #include <mtr/core/Concepts.hpp>
    #include <mtr/core/Expected.hpp>
    #include <mtr/core/Types.hpp>

    #include <array>
    #include <span>

namespace mtr::math {

struct Vec4 final {
    static constexpr core::u32 kSize = 4;

    core::f32 x{};
    core::f32 y{};
    core::f32 z{};
    core::f32 w{};

    constexpr Vec4() = default;
    constexpr Vec4(core::f32 x, core::f32 y, core::f32 z, core::f32 w);

    static constexpr Vec4 zero();
    static constexpr Vec4 unitX();
    static constexpr Vec4 unitY();
    static constexpr Vec4 unitZ();
    static constexpr Vec4 unitW();
    static constexpr Vec4 fromValues(core::f32 x, core::f32 y, core::f32 z, core::f32 w);
    static constexpr Vec4 fromArray(const std::array<core::f32, kSize> &input);

    /**
     * @brief Build from a loosely-sized buffer.
     * @return The vector, or ErrorCode::kInvalidLength unless
     *         @p input holds exactly four elements.
     */
    [[nodiscard]] static core::Expected<Vec4> fromSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize> toArray() const;

    [[nodiscard]] constexpr Vec4 add(Vec4 rhs)        const;
    [[nodiscard]] constexpr Vec4 subtract(Vec4 rhs)   const;
    [[nodiscard]] constexpr Vec4 negate()             const;
    [[nodiscard]] constexpr Vec4 scale(core::f32 s)   const;
    [[nodiscard]] constexpr core::f32 dot(Vec4 rhs)   const;

    [[nodiscard]] constexpr core::f32 lengthSquared() const;
    [[nodiscard]] core::f32 length()                         const;
    [[nodiscard]] Vec4      normalize()                      const;

    [[nodiscard]] constexpr Vec4 operator+(Vec4 rhs)       const;
    [[nodiscard]] constexpr Vec4 operator-(Vec4 rhs)       const;
    [[nodiscard]] constexpr Vec4 operator*(core::f32 s)    const;
    [[nodiscard]] constexpr Vec4 operator/(core::f32 s)    const;
    [[nodiscard]] constexpr Vec4 operator-()               const;
    [[nodiscard]] constexpr core::f32   operator[](core::u32 idx) const;

    constexpr Vec4 &operator+=(Vec4 rhs);
    constexpr Vec4 &operator-=(Vec4 rhs);
    constexpr Vec4 &operator*=(core::f32 s);

    friend constexpr bool operator==(const Vec4 &, const Vec4 &) = default;
};

[[nodiscard]] constexpr Vec4 operator*(core::f32 s, Vec4 v);

static_assert(core::Blittable<Vec4>);

} // namespace mtr::math

    #include "Vec4.inl"

#endif // MTR_MATH_VEC4_HPP
