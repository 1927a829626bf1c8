/**
 * @file Mat3.hpp
 * @brief 3x3 single-precision matrix with row-major named elements.
 *
 * @code
 *     [ a  b  c ]
 * A = [ d  e  f ]
 *     [ g  h  i ]
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_MAT3_HPP
    #define MTR_MATH_MAT3_HPP

    #include "Vec3.hpp"

namespace mtr::math {

struct Mat3 final {
    static constexpr core::u32 kOrder = 3;
    static constexpr core::u32 kSize  = kOrder * kOrder;

    core::f32 a{};
    core::f32 b{};
    core::f32 c{};
    core::f32 d{};
    core::f32 e{};
    core::f32 f{};
    core::f32 g{};
    core::f32 h{};
    core::f32 i{};

    constexpr Mat3() = default;
    constexpr Mat3(core::f32 a, core::f32 b, core::f32 c,
                   core::f32 d, core::f32 e, core::f32 f,
                   core::f32 g, core::f32 h, core::f32 i);

    static constexpr Mat3 zero();
    static constexpr Mat3 identity();
    static constexpr Mat3 fromValues(core::f32 a, core::f32 b, core::f32 c,
                                     core::f32 d, core::f32 e, core::f32 f,
                                     core::f32 g, core::f32 h, core::f32 i);
    static constexpr Mat3 fromArray(const std::array<core::f32, kSize> &input);
    static constexpr Mat3 fromColArray(const std::array<core::f32, kSize> &input);
    static constexpr Mat3 fromColumns(Vec3 col0, Vec3 col1, Vec3 col2);

    [[nodiscard]] static core::Expected<Mat3> fromSpan(std::span<const core::f32> input);
    [[nodiscard]] static core::Expected<Mat3> fromColSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize>  toArray()         const;
    [[nodiscard]] constexpr std::array<core::f32, kSize>  toColArray()      const;
    [[nodiscard]] constexpr std::array<Vec3, kOrder>      toVectorColumns() const;

    [[nodiscard]] constexpr core::f32 operator()(core::u32 rowIdx, core::u32 colIdx) const;
    [[nodiscard]] Vec3 row(core::u32 r) const;

    [[nodiscard]] constexpr Mat3 transpose() const;

    /// @brief First-row cofactor expansion, each minor by the 2x2 identity.
    [[nodiscard]] core::f32 determinant() const;

    [[nodiscard]] Mat3 multiply(const Mat3 &rhs) const;
    [[nodiscard]] Vec3 multiply(Vec3 v)          const;
    [[nodiscard]] Mat3 scale(core::f32 s)        const;

    [[nodiscard]] Mat3 operator*(const Mat3 &rhs) const { return multiply(rhs); }
    [[nodiscard]] Vec3 operator*(Vec3 v)          const { return multiply(v); }
    [[nodiscard]] Mat3 operator*(core::f32 s)     const { return scale(s); }

    friend constexpr bool operator==(const Mat3 &, const Mat3 &) = default;
};

[[nodiscard]] inline Mat3 operator*(core::f32 s, const Mat3 &m) { return m.scale(s); }

static_assert(core::Blittable<Mat3>);

// ─── Inline implementations ─────────────────────────────────────────────────

constexpr Mat3::Mat3(core::f32 a_, core::f32 b_, core::f32 c_,
                     core::f32 d_, core::f32 e_, core::f32 f_,
                     core::f32 g_, core::f32 h_, core::f32 i_)
    : a(a_), b(b_), c(c_)
    , d(d_), e(e_), f(f_)
    , g(g_), h(h_), i(i_)
{}

constexpr Mat3 Mat3::zero()
{
    return {0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f};
}

constexpr Mat3 Mat3::identity()
{
    return {1.0f, 0.0f, 0.0f,
            0.0f, 1.0f, 0.0f,
            0.0f, 0.0f, 1.0f};
}

constexpr Mat3 Mat3::fromValues(core::f32 a_, core::f32 b_, core::f32 c_,
                                core::f32 d_, core::f32 e_, core::f32 f_,
                                core::f32 g_, core::f32 h_, core::f32 i_)
{
    return {a_, b_, c_,
            d_, e_, f_,
            g_, h_, i_};
}

constexpr Mat3 Mat3::fromArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[1], input[2],
            input[3], input[4], input[5],
            input[6], input[7], input[8]};
}

constexpr Mat3 Mat3::fromColArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[3], input[6],
            input[1], input[4], input[7],
            input[2], input[5], input[8]};
}

constexpr Mat3 Mat3::fromColumns(Vec3 col0, Vec3 col1, Vec3 col2)
{
    return {col0.x, col1.x, col2.x,
            col0.y, col1.y, col2.y,
            col0.z, col1.z, col2.z};
}

constexpr std::array<core::f32, Mat3::kSize> Mat3::toArray() const
{
    return {a, b, c, d, e, f, g, h, i};
}

constexpr std::array<core::f32, Mat3::kSize> Mat3::toColArray() const
{
    return {a, d, g, b, e, h, c, f, i};
}

constexpr std::array<Vec3, Mat3::kOrder> Mat3::toVectorColumns() const
{
    return {
        Vec3{a, d, g},
        Vec3{b, e, h},
        Vec3{c, f, i}
    };
}

constexpr core::f32 Mat3::operator()(core::u32 rowIdx, core::u32 colIdx) const
{
    MTR_ASSERT(rowIdx < kOrder && colIdx < kOrder);
    return toArray()[rowIdx * kOrder + colIdx];
}

constexpr Mat3 Mat3::transpose() const
{
    return {a, d, g,
            b, e, h,
            c, f, i};
}

} // namespace mtr::math

#endif // MTR_MATH_MAT3_HPP
