/**
 * @file Mat4.hpp
 * @brief 4x4 single-precision matrix with row-major named elements.
 *
 * @code
 *     [ a  b  c  d ]
 * A = [ e  f  g  h ]
 *     [ i  j  k  l ]
 *     [ m  n  o  p ]
 * @endcode
 *
 * toColArray() yields the column-major layout expected by graphics APIs
 * for uniform upload.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_MAT4_HPP
    #define MTR_MATH_MAT4_HPP

    #include "Vec4.hpp"

namespace mtr::math {

struct Mat4 final {
    static constexpr core::u32 kOrder = 4;
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
    core::f32 j{};
    core::f32 k{};
    core::f32 l{};
    core::f32 m{};
    core::f32 n{};
    core::f32 o{};
    core::f32 p{};

    constexpr Mat4() = default;
    constexpr Mat4(core::f32 a, core::f32 b, core::f32 c, core::f32 d,
                   core::f32 e, core::f32 f, core::f32 g, core::f32 h,
                   core::f32 i, core::f32 j, core::f32 k, core::f32 l,
                   core::f32 m, core::f32 n, core::f32 o, core::f32 p);

    static constexpr Mat4 zero();
    static constexpr Mat4 identity();
    static constexpr Mat4 fromValues(core::f32 a, core::f32 b, core::f32 c, core::f32 d,
                                     core::f32 e, core::f32 f, core::f32 g, core::f32 h,
                                     core::f32 i, core::f32 j, core::f32 k, core::f32 l,
                                     core::f32 m, core::f32 n, core::f32 o, core::f32 p);
    static constexpr Mat4 fromArray(const std::array<core::f32, kSize> &input);
    static constexpr Mat4 fromColArray(const std::array<core::f32, kSize> &input);
    static constexpr Mat4 fromColumns(Vec4 col0, Vec4 col1, Vec4 col2, Vec4 col3);

    [[nodiscard]] static core::Expected<Mat4> fromSpan(std::span<const core::f32> input);
    [[nodiscard]] static core::Expected<Mat4> fromColSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize>  toArray()         const;
    [[nodiscard]] constexpr std::array<core::f32, kSize>  toColArray()      const;
    [[nodiscard]] constexpr std::array<Vec4, kOrder>      toVectorColumns() const;

    [[nodiscard]] constexpr core::f32 operator()(core::u32 rowIdx, core::u32 colIdx) const;
    [[nodiscard]] Vec4 row(core::u32 r) const;

    [[nodiscard]] constexpr Mat4 transpose() const;

    /**
     * @brief Determinant by a two-level grouped Laplace expansion.
     *
     * Terms are grouped by the first-row element (a, b, c, d) and, inside
     * each group, by the fourth-row element (m, n, o, p): 40 multiplications
     * instead of the 72 of the flat 24-term expansion.  The summation order
     * is fixed; results are reproducible bit for bit.
     */
    [[nodiscard]] core::f32 determinant() const;

    [[nodiscard]] Mat4 multiply(const Mat4 &rhs) const;
    [[nodiscard]] Vec4 multiply(Vec4 v)          const;
    [[nodiscard]] Mat4 scale(core::f32 s)        const;

    [[nodiscard]] Mat4 operator*(const Mat4 &rhs) const { return multiply(rhs); }
    [[nodiscard]] Vec4 operator*(Vec4 v)          const { return multiply(v); }
    [[nodiscard]] Mat4 operator*(core::f32 s)     const { return scale(s); }

    friend constexpr bool operator==(const Mat4 &, const Mat4 &) = default;
};

[[nodiscard]] inline Mat4 operator*(core::f32 s, const Mat4 &mat) { return mat.scale(s); }

static_assert(core::Blittable<Mat4>);

// ─── Inline implementations ─────────────────────────────────────────────────

constexpr Mat4::Mat4(core::f32 a_, core::f32 b_, core::f32 c_, core::f32 d_,
                     core::f32 e_, core::f32 f_, core::f32 g_, core::f32 h_,
                     core::f32 i_, core::f32 j_, core::f32 k_, core::f32 l_,
                     core::f32 m_, core::f32 n_, core::f32 o_, core::f32 p_)
    : a(a_), b(b_), c(c_), d(d_)
    , e(e_), f(f_), g(g_), h(h_)
    , i(i_), j(j_), k(k_), l(l_)
    , m(m_), n(n_), o(o_), p(p_)
{}

constexpr Mat4 Mat4::zero()
{
    return {0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f};
}

constexpr Mat4 Mat4::identity()
{
    return {1.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 1.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 1.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 1.0f};
}

constexpr Mat4 Mat4::fromValues(core::f32 a_, core::f32 b_, core::f32 c_, core::f32 d_,
                                core::f32 e_, core::f32 f_, core::f32 g_, core::f32 h_,
                                core::f32 i_, core::f32 j_, core::f32 k_, core::f32 l_,
                                core::f32 m_, core::f32 n_, core::f32 o_, core::f32 p_)
{
    return {a_, b_, c_, d_,
            e_, f_, g_, h_,
            i_, j_, k_, l_,
            m_, n_, o_, p_};
}

constexpr Mat4 Mat4::fromArray(const std::array<core::f32, kSize> &input)
{
    return {input[0],  input[1],  input[2],  input[3],
            input[4],  input[5],  input[6],  input[7],
            input[8],  input[9],  input[10], input[11],
            input[12], input[13], input[14], input[15]};
}

constexpr Mat4 Mat4::fromColArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[4], input[8],  input[12],
            input[1], input[5], input[9],  input[13],
            input[2], input[6], input[10], input[14],
            input[3], input[7], input[11], input[15]};
}

constexpr Mat4 Mat4::fromColumns(Vec4 col0, Vec4 col1, Vec4 col2, Vec4 col3)
{
    return {col0.x, col1.x, col2.x, col3.x,
            col0.y, col1.y, col2.y, col3.y,
            col0.z, col1.z, col2.z, col3.z,
            col0.w, col1.w, col2.w, col3.w};
}

constexpr std::array<core::f32, Mat4::kSize> Mat4::toArray() const
{
    return {a, b, c, d,
            e, f, g, h,
            i, j, k, l,
            m, n, o, p};
}

constexpr std::array<core::f32, Mat4::kSize> Mat4::toColArray() const
{
    return {a, e, i, m,
            b, f, j, n,
            c, g, k, o,
            d, h, l, p};
}

constexpr std::array<Vec4, Mat4::kOrder> Mat4::toVectorColumns() const
{
    return {
        Vec4{a, e, i, m},
        Vec4{b, f, j, n},
        Vec4{c, g, k, o},
        Vec4{d, h, l, p}
    };
}

constexpr core::f32 Mat4::operator()(core::u32 rowIdx, core::u32 colIdx) const
{
    MTR_ASSERT(rowIdx < kOrder && colIdx < kOrder);
    return toArray()[rowIdx * kOrder + colIdx];
}

constexpr Mat4 Mat4::transpose() const
{
    return {a, e, i, m,
            b, f, j, n,
            c, g, k, o,
            d, h, l, p};
}

} // namespace mtr::math

#endif // MTR_MATH_MAT4_HPP
