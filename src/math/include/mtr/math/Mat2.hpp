/**
 * @file Mat2.hpp
 * @brief 2x2 single-precision matrix with row-major named elements.
 *
 * A Mat2 is laid out as follows:
 *
 * @code
 *     [ a  b ]
 * A = [ c  d ]
 * @endcode
 *
 * The letter-to-position assignment is part of the public contract: the
 * array conversions depend on it element for element.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_MAT2_HPP
    #define MTR_MATH_MAT2_HPP

    #include "Vec2.hpp"

namespace mtr::math {

struct Mat2 final {
    static constexpr core::u32 kOrder = 2;
    static constexpr core::u32 kSize  = kOrder * kOrder;

    core::f32 a{};
    core::f32 b{};
    core::f32 c{};
    core::f32 d{};

    constexpr Mat2() = default;
    constexpr Mat2(core::f32 a, core::f32 b,
                   core::f32 c, core::f32 d);

    static constexpr Mat2 zero();
    static constexpr Mat2 identity();
    static constexpr Mat2 fromValues(core::f32 a, core::f32 b,
                                     core::f32 c, core::f32 d);

    /// @brief Read a row-major array: input[0] -> a, input[1] -> b, ...
    static constexpr Mat2 fromArray(const std::array<core::f32, kSize> &input);

    /// @brief Read a column-major array (transpose on read).
    static constexpr Mat2 fromColArray(const std::array<core::f32, kSize> &input);

    /// @brief Inverse of toVectorColumns().
    static constexpr Mat2 fromColumns(Vec2 col0, Vec2 col1);

    /// @brief Row-major read of a loosely-sized buffer (kInvalidLength unless 4 elements).
    [[nodiscard]] static core::Expected<Mat2> fromSpan(std::span<const core::f32> input);

    /// @brief Column-major read of a loosely-sized buffer (kInvalidLength unless 4 elements).
    [[nodiscard]] static core::Expected<Mat2> fromColSpan(std::span<const core::f32> input);

    [[nodiscard]] constexpr std::array<core::f32, kSize>  toArray()         const;
    [[nodiscard]] constexpr std::array<core::f32, kSize>  toColArray()      const;
    [[nodiscard]] constexpr std::array<Vec2, kOrder>      toVectorColumns() const;

    /// @brief Element at (row, col); both must be below kOrder.
    [[nodiscard]] constexpr core::f32 operator()(core::u32 rowIdx, core::u32 colIdx) const;
    [[nodiscard]] Vec2 row(core::u32 r) const;

    [[nodiscard]] constexpr Mat2 transpose() const;

    /// @brief a * d - b * c.
    [[nodiscard]] core::f32 determinant() const;

    /**
     * @brief Row-by-column product this * rhs.
     *
     * Matrix multiplication is not commutative: A * B != B * A for most
     * matrices.
     */
    [[nodiscard]] Mat2 multiply(const Mat2 &rhs) const;

    /// @brief Treats @p v as a column vector.
    [[nodiscard]] Vec2 multiply(Vec2 v)          const;
    [[nodiscard]] Mat2 scale(core::f32 s)        const;

    [[nodiscard]] Mat2 operator*(const Mat2 &rhs) const { return multiply(rhs); }
    [[nodiscard]] Vec2 operator*(Vec2 v)          const { return multiply(v); }
    [[nodiscard]] Mat2 operator*(core::f32 s)     const { return scale(s); }

    friend constexpr bool operator==(const Mat2 &, const Mat2 &) = default;
};

[[nodiscard]] inline Mat2 operator*(core::f32 s, const Mat2 &m) { return m.scale(s); }

static_assert(core::Blittable<Mat2>);

// ─── Inline implementations ─────────────────────────────────────────────────

constexpr Mat2::Mat2(core::f32 a_, core::f32 b_,
                     core::f32 c_, core::f32 d_)
    : a(a_), b(b_)
    , c(c_), d(d_)
{}

constexpr Mat2 Mat2::zero()
{
    return {0.0f, 0.0f,
            0.0f, 0.0f};
}

constexpr Mat2 Mat2::identity()
{
    return {1.0f, 0.0f,
            0.0f, 1.0f};
}

constexpr Mat2 Mat2::fromValues(core::f32 a_, core::f32 b_,
                                core::f32 c_, core::f32 d_)
{
    return {a_, b_,
            c_, d_};
}

constexpr Mat2 Mat2::fromArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[1],
            input[2], input[3]};
}

constexpr Mat2 Mat2::fromColArray(const std::array<core::f32, kSize> &input)
{
    return {input[0], input[2],
            input[1], input[3]};
}

constexpr Mat2 Mat2::fromColumns(Vec2 col0, Vec2 col1)
{
    return {col0.x, col1.x,
            col0.y, col1.y};
}

constexpr std::array<core::f32, Mat2::kSize> Mat2::toArray() const
{
    return {a, b, c, d};
}

constexpr std::array<core::f32, Mat2::kSize> Mat2::toColArray() const
{
    return {a, c, b, d};
}

constexpr std::array<Vec2, Mat2::kOrder> Mat2::toVectorColumns() const
{
    return {
        Vec2{a, c},
        Vec2{b, d}
    };
}

constexpr core::f32 Mat2::operator()(core::u32 rowIdx, core::u32 colIdx) const
{
    MTR_ASSERT(rowIdx < kOrder && colIdx < kOrder);
    return toArray()[rowIdx * kOrder + colIdx];
}

constexpr Mat2 Mat2::transpose() const
{
    return {a, c,
            b, d};
}

} // namespace mtr::math

#endif // MTR_MATH_MAT2_HPP
