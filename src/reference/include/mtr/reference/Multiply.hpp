/**
 * @file Multiply.hpp
 * @brief Alternative Mat4 product accumulated with fused multiply-add.
 *
 * Measured slower than the plain row-by-column product of Mat4::multiply()
 * and therefore kept out of the math module.  Results may differ from
 * Mat4::multiply() in the last bit because each fma rounds once.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_REFERENCE_MULTIPLY_HPP
    #define MTR_REFERENCE_MULTIPLY_HPP

    #include <mtr/math/Mat4.hpp>

namespace mtr::reference {

/**
 * @brief lhs * rhs with every element computed as
 *        fma(a0, b0, fma(a1, b1, fma(a2, b2, a3 * b3))).
 */
[[nodiscard]] math::Mat4 fusedMultiply(const math::Mat4 &lhs, const math::Mat4 &rhs);

} // namespace mtr::reference

#endif // MTR_REFERENCE_MULTIPLY_HPP
