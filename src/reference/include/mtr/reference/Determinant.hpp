/**
 * @file Determinant.hpp
 * @brief Brute-force Leibniz determinant for any square matrix type.
 *
 * Sums sign(sigma) * prod_r M(r, sigma(r)) over all N! permutations, visited
 * in lexicographic order.  For a Mat4 this is the flat 24-term expansion
 * (72 multiplications) that Mat4::determinant() regroups.  It serves as the
 * oracle the optimised kernels are checked against and as the benchmark
 * baseline; it is not meant for production use.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_REFERENCE_DETERMINANT_HPP
    #define MTR_REFERENCE_DETERMINANT_HPP

    #include <mtr/core/Concepts.hpp>
    #include <mtr/core/Types.hpp>

    #include <algorithm>
    #include <array>
    #include <numeric>

namespace mtr::reference {

/**
 * @brief Parity of a permutation: +1 when even, -1 when odd.
 */
template <core::usize N>
[[nodiscard]] constexpr core::i32 permutationSign(const std::array<core::u32, N> &perm)
{
    core::u32 inversions = 0;
    for (core::usize lo = 0; lo < N; ++lo)
        for (core::usize hi = lo + 1; hi < N; ++hi)
            if (perm[lo] > perm[hi])
                ++inversions;
    return (inversions % 2 == 0) ? 1 : -1;
}

/**
 * @brief Determinant by full permutation expansion.
 * @tparam M Mat2, Mat3 or Mat4.
 */
template <core::SquareMatrix M>
[[nodiscard]] core::f32 permutationDeterminant(const M &mat)
{
    constexpr core::usize kN = M::kOrder;

    std::array<core::u32, kN> perm{};
    std::iota(perm.begin(), perm.end(), 0u);

    core::f32 sum = 0.0f;
    do
    {
        core::f32 term = static_cast<core::f32>(permutationSign(perm));
        for (core::u32 r = 0; r < kN; ++r)
            term = term * mat(r, perm[r]);
        sum = sum + term;
    } while (std::next_permutation(perm.begin(), perm.end()));

    return sum;
}

} // namespace mtr::reference

#endif // MTR_REFERENCE_DETERMINANT_HPP
