/**
 * @file Multiply.cpp
 * @brief fma-accumulated Mat4 product.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/reference/Multiply.hpp"

#include <array>
#include <cmath>

namespace mtr::reference {

math::Mat4 fusedMultiply(const math::Mat4 &lhs, const math::Mat4 &rhs)
{
    constexpr core::u32 kN = math::Mat4::kOrder;

    std::array<core::f32, math::Mat4::kSize> out{};
    for (core::u32 r = 0; r < kN; ++r)
    {
        for (core::u32 c = 0; c < kN; ++c)
        {
            out[r * kN + c] = std::fma(lhs(r, 0), rhs(0, c),
                              std::fma(lhs(r, 1), rhs(1, c),
                              std::fma(lhs(r, 2), rhs(2, c),
                                       lhs(r, 3) * rhs(3, c))));
        }
    }
    return math::Mat4::fromArray(out);
}

} // namespace mtr::reference
