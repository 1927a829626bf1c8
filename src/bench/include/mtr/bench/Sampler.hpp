// /////////////////////////////////////////////////////////////////////////////
/// @file Sampler.hpp
/// @brief Seeded random matrix generator.
///
/// Integer-valued samples keep every product and partial sum of the
/// determinant and multiplication kernels exactly representable in f32, so
/// two algebraically equivalent kernels must agree bit for bit on them.
/// Real-valued samples exercise rounding.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mtr/math/Mat2.hpp>
#include <mtr/math/Mat3.hpp>
#include <mtr/math/Mat4.hpp>

#include <random>

namespace mtr::bench {

class Sampler
{
public:
    /// @param seed  Generator seed; equal seeds give equal sequences.
    /// @param range Integer samples are drawn from [-range, range].
    Sampler(core::u64 seed, core::i32 range);

    [[nodiscard]] math::Mat2 integerMat2();
    [[nodiscard]] math::Mat3 integerMat3();
    [[nodiscard]] math::Mat4 integerMat4();

    /// @brief Mat4 with elements uniform in [-range, range).
    [[nodiscard]] math::Mat4 realMat4();

private:
    [[nodiscard]] core::f32 nextInteger();
    [[nodiscard]] core::f32 nextReal();

    std::mt19937_64                          rng_;
    std::uniform_int_distribution<core::i32> integer_;
    std::uniform_real_distribution<core::f32> real_;
};

} // namespace mtr::bench
