// /////////////////////////////////////////////////////////////////////////////
/// @file Harness.hpp
/// @brief Kernel timing and cross-checking harness.
///
/// Verifies the grouped kernels against the reference ones on exact integer
/// samples, then times each kernel over a pool of real-valued samples.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mtr/bench/Config.hpp>
#include <mtr/core/Expected.hpp>
#include <mtr/core/Types.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace mtr::bench {

/// @brief Wall-clock result of one timed kernel.
struct Measurement
{
    std::string label;
    core::u64   iterations{0};
    core::f64   totalMs{0.0};

    [[nodiscard]] core::f64 nsPerOp() const noexcept
    {
        return iterations == 0 ? 0.0 : (totalMs * 1.0e6) / static_cast<core::f64>(iterations);
    }
};

namespace detail {

/// @brief Out-of-line sink keeping benchmarked results observable.
void consume(core::f32 value) noexcept;

} // namespace detail

class Harness
{
public:
    explicit Harness(Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// @brief Times fn(i) for i in [0, iterations).
    /// @param fn Callable returning an f32 fed to detail::consume().
    template <typename Fn>
    [[nodiscard]] Measurement measure(std::string label, Fn&& fn) const
    {
        const core::u64 iterations = config_.iterations();
        core::f32 acc = 0.0f;

        const auto start = std::chrono::steady_clock::now();
        for (core::u64 i = 0; i < iterations; ++i)
            acc = acc + fn(i);
        const auto end = std::chrono::steady_clock::now();

        detail::consume(acc);
        return Measurement{std::move(label), iterations,
                           std::chrono::duration<core::f64, std::milli>(end - start).count()};
    }

    /// @brief Compares Mat2/Mat3/Mat4::determinant() with the permutation
    ///        expansion on config().samples() integer matrices of each order.
    /// @return Number of matrices checked, kInternalError on the first
    ///         mismatch.
    [[nodiscard]] core::Expected<core::usize> verifyDeterminant() const;

    /// @brief Compares Mat4::multiply() with fusedMultiply() on integer pairs.
    [[nodiscard]] core::Expected<core::usize> verifyMultiply() const;

    /// @brief Verifies, then times every kernel and logs one line per result.
    [[nodiscard]] core::Expected<std::vector<Measurement>> run() const;

private:
    Config config_;
};

} // namespace mtr::bench
