// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Benchmark configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tuneable parameter of the benchmark harness.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mtr/core/Expected.hpp>
#include <mtr/core/Log.hpp>
#include <mtr/core/Types.hpp>

namespace mtr::bench {

inline constexpr core::u64 kDefaultIterations  = 1'000'000;
inline constexpr core::u32 kDefaultSamples     = 1'000;
inline constexpr core::u64 kDefaultSeed        = 42;
inline constexpr core::i32 kDefaultSampleRange = 8;

/// Largest integer sample magnitude for which every 4x4 permutation term and
/// partial sum stays below 2^24, i.e. exact in f32.
inline constexpr core::i32 kMaxExactSampleRange = 28;

/// @brief Immutable benchmark configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& iterations(core::u64 n) noexcept;
        Builder& samples(core::u32 n) noexcept;
        Builder& seed(core::u64 value) noexcept;
        Builder& sampleRange(core::i32 range) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        /// @brief kInvalidArgument on a zero count or a range outside
        ///        [1, kMaxExactSampleRange].
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::u64      iterations_{kDefaultIterations};
        core::u32      samples_{kDefaultSamples};
        core::u64      seed_{kDefaultSeed};
        core::i32      sampleRange_{kDefaultSampleRange};
        core::LogLevel logLevel_{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u64      iterations()  const noexcept { return iterations_; }
    [[nodiscard]] core::u32      samples()     const noexcept { return samples_; }
    [[nodiscard]] core::u64      seed()        const noexcept { return seed_; }
    [[nodiscard]] core::i32      sampleRange() const noexcept { return sampleRange_; }
    [[nodiscard]] core::LogLevel logLevel()    const noexcept { return logLevel_; }

private:
    friend class Builder;

    core::u64      iterations_{kDefaultIterations};
    core::u32      samples_{kDefaultSamples};
    core::u64      seed_{kDefaultSeed};
    core::i32      sampleRange_{kDefaultSampleRange};
    core::LogLevel logLevel_{core::LogLevel::kInfo};
};

} // namespace mtr::bench
