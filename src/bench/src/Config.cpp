// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <mtr/bench/Config.hpp>

#include <format>

namespace mtr::bench {

Config::Builder& Config::Builder::iterations(core::u64 n) noexcept
{
    iterations_ = n;
    return *this;
}

Config::Builder& Config::Builder::samples(core::u32 n) noexcept
{
    samples_ = n;
    return *this;
}

Config::Builder& Config::Builder::seed(core::u64 value) noexcept
{
    seed_ = value;
    return *this;
}

Config::Builder& Config::Builder::sampleRange(core::i32 range) noexcept
{
    sampleRange_ = range;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (iterations_ == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "iterations must be positive");

    if (samples_ == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "samples must be positive");

    if (sampleRange_ < 1 || sampleRange_ > kMaxExactSampleRange)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("sampleRange must lie in [1, {}], got {}", kMaxExactSampleRange, sampleRange_));
    }

    Config cfg;
    cfg.iterations_  = iterations_;
    cfg.samples_     = samples_;
    cfg.seed_        = seed_;
    cfg.sampleRange_ = sampleRange_;
    cfg.logLevel_    = logLevel_;
    return cfg;
}

} // namespace mtr::bench
