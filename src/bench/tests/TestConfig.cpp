// /////////////////////////////////////////////////////////////////////////////
/// @file TestConfig.cpp
/// @brief Unit tests for bench::Config::Builder.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>
#include <mtr/bench/Config.hpp>

namespace mtr::bench {


TEST_CASE("Config defaults", "[bench][config]")
{
    const auto config = bench::Config::Builder{}.build();
    REQUIRE(config.has_value());
    CHECK(config->iterations() == 1'000'000);
    CHECK(config->samples() == 1'000);
    CHECK(config->seed() == 42);
    CHECK(config->sampleRange() == 8);
    CHECK(config->logLevel() == core::LogLevel::kInfo);
}

TEST_CASE("Config builder overrides", "[bench][config]")
{
    const auto config = bench::Config::Builder{}
        .iterations(10)
        .samples(5)
        .seed(7)
        .sampleRange(bench::kMaxExactSampleRange)
        .logLevel(core::LogLevel::kDebug)
        .build();

    REQUIRE(config.has_value());
    CHECK(config->iterations() == 10);
    CHECK(config->samples() == 5);
    CHECK(config->seed() == 7);
    CHECK(config->sampleRange() == bench::kMaxExactSampleRange);
    CHECK(config->logLevel() == core::LogLevel::kDebug);
}

TEST_CASE("Config rejects invalid parameters", "[bench][config]")
{
    CHECK_FALSE(bench::Config::Builder{}.iterations(0).build().has_value());
    CHECK_FALSE(bench::Config::Builder{}.samples(0).build().has_value());
    CHECK_FALSE(bench::Config::Builder{}.sampleRange(0).build().has_value());

    const auto tooWide = bench::Config::Builder{}.sampleRange(bench::kMaxExactSampleRange + 1).build();
    REQUIRE_FALSE(tooWide.has_value());
    CHECK(tooWide.error().code() == core::ErrorCode::kInvalidArgument);
    CHECK(tooWide.error().message() == "sampleRange must lie in [1, 28], got 29");
}

} // namespace mtr::bench
