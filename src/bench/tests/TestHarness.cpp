// /////////////////////////////////////////////////////////////////////////////
/// @file TestHarness.cpp
/// @brief Unit tests for bench::Sampler and bench::Harness.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>
#include <mtr/bench/Harness.hpp>
#include <mtr/bench/Sampler.hpp>

#include <cmath>

namespace mtr::bench {


namespace {

bench::Config smallConfig()
{
    auto config = bench::Config::Builder{}
        .iterations(1'000)
        .samples(64)
        .logLevel(core::LogLevel::kWarn)
        .build();
    REQUIRE(config.has_value());
    return *config;
}

} // namespace

TEST_CASE("Sampler is deterministic for a given seed", "[bench][sampler]")
{
    bench::Sampler first{42, 8};
    bench::Sampler second{42, 8};

    for (int s = 0; s < 16; ++s)
        REQUIRE(first.integerMat4() == second.integerMat4());
}

TEST_CASE("Sampler integer samples stay in range", "[bench][sampler]")
{
    bench::Sampler sampler{3, 2};

    for (int s = 0; s < 64; ++s)
    {
        for (const core::f32 v : sampler.integerMat3().toArray())
        {
            REQUIRE(v == std::trunc(v));
            REQUIRE(v >= -2.0f);
            REQUIRE(v <= 2.0f);
        }
    }
}

TEST_CASE("Harness verifies every determinant sample", "[bench][harness]")
{
    const bench::Harness harness{smallConfig()};

    const auto checked = harness.verifyDeterminant();
    REQUIRE(checked.has_value());
    CHECK(*checked == 3 * 64);
}

TEST_CASE("Harness verifies every multiply sample", "[bench][harness]")
{
    const bench::Harness harness{smallConfig()};

    const auto checked = harness.verifyMultiply();
    REQUIRE(checked.has_value());
    CHECK(*checked == 64);
}

TEST_CASE("Harness::measure runs the configured iteration count", "[bench][harness]")
{
    const bench::Harness harness{smallConfig()};

    core::u64 calls = 0;
    const auto result = harness.measure("counter", [&calls](core::u64) {
        ++calls;
        return 1.0f;
    });

    CHECK(calls == 1'000);
    CHECK(result.label == "counter");
    CHECK(result.iterations == 1'000);
    CHECK(result.totalMs >= 0.0);
}

TEST_CASE("Harness::run times all kernels", "[bench][harness]")
{
    const bench::Harness harness{smallConfig()};

    const auto results = harness.run();
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 4);
    CHECK((*results)[0].label == "Mat4::determinant (grouped)");
    CHECK((*results)[3].label == "fusedMultiply");
}

TEST_CASE("Measurement reports time per operation", "[bench][harness]")
{
    const bench::Measurement m{"x", 2'000, 1.0};
    CHECK(m.nsPerOp() == 500.0);
    CHECK(bench::Measurement{}.nsPerOp() == 0.0);
}

} // namespace mtr::bench
