// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Matriarch benchmark entry-point.
///
/// Cross-checks the grouped determinant and the naive product against their
/// reference counterparts, then times all four kernels.
// /////////////////////////////////////////////////////////////////////////////

#include <mtr/bench/Config.hpp>
#include <mtr/bench/Harness.hpp>
#include <mtr/core/Error.hpp>
#include <mtr/core/Log.hpp>

#include <format>

using namespace mtr;

int main(int /*argc*/, char* /*argv*/[])
{
    auto config = bench::Config::Builder{}
        .iterations(bench::kDefaultIterations)
        .samples(bench::kDefaultSamples)
        .seed(bench::kDefaultSeed)
        .build();
    if (!config)
    {
        core::Log::fatal(config.error().message());
        return 1;
    }

    core::Log::setMinLevel(config->logLevel());
    core::Log::info("=== Matriarch Benchmark ===");

    const bench::Harness harness{*config};
    const auto results = harness.run();
    if (!results)
    {
        core::Log::error("bench", std::format("{}: {}",
            core::errorCodeName(results.error().code()), results.error().message()));
        return 1;
    }

    core::Log::info(std::format("Done, {} kernels timed.", results->size()));
    return 0;
}
