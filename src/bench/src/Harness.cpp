// /////////////////////////////////////////////////////////////////////////////
/// @file Harness.cpp
/// @brief Harness implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <mtr/bench/Harness.hpp>
#include <mtr/bench/Sampler.hpp>
#include <mtr/core/Log.hpp>
#include <mtr/math/Format.hpp>
#include <mtr/reference/Determinant.hpp>
#include <mtr/reference/Multiply.hpp>

#include <format>

namespace mtr::bench {

namespace detail {

namespace {
volatile core::f32 gSink = 0.0f;
} // anonymous namespace

void consume(core::f32 value) noexcept
{
    gSink = value;
}

} // namespace detail

namespace {

template <typename M>
core::ExpectedVoid checkDeterminant(const M& mat)
{
    const core::f32 grouped = mat.determinant();
    const core::f32 flat    = reference::permutationDeterminant(mat);

    if (grouped != flat)
    {
        return core::makeError(core::ErrorCode::kInternalError,
            std::format("determinant mismatch on {}: grouped {} != permutation {}", mat, grouped, flat));
    }
    return {};
}

} // anonymous namespace

Harness::Harness(Config config)
    : config_{config}
{}

core::Expected<core::usize> Harness::verifyDeterminant() const
{
    Sampler sampler{config_.seed(), config_.sampleRange()};
    core::usize checked = 0;

    for (core::u32 s = 0; s < config_.samples(); ++s)
    {
        MTR_TRY_VOID(checkDeterminant(sampler.integerMat2()));
        MTR_TRY_VOID(checkDeterminant(sampler.integerMat3()));
        MTR_TRY_VOID(checkDeterminant(sampler.integerMat4()));
        checked += 3;
    }

    core::Log::debug("bench", std::format("determinant verified on {} matrices", checked));
    return checked;
}

core::Expected<core::usize> Harness::verifyMultiply() const
{
    Sampler sampler{config_.seed(), config_.sampleRange()};
    core::usize checked = 0;

    for (core::u32 s = 0; s < config_.samples(); ++s)
    {
        const math::Mat4 lhs = sampler.integerMat4();
        const math::Mat4 rhs = sampler.integerMat4();

        const math::Mat4 naive = lhs * rhs;
        const math::Mat4 fused = reference::fusedMultiply(lhs, rhs);
        if (naive != fused)
        {
            return core::makeError(core::ErrorCode::kInternalError,
                std::format("multiply mismatch: naive {} != fused {}", naive, fused));
        }
        ++checked;
    }

    core::Log::debug("bench", std::format("multiply verified on {} pairs", checked));
    return checked;
}

core::Expected<std::vector<Measurement>> Harness::run() const
{
    const core::usize determinants = MTR_TRY(verifyDeterminant());
    const core::usize products     = MTR_TRY(verifyMultiply());
    core::Log::info("bench", std::format("kernels agree on {} determinants and {} products",
                                         determinants, products));

    Sampler sampler{config_.seed(), config_.sampleRange()};
    std::vector<math::Mat4> pool;
    pool.reserve(config_.samples());
    for (core::u32 s = 0; s < config_.samples(); ++s)
        pool.push_back(sampler.realMat4());

    const core::usize n = pool.size();
    auto at = [&pool, n](core::u64 i) -> const math::Mat4& { return pool[i % n]; };

    std::vector<Measurement> results;
    results.push_back(measure("Mat4::determinant (grouped)",
        [&](core::u64 i) { return at(i).determinant(); }));
    results.push_back(measure("permutationDeterminant<Mat4>",
        [&](core::u64 i) { return reference::permutationDeterminant(at(i)); }));
    results.push_back(measure("Mat4::multiply (naive)",
        [&](core::u64 i) { return at(i).multiply(at(i + 1)).a; }));
    results.push_back(measure("fusedMultiply",
        [&](core::u64 i) { return reference::fusedMultiply(at(i), at(i + 1)).a; }));

    for (const auto& r : results)
    {
        core::Log::info("bench", std::format("{:<32} {:>10.3f} ms {:>8.2f} ns/op",
                                             r.label, r.totalMs, r.nsPerOp()));
    }
    return results;
}

} // namespace mtr::bench
