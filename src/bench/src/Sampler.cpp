// /////////////////////////////////////////////////////////////////////////////
/// @file Sampler.cpp
/// @brief Sampler implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <mtr/bench/Sampler.hpp>

#include <array>

namespace mtr::bench {

namespace {

template <typename M, typename Fn>
M fill(Fn &&next)
{
    std::array<core::f32, M::kSize> values{};
    for (auto &v : values)
        v = next();
    return M::fromArray(values);
}

} // anonymous namespace

Sampler::Sampler(core::u64 seed, core::i32 range)
    : rng_{seed}
    , integer_{-range, range}
    , real_{-static_cast<core::f32>(range), static_cast<core::f32>(range)}
{}

core::f32 Sampler::nextInteger() { return static_cast<core::f32>(integer_(rng_)); }
core::f32 Sampler::nextReal()    { return real_(rng_); }

math::Mat2 Sampler::integerMat2() { return fill<math::Mat2>([this] { return nextInteger(); }); }
math::Mat3 Sampler::integerMat3() { return fill<math::Mat3>([this] { return nextInteger(); }); }
math::Mat4 Sampler::integerMat4() { return fill<math::Mat4>([this] { return nextInteger(); }); }
math::Mat4 Sampler::realMat4()    { return fill<math::Mat4>([this] { return nextReal(); }); }

} // namespace mtr::bench
