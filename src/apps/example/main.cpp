// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Walkthrough of the Vec2 operations.
// /////////////////////////////////////////////////////////////////////////////

#include <mtr/core/Log.hpp>
#include <mtr/math/Math.hpp>

#include <format>

using namespace mtr;

int main(int /*argc*/, char* /*argv*/[])
{
    const math::Vec2 lhs{2.0f, 2.5f};
    const math::Vec2 rhs{1.0f, 3.0f};

    core::Log::info("example", std::format("lhs = {}, rhs = {}", lhs, rhs));
    core::Log::info("example", std::format("lhs + rhs = {}", lhs + rhs));
    core::Log::info("example", std::format("lhs - rhs = {}", lhs - rhs));
    core::Log::info("example", std::format("2.5 * lhs = {}", 2.5f * lhs));
    core::Log::info("example", std::format("lhs . rhs = {}", lhs.dot(rhs)));
    core::Log::info("example", std::format("lhs x rhs = {}", lhs.cross(rhs)));
    core::Log::info("example", std::format("|lhs| = {}", lhs.length()));
    return 0;
}
