/**
 * @file SpanCheck.cpp
 * @brief Length validation shared by the span-based constructors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "SpanCheck.hpp"

#include <mtr/core/Log.hpp>

#include <format>

namespace mtr::math::detail {

core::ExpectedVoid checkLength(
    std::span<const core::f32> input,
    core::usize expected,
    std::string_view typeName
) {
    if (input.size() == expected)
        return {};

    auto message = std::format(
        "{} expects {} elements, got {}", typeName, expected, input.size());
    core::Log::debug("math", message);
    return core::makeError(core::ErrorCode::kInvalidLength, std::move(message));
}

} // namespace mtr::math::detail
