/**
 * @file SpanCheck.hpp
 * @brief Length validation shared by the span-based constructors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_MATH_SPAN_CHECK_HPP
    #define MTR_MATH_SPAN_CHECK_HPP

    #include <mtr/core/Expected.hpp>
    #include <mtr/core/Types.hpp>

    #include <span>
    #include <string_view>

namespace mtr::math::detail {

/**
 * @brief Reject a buffer whose size differs from the fixed element count.
 * @param input    Candidate buffer.
 * @param expected Element count of the target type.
 * @param typeName Target type, for the error message.
 * @return Empty on success, ErrorCode::kInvalidLength otherwise.
 */
[[nodiscard]] core::ExpectedVoid checkLength(
    std::span<const core::f32> input,
    core::usize expected,
    std::string_view typeName
);

} // namespace mtr::math::detail

#endif // MTR_MATH_SPAN_CHECK_HPP
