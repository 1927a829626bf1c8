/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * MTR_TRY macro for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_CORE_EXPECTED_HPP
    #define MTR_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace mtr::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace mtr::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type mtr::core::Expected<U>.
 */
#define MTR_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_mtr_result = (expr);                                       \
        if (!_mtr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_mtr_result.error()));         \
        std::move(_mtr_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type mtr::core::ExpectedVoid.
 */
#define MTR_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_mtr_result = (expr);                                       \
        if (!_mtr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_mtr_result.error()));         \
    } while (false)

#endif // MTR_CORE_EXPECTED_HPP
