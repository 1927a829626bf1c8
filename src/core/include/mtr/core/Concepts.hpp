/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the value types of the library.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_CORE_CONCEPTS_HPP
    #define MTR_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace mtr::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe for raw memory operations (memcpy, uniform upload).
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

/**
 * @brief A square matrix exposing its order and a row-major element read.
 *
 * Satisfied by Mat2, Mat3 and Mat4.  Used by the brute-force reference
 * kernels, which are written once for every order.
 */
template <typename M>
concept SquareMatrix = Blittable<M> && requires(const M &m, u32 r, u32 c) {
    { M::kOrder } -> std::convertible_to<u32>;
    { m(r, c) }   -> std::convertible_to<f32>;
};

} // namespace mtr::core

#endif // MTR_CORE_CONCEPTS_HPP
