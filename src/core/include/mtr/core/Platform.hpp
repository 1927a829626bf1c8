/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-prediction hints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_CORE_PLATFORM_HPP
    #define MTR_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define MTR_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define MTR_COMPILER_GCC   1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(MTR_COMPILER_GCC) || defined(MTR_COMPILER_CLANG)
        #define MTR_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define MTR_UNLIKELY(x) (x)
    #endif

#endif // MTR_CORE_PLATFORM_HPP
