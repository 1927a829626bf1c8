/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides MTR_ASSERT (debug-only) and MTR_UNREACHABLE (marks provably
 * dead code paths).  The macros report the
 * failing expression together with the file, line, and function through
 * the Log façade before aborting.  In release builds MTR_ASSERT is a no-op.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_CORE_ASSERT_HPP
    #define MTR_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <source_location>

namespace mtr::core::detail {

/**
 * @brief Log a failed contract at fatal level and abort the process.
 * @param expr Stringified failing expression.
 * @param loc  Location of the check.
 */
[[noreturn]] void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
);

} // namespace mtr::core::detail

    #ifdef MTR_DEBUG
        #define MTR_ASSERT(cond)                                          \
            do {                                                           \
                if (MTR_UNLIKELY(!(cond)))                                 \
                    ::mtr::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define MTR_ASSERT(cond) ((void)0)
    #endif

    #define MTR_UNREACHABLE() ::mtr::core::detail::assertFail("UNREACHABLE")

#endif // MTR_CORE_ASSERT_HPP
