/**
 * @file Assert.cpp
 * @brief Contract failure reporting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/core/Assert.hpp"
#include "mtr/core/Log.hpp"

#include <cstdlib>
#include <format>

namespace mtr::core::detail {

void assertFail(const char *expr, std::source_location loc)
{
    Log::fatal("assert", std::format(
        "{}:{} in {} \"{}\" failed",
        loc.file_name(), loc.line(), loc.function_name(), expr
    ));
    std::abort();
}

} // namespace mtr::core::detail
