/**
 * @file Error.cpp
 * @brief Error code names.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#include "mtr/core/Error.hpp"
#include "mtr/core/Assert.hpp"

namespace mtr::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:            return "None";
    case ErrorCode::kInvalidLength:   return "InvalidLength";
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kInternalError:   return "InternalError";
    }
    MTR_UNREACHABLE();
}

} // namespace mtr::core
