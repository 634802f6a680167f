// ============================================================================
// File: shared/common/result_helper.hpp
// Description: early-return macros for functions returning Result<void>
// ============================================================================

#pragma once
#include "result.h"
#include <fmt/core.h>

// Forwards a failed Result of any value type unchanged.
//   auto r = runner_.run(argv);
//   RETURN_IF_ERR(r);
#define RETURN_IF_ERR(res)                                     \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<void>::from(res);                    \
        }                                                      \
    } while (0)

// Same, with `msg` prefixed to the error text:
//   "database start command could not run: fork: Resource temporarily unavailable"
#define RETURN_IF_ERR_MSG(res, msg)                            \
    do {                                                       \
        if (!(res)) {                                          \
            auto err_str = (res).error().has_value()           \
                ? fmt::format("{}: {}", msg, *(res).error())   \
                : std::string(msg);                            \
            return Result<void>::Error((res).code(), err_str); \
        }                                                      \
    } while (0)
