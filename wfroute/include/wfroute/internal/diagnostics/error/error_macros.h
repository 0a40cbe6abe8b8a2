#pragma once

/**
 * @file error_macros.h
 * @brief 条件付き送出マクロ。
 *
 * `code` には WfrouteErrc の列挙子名だけを書く（例: `WFROUTE_THROW(Reentrancy, msg)`）。
 * `msg` は条件が成立したときにだけ評価されるので、文字列連結を直接書いてよい。
 */

#include "wfroute/internal/diagnostics/error/error.h"

#define WFROUTE_ERRC(code) ::wfroute::internal::diagnostics::error::WfrouteErrc::code

#define WFROUTE_THROW(code, msg) \
    ::wfroute::internal::diagnostics::error::throwError(WFROUTE_ERRC(code), std::string(msg))

#define WFROUTE_THROW_IF(cond, code, msg) \
    do {                                  \
        if (cond) {                       \
            WFROUTE_THROW(code, msg);     \
        }                                 \
    } while (false)

#define WFROUTE_THROW_UNLESS(cond, code, msg) WFROUTE_THROW_IF(!(cond), code, msg)

/// ヌルポインタは常に InvalidArgument。
#define WFROUTE_THROW_IF_NULL(ptr, msg) WFROUTE_THROW_IF((ptr) == nullptr, InvalidArgument, msg)
