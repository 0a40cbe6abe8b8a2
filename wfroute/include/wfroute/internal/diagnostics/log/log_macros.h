#pragma once

/**
 * @file log_macros.h
 * @brief ログ出力用マクロとアサーションマクロ。
 *
 * `category` には `LogCategory` のメンバ名（Core, Resolver, Context, Dispatch, Config）を、
 * `expr` には std::string に変換可能な式を渡す。式は閾値を満たす場合にのみ評価される。
 */

#include <string>

#include "wfroute/internal/diagnostics/log/log_sink.h"
#include "wfroute/internal/diagnostics/error/error_macros.h"

#define WFROUTE_LOG_INTERNAL(category, level, expr)                               \
    ::wfroute::internal::diagnostics::log::detail::logLazy<                       \
        ::wfroute::internal::diagnostics::log::LogCategory::category,             \
        ::wfroute::internal::diagnostics::log::LogLevel::level>(                  \
        [&]() -> std::string { return std::string(expr); })

#define WFROUTE_LOG_TRACE(category, expr) WFROUTE_LOG_INTERNAL(category, Trace, expr)
#define WFROUTE_LOG_DEBUG(category, expr) WFROUTE_LOG_INTERNAL(category, Debug, expr)
#define WFROUTE_LOG_INFO(category, expr) WFROUTE_LOG_INTERNAL(category, Info, expr)
#define WFROUTE_LOG_WARN(category, expr) WFROUTE_LOG_INTERNAL(category, Warn, expr)
#define WFROUTE_LOG_ERROR(category, expr) WFROUTE_LOG_INTERNAL(category, Error, expr)
#define WFROUTE_LOG_CRITICAL(category, expr) WFROUTE_LOG_INTERNAL(category, Critical, expr)

// ============================================================================
// 条件付きログマクロ（条件式も閾値を満たす場合にのみ評価される）
// ============================================================================

#define WFROUTE_LOG_INTERNAL_IF(category, level, condition, expr)                 \
    ::wfroute::internal::diagnostics::log::detail::logLazyIf<                     \
        ::wfroute::internal::diagnostics::log::LogCategory::category,             \
        ::wfroute::internal::diagnostics::log::LogLevel::level>(                  \
        [&]() -> bool { return (condition); },                                    \
        [&]() -> std::string { return std::string(expr); })

#define WFROUTE_LOG_DEBUG_IF(category, condition, expr) \
    WFROUTE_LOG_INTERNAL_IF(category, Debug, condition, expr)
#define WFROUTE_LOG_INFO_IF(category, condition, expr) \
    WFROUTE_LOG_INTERNAL_IF(category, Info, condition, expr)
#define WFROUTE_LOG_WARN_IF(category, condition, expr) \
    WFROUTE_LOG_INTERNAL_IF(category, Warn, condition, expr)

// ============================================================================
// アサーションマクロ
// ============================================================================

/**
 * @def WFROUTE_ASSERT(expr, message)
 * @brief 内部不変条件の検査。
 *
 * 偽の場合は Core カテゴリに CRITICAL を出力し、InvalidState で fatalError を呼ぶ。
 * 呼び出し側の誤用は例外（WFROUTE_THROW*）で報告し、このマクロは使わない。
 */
#define WFROUTE_ASSERT(expr, message)                                             \
    do {                                                                          \
        if (!(expr)) {                                                            \
            const std::string _wfroute_assert_message = std::string(message);     \
            WFROUTE_LOG_CRITICAL(Core, _wfroute_assert_message);                  \
            ::wfroute::internal::diagnostics::error::fatalError(                  \
                ::wfroute::internal::diagnostics::error::makeError(               \
                    ::wfroute::internal::diagnostics::error::WfrouteErrc::InvalidState, \
                    _wfroute_assert_message));                                    \
        }                                                                         \
    } while (0)
