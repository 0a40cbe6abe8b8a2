#pragma once

/**
 * @file log_config.h
 * @brief ログレベルの数値定義とビルド時フラグ。
 *
 * 閾値そのものはビルドシステムが `WFROUTE_LOG_LEVEL_<CATEGORY>_VALUE` として渡す。
 */

#define WFROUTE_LOG_LEVEL_TRACE_VAL 0
#define WFROUTE_LOG_LEVEL_DEBUG_VAL 1
#define WFROUTE_LOG_LEVEL_INFO_VAL 2
#define WFROUTE_LOG_LEVEL_WARN_VAL 3
#define WFROUTE_LOG_LEVEL_ERROR_VAL 4
#define WFROUTE_LOG_LEVEL_CRITICAL_VAL 5
#define WFROUTE_LOG_LEVEL_OFF_VAL 6

// 未指定の閾値: グローバルは Off、カテゴリはグローバルに従う。
#ifndef WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#define WFROUTE_LOG_LEVEL_GLOBAL_VALUE WFROUTE_LOG_LEVEL_OFF_VAL
#endif
#ifndef WFROUTE_LOG_LEVEL_CORE_VALUE
#define WFROUTE_LOG_LEVEL_CORE_VALUE WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#endif
#ifndef WFROUTE_LOG_LEVEL_RESOLVER_VALUE
#define WFROUTE_LOG_LEVEL_RESOLVER_VALUE WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#endif
#ifndef WFROUTE_LOG_LEVEL_CONTEXT_VALUE
#define WFROUTE_LOG_LEVEL_CONTEXT_VALUE WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#endif
#ifndef WFROUTE_LOG_LEVEL_DISPATCH_VALUE
#define WFROUTE_LOG_LEVEL_DISPATCH_VALUE WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#endif
#ifndef WFROUTE_LOG_LEVEL_CONFIG_VALUE
#define WFROUTE_LOG_LEVEL_CONFIG_VALUE WFROUTE_LOG_LEVEL_GLOBAL_VALUE
#endif
