#pragma once

/**
 * @file log_types.h
 * @brief ログレベル・カテゴリと、コンパイル時の閾値判定。
 */

#include "wfroute/internal/diagnostics/log/log_config.h"

namespace wfroute::internal::diagnostics::log {

/// @brief 重要度。数値が大きいほど重要で、Off は出力しない。
enum class LogLevel : int {
    Trace = WFROUTE_LOG_LEVEL_TRACE_VAL,
    Debug = WFROUTE_LOG_LEVEL_DEBUG_VAL,
    Info = WFROUTE_LOG_LEVEL_INFO_VAL,
    Warn = WFROUTE_LOG_LEVEL_WARN_VAL,
    Error = WFROUTE_LOG_LEVEL_ERROR_VAL,
    Critical = WFROUTE_LOG_LEVEL_CRITICAL_VAL,
    Off = WFROUTE_LOG_LEVEL_OFF_VAL,
};

/// @brief 出力元のサブシステム。閾値はカテゴリごとに設定できる。
enum class LogCategory : int {
    Core,      ///< 診断基盤そのもの（WFROUTE_ASSERT など）
    Resolver,  ///< ロール解決と記述子キャッシュ
    Context,   ///< 呼び出しコンテキストの enter / exit
    Dispatch,  ///< ルーターと重複起動ポリシー
    Config,    ///< オプションの読み込み
};

/// @brief カテゴリの閾値（ビルド時に `WFROUTE_LOG_LEVEL_<CATEGORY>_VALUE` で指定）。
constexpr int categoryThreshold(LogCategory category) noexcept {
    switch (category) {
        case LogCategory::Core:     return WFROUTE_LOG_LEVEL_CORE_VALUE;
        case LogCategory::Resolver: return WFROUTE_LOG_LEVEL_RESOLVER_VALUE;
        case LogCategory::Context:  return WFROUTE_LOG_LEVEL_CONTEXT_VALUE;
        case LogCategory::Dispatch: return WFROUTE_LOG_LEVEL_DISPATCH_VALUE;
        case LogCategory::Config:   return WFROUTE_LOG_LEVEL_CONFIG_VALUE;
    }
    return WFROUTE_LOG_LEVEL_GLOBAL_VALUE;
}

template <LogCategory Category, LogLevel Level>
constexpr bool isLevelEnabled() noexcept {
    return Level != LogLevel::Off && static_cast<int>(Level) >= categoryThreshold(Category);
}

constexpr const char* levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warn:     return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "?";
}

constexpr const char* categoryToString(LogCategory category) noexcept {
    switch (category) {
        case LogCategory::Core:     return "core";
        case LogCategory::Resolver: return "resolver";
        case LogCategory::Context:  return "context";
        case LogCategory::Dispatch: return "dispatch";
        case LogCategory::Config:   return "config";
    }
    return "?";
}

}  // namespace wfroute::internal::diagnostics::log
