#pragma once

/**
 * @file log_sink.h
 * @brief 出力先（シンク）の差し替えと、マクロから呼ばれる内部関数。
 */

#include <string>
#include <string_view>
#include <utility>

#include "wfroute/internal/diagnostics/log/log_types.h"

namespace wfroute::internal::diagnostics::log {

/// 本文は接頭辞なし。`context` は setLogSink() に渡したポインタ。
using LogSink = void (*)(LogCategory category, LogLevel level,
                         std::string_view message, void* context);

/**
 * @brief シンクを登録する。`nullptr` で stderr 出力に戻る。
 *
 * ディスパッチを行う全スレッドから同時に呼ばれうるため、シンクはスレッドセーフであること。
 */
void setLogSink(LogSink sink, void* context = nullptr);

void resetLogSink();

namespace detail {

void logMessage(LogCategory category, LogLevel level, std::string message);

// 閾値未満のレベルではビルダーを含め呼び出し自体がコンパイルされない。
template <LogCategory Category, LogLevel Level, typename ConditionBuilder,
          typename MessageBuilder>
inline void logLazyIf(ConditionBuilder&& when, MessageBuilder&& build) {
    if constexpr (isLevelEnabled<Category, Level>()) {
        if (!std::forward<ConditionBuilder>(when)()) {
            return;
        }
        logMessage(Category, Level, std::forward<MessageBuilder>(build)());
    }
}

template <LogCategory Category, LogLevel Level, typename MessageBuilder>
inline void logLazy(MessageBuilder&& build) {
    logLazyIf<Category, Level>([] { return true; },
                               std::forward<MessageBuilder>(build));
}

}  // namespace detail

}  // namespace wfroute::internal::diagnostics::log
