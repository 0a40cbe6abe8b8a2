#pragma once

/**
 * @file log.h
 * @brief ログ機能の入口。通常はこのヘッダーだけをインクルードする。
 *
 * 閾値はカテゴリごとにコンパイル時に決まり、閾値未満のログはメッセージの
 * 組み立てごと消える。出力先は実行時に setLogSink() で差し替えられる。
 */

#include "wfroute/internal/diagnostics/log/log_macros.h"
#include "wfroute/internal/diagnostics/log/log_sink.h"
#include "wfroute/internal/diagnostics/log/log_types.h"

namespace wfroute::internal::diagnostics::log {

/**
 * @brief スコープの間だけシンクを差し替え、終了時に既定シンクへ戻す。
 *
 * 入れ子にはできない（外側のシンクは復元されない）。主にテスト用。
 */
class ScopedLogSink {
public:
    ScopedLogSink(LogSink sink, void* context) { setLogSink(sink, context); }
    ~ScopedLogSink() { resetLogSink(); }

    ScopedLogSink(const ScopedLogSink&) = delete;
    ScopedLogSink& operator=(const ScopedLogSink&) = delete;
};

}  // namespace wfroute::internal::diagnostics::log
