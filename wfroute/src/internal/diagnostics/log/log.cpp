#include "wfroute/internal/diagnostics/log/log.h"

#include <atomic>
#include <cstdio>
#include <string>
#include <string_view>

namespace wfroute::internal::diagnostics::log {

namespace {

// 登録中のシンク。context を先に書き、fn の公開で両方を見せる。
struct SinkSlot {
    std::atomic<void*> context{nullptr};
    std::atomic<LogSink> fn{nullptr};
};

SinkSlot& sinkSlot() {
    static SinkSlot slot;
    return slot;
}

void writeStderr(LogCategory category, LogLevel level, std::string_view body) {
    std::string line;
    line.reserve(body.size() + 32);
    line.append("[WFROUTE][")
        .append(categoryToString(category))
        .append("][")
        .append(levelToString(level))
        .append("] ")
        .append(body)
        .push_back('\n');
    std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace

void setLogSink(LogSink sink, void* context) {
    auto& slot = sinkSlot();
    slot.context.store(context, std::memory_order_release);
    slot.fn.store(sink, std::memory_order_release);
}

void resetLogSink() { setLogSink(nullptr); }

namespace detail {

void logMessage(LogCategory category, LogLevel level, std::string message) {
    const auto& slot = sinkSlot();
    const LogSink sink = slot.fn.load(std::memory_order_acquire);
    if (sink == nullptr) {
        writeStderr(category, level, message);
        return;
    }
    sink(category, level, message, slot.context.load(std::memory_order_acquire));
}

}  // namespace detail

}  // namespace wfroute::internal::diagnostics::log
