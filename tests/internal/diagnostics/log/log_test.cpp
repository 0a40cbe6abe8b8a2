#include "wfroute/internal/diagnostics/log/log.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace wfroute::internal::diagnostics;

namespace {

struct SinkCapture {
    std::vector<std::string> messages;
    std::vector<log::LogCategory> categories;
};

void testSink(log::LogCategory category, log::LogLevel, std::string_view message, void* context) {
    auto* capture = static_cast<SinkCapture*>(context);
    capture->messages.emplace_back(message);
    capture->categories.push_back(category);
}

}  // namespace

TEST(DiagnosticsLog, InfoEmitsWhenEnabled) {
    if constexpr (!log::isLevelEnabled<log::LogCategory::Dispatch, log::LogLevel::Info>()) {
        GTEST_SKIP() << "Dispatch info logging is compiled out";
    }
    SinkCapture capture;
    {
        log::ScopedLogSink sink(&testSink, &capture);
        WFROUTE_LOG_INFO(Dispatch, "info message");
    }
    WFROUTE_LOG_INFO(Dispatch, "after reset");

    ASSERT_EQ(capture.messages.size(), 1u);
    EXPECT_EQ(capture.messages[0], "info message");
    EXPECT_EQ(capture.categories[0], log::LogCategory::Dispatch);
}

TEST(DiagnosticsLog, TraceIsCompiledOutWhenDisabled) {
    if constexpr (log::isLevelEnabled<log::LogCategory::Core, log::LogLevel::Trace>()) {
        GTEST_SKIP() << "Core trace logging is enabled in this build";
    }
    SinkCapture capture;
    log::setLogSink(&testSink, &capture);

    int evaluated = 0;
    WFROUTE_LOG_TRACE(Core, (++evaluated, std::string("trace message")));

    log::resetLogSink();

    EXPECT_TRUE(capture.messages.empty());
    EXPECT_EQ(evaluated, 0);
}

TEST(DiagnosticsLog, ConditionalMacroChecksCondition) {
    if constexpr (!log::isLevelEnabled<log::LogCategory::Config, log::LogLevel::Warn>()) {
        GTEST_SKIP() << "Config warn logging is compiled out";
    }
    SinkCapture capture;
    {
        log::ScopedLogSink sink(&testSink, &capture);
        WFROUTE_LOG_WARN_IF(Config, false, "suppressed");
        WFROUTE_LOG_WARN_IF(Config, true, "emitted");
    }

    ASSERT_EQ(capture.messages.size(), 1u);
    EXPECT_EQ(capture.messages[0], "emitted");
}

TEST(DiagnosticsLog, NamesAreStable) {
    EXPECT_EQ(std::string_view(log::levelToString(log::LogLevel::Warn)), "WARN");
    EXPECT_EQ(std::string_view(log::categoryToString(log::LogCategory::Resolver)), "resolver");
}

#if GTEST_HAS_DEATH_TEST
TEST(DiagnosticsLog, AssertTriggersFatal) {
    auto trigger = [] { WFROUTE_ASSERT(false, "assert failure"); };
    EXPECT_DEATH(trigger(), "assert failure");
}
#endif
