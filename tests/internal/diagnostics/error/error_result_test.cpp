#include "wfroute/internal/diagnostics/error/error.h"
#include "wfroute/internal/diagnostics/error/error_macros.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "tests/internal/testing/error_assert.h"

namespace diag = wfroute::internal::diagnostics::error;

TEST(DiagnosticsError, ErrorCodeCategoryBasics) {
    auto& category = diag::wfrouteErrorCategory();
    EXPECT_STREQ("wfroute", category.name());

    std::error_code code = diag::makeErrorCode(diag::WfrouteErrc::AmbiguousRole);
    EXPECT_EQ(diag::WfrouteErrc::AmbiguousRole, static_cast<diag::WfrouteErrc>(code.value()));
    EXPECT_EQ(&category, &code.category());
    EXPECT_FALSE(code.message().empty());
}

static_assert(std::is_error_code_enum_v<diag::WfrouteErrc>);
static_assert(std::is_constructible_v<std::error_code, diag::WfrouteErrc>);

TEST(DiagnosticsError, VoidResultFailureKeepsErrc) {
    const auto result = diag::WfrouteResult<void>::failure(diag::WfrouteErrc::MissingEntryPoint, "no entry");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(diag::WfrouteErrc::MissingEntryPoint, result.error().errc());
    EXPECT_EQ(std::error_code(diag::WfrouteErrc::MissingEntryPoint), result.error().code());
}

TEST(DiagnosticsError, ErrcConvertsImplicitlyToErrorCode) {
    std::error_code code = diag::WfrouteErrc::Reentrancy;
    EXPECT_EQ(code, diag::makeErrorCode(diag::WfrouteErrc::Reentrancy));
    EXPECT_NE(code, diag::makeErrorCode(diag::WfrouteErrc::NoActiveContext));
}

TEST(DiagnosticsError, WfrouteErrorCapturesCodeAndMessage) {
    auto err = diag::makeError(diag::WfrouteErrc::UnsupportedInMode, "Start accepts only the workflow method");
    EXPECT_EQ(diag::WfrouteErrc::UnsupportedInMode, err.errc());
    EXPECT_EQ(&diag::wfrouteErrorCategory(), &err.code().category());
    const auto describe = err.describe();
    EXPECT_NE(std::string::npos, describe.find("Start accepts only the workflow method"));
}

TEST(DiagnosticsError, ThrowErrorHelperThrowsSystemError) {
    try {
        diag::throwError(diag::WfrouteErrc::DuplicateName, "name 'Cancel' already taken");
        FAIL() << "Expected std::system_error to be thrown";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(diag::WfrouteErrc::DuplicateName, static_cast<diag::WfrouteErrc>(ex.code().value()));
        EXPECT_NE(std::string::npos, std::string(ex.what()).find("name 'Cancel' already taken"));
        EXPECT_TRUE(diag::hasErrc(ex, diag::WfrouteErrc::DuplicateName));
        EXPECT_FALSE(diag::hasErrc(ex, diag::WfrouteErrc::InvalidTarget));
    }
}

TEST(DiagnosticsError, HasErrcIgnoresForeignCategories) {
    std::system_error foreign(std::make_error_code(std::errc::invalid_argument));
    EXPECT_FALSE(diag::hasErrc(foreign, diag::WfrouteErrc::InvalidArgument));
}

TEST(DiagnosticsError, ThrowMacrosHonourCondition) {
    EXPECT_NO_THROW(WFROUTE_THROW_IF(false, InvalidState, "never"));
    wfroute::tests::ExpectErrorMessage(diag::WfrouteErrc::InvalidState, {"boom"}, [] {
        WFROUTE_THROW_UNLESS(false, InvalidState, "boom");
    });
    int* missing = nullptr;
    wfroute::tests::ExpectError(diag::WfrouteErrc::InvalidArgument, [missing] {
        WFROUTE_THROW_IF_NULL(missing, "pointer required");
    });
}

TEST(DiagnosticsError, ResultSuccessHoldsValue) {
    auto result = diag::WfrouteResult<int>::success(42);
    EXPECT_TRUE(result.has_value());
    EXPECT_FALSE(result.has_error());
    EXPECT_EQ(42, result.value());
    EXPECT_EQ(42, result.value_or(-1));
}

TEST(DiagnosticsError, ResultErrorHoldsError) {
    auto result = diag::WfrouteResult<int>::failure(diag::WfrouteErrc::ConfigurationError, "bad key");
    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(-1, result.value_or(-1));
    auto err = result.error();
    EXPECT_EQ(diag::WfrouteErrc::ConfigurationError, err.errc());
    EXPECT_NE(std::string::npos, err.describe().find("bad key"));
    EXPECT_THROW(result.value(), std::system_error);
}

TEST(DiagnosticsError, CaptureResultPropagatesValue) {
    auto result = diag::captureResult([] { return 99; });
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(99, result.value());
}

TEST(DiagnosticsError, CaptureResultPropagatesWfrouteError) {
    auto result = diag::captureResult([]() -> int {
        diag::throwError(diag::WfrouteErrc::MissingEntryPoint, "no workflow method");
        return 0;
    });
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(diag::WfrouteErrc::MissingEntryPoint, result.error().errc());
}

TEST(DiagnosticsError, CaptureResultMapsStdExceptionToUnknown) {
    auto result = diag::captureResult([]() -> int {
        throw std::logic_error("logic");
    });
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(diag::WfrouteErrc::Unknown, result.error().errc());
}

TEST(DiagnosticsError, CaptureResultVoidSpecialization) {
    auto result = diag::captureResult([]() { /* noop */ });
    EXPECT_TRUE(result.has_value());
    EXPECT_NO_THROW(result.value());
}

TEST(DiagnosticsError, UnwrapOrThrowRethrowsFailure) {
    EXPECT_EQ(7, diag::unwrapOrThrow(diag::WfrouteResult<int>::success(7)));
    wfroute::tests::ExpectError(diag::WfrouteErrc::InvalidTarget, [] {
        diag::unwrapOrThrow(diag::WfrouteResult<void>::failure(diag::WfrouteErrc::InvalidTarget, "gone"));
    });
}
