#include "wfroute/internal/dispatch/duplicate_start_policy.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <system_error>

#include "tests/internal/testing/error_assert.h"
#include "tests/internal/testing/workflow_handle_mock.h"

namespace policy = wfroute::internal::dispatch::duplicate_start_policy;
namespace diag = wfroute::internal::diagnostics::error;
namespace opts = wfroute::internal::options;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;
using wfroute::tests::StringArgs;

namespace {

opts::WorkflowOptions withPolicy(opts::WorkflowIdReusePolicy reuse) {
  opts::WorkflowOptions options;
  options.id_reuse_policy = reuse;
  return options;
}

const wfroute::internal::handle::Arguments kArgs{std::string("Ann")};

} // namespace

TEST(DuplicateStartPolicy, StartsWhenHandleAccepts) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(StringArgs(std::vector<std::string>{"Ann"})))
      .WillOnce(Return(wfroute::tests::execution("greeter-1", "run-1")));
  EXPECT_EQ(policy::startWorkflow(handle, kArgs), policy::StartOutcome::Started);
}

TEST(DuplicateStartPolicy, SuppressesDuplicateUnderDefaultPolicy) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(wfroute::tests::duplicateWorkflowError()));
  EXPECT_CALL(handle, getOptions()).WillOnce(Return(opts::WorkflowOptions{}));
  EXPECT_EQ(policy::startWorkflow(handle, kArgs),
            policy::StartOutcome::AttachedToExisting);
}

TEST(DuplicateStartPolicy, SuppressesDuplicateWhenHandleHasNoOptions) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(wfroute::tests::duplicateWorkflowError()));
  EXPECT_CALL(handle, getOptions()).WillOnce(Return(std::nullopt));
  EXPECT_EQ(policy::startWorkflow(handle, kArgs),
            policy::StartOutcome::AttachedToExisting);
}

TEST(DuplicateStartPolicy, SuppressesDuplicateUnderRejectDuplicate) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(wfroute::tests::duplicateWorkflowError()));
  EXPECT_CALL(handle, getOptions())
      .WillOnce(Return(withPolicy(opts::WorkflowIdReusePolicy::RejectDuplicate)));
  EXPECT_EQ(policy::startWorkflow(handle, kArgs),
            policy::StartOutcome::AttachedToExisting);
}

TEST(DuplicateStartPolicy, PropagatesDuplicateUnderAllowDuplicate) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(wfroute::tests::duplicateWorkflowError()));
  EXPECT_CALL(handle, getOptions())
      .WillOnce(Return(withPolicy(opts::WorkflowIdReusePolicy::AllowDuplicate)));
  wfroute::tests::ExpectError(diag::WfrouteErrc::DuplicateWorkflow,
                              [&] { policy::startWorkflow(handle, kArgs); });
}

TEST(DuplicateStartPolicy, PropagatesOtherErrorsWithoutConsultingPolicy) {
  StrictMock<wfroute::tests::WorkflowHandleMock> handle;
  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(std::system_error(
          std::make_error_code(std::errc::connection_refused), "frontend down")));
  EXPECT_THROW(policy::startWorkflow(handle, kArgs), std::system_error);

  EXPECT_CALL(handle, start(::testing::_))
      .WillOnce(Throw(std::system_error(
          diag::makeErrorCode(diag::WfrouteErrc::InvalidState), "closed")));
  wfroute::tests::ExpectError(diag::WfrouteErrc::InvalidState,
                              [&] { policy::startWorkflow(handle, kArgs); });
}
