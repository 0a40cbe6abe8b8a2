#include "wfroute/user/workflow/invocation_guard.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "tests/internal/testing/error_assert.h"
#include "tests/internal/testing/signal_with_start_batch_mock.h"

namespace workflow = wfroute::user::workflow;
namespace invocation = wfroute::internal::invocation;
namespace diag = wfroute::internal::diagnostics::error;
using Mode = workflow::InvocationGuard::InvocationMode;

TEST(InvocationGuard, EntersAndExitsWithScope) {
  {
    workflow::InvocationGuard guard(Mode::Execute);
    ASSERT_TRUE(invocation::active());
    EXPECT_EQ(invocation::current()->mode(), Mode::Execute);
  }
  EXPECT_FALSE(invocation::active());
}

TEST(InvocationGuard, NestedGuardFailsAndKeepsOuterContext) {
  workflow::InvocationGuard outer(Mode::Start);
  wfroute::tests::ExpectError(diag::WfrouteErrc::Reentrancy,
                              [] { workflow::InvocationGuard inner(Mode::Start); });
  ASSERT_TRUE(invocation::active());
  EXPECT_EQ(invocation::current()->mode(), Mode::Start);
}

TEST(InvocationGuard, ExitsWhenScopeUnwinds) {
  EXPECT_THROW(
      {
        workflow::InvocationGuard guard(Mode::Start);
        throw std::runtime_error("caller failure");
      },
      std::runtime_error);
  EXPECT_FALSE(invocation::active());
}

TEST(InvocationGuard, MoveTransfersOwnership) {
  {
    workflow::InvocationGuard first(Mode::Start);
    workflow::InvocationGuard second(std::move(first));
    EXPECT_TRUE(invocation::active());
  }
  EXPECT_FALSE(invocation::active());
}

TEST(InvocationGuard, MoveAssignmentKeepsSingleOwner) {
  workflow::InvocationGuard target(Mode::Start);
  {
    workflow::InvocationGuard source(std::move(target));
    target = std::move(source);
    EXPECT_TRUE(invocation::active());
  }
  EXPECT_TRUE(invocation::active());
  target = workflow::InvocationGuard(std::move(target));
  EXPECT_TRUE(invocation::active());
}

TEST(InvocationGuard, ResultReadsCurrentContext) {
  workflow::InvocationGuard guard(Mode::Start);
  invocation::current()->setResult(std::string("run-1"));
  EXPECT_EQ(guard.result<std::string>(), "run-1");
}

TEST(InvocationGuard, SignalWithStartTakesBatch) {
  wfroute::tests::SignalWithStartBatchMock batch;
  workflow::InvocationGuard guard(Mode::SignalWithStart, &batch);
  EXPECT_EQ(invocation::current()->batch(), &batch);
}
