#pragma once

/**
 * @file async_invocation.h
 * @brief Entry points that give a typed call a non-Sync meaning.
 *
 * Each helper holds an InvocationGuard for exactly one call, so the return
 * value of the typed call, meaningless outside Sync mode, is never exposed.
 */

#include <utility>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_execution.h"
#include "wfroute/user/workflow/invocation_guard.h"
#include "wfroute/user/workflow/workflow_result_future.h"
#include "wfroute/user/workflow/workflow_stub.h"

namespace wfroute::user::workflow {

/**
 * @brief Start the workflow method without waiting for its result.
 *
 * Always issues a fresh start; a duplicate reported by the handle propagates.
 */
template <typename I, typename Member, typename... Args>
::wfroute::internal::handle::WorkflowExecution
start(WorkflowStub<I> &stub, Member member, Args &&...args) {
  InvocationGuard guard(InvocationGuard::InvocationMode::Start);
  stub.dispatch(member, std::forward<Args>(args)...);
  return guard.result<::wfroute::internal::handle::WorkflowExecution>();
}

/**
 * @brief Start the workflow method (attaching to a running execution unless
 * the reuse policy is AllowDuplicate) and return a future of its result.
 */
template <typename I, typename Member, typename... Args>
WorkflowResultFuture<typename detail::MemberFunctionTraits<Member>::Result>
execute(WorkflowStub<I> &stub, Member member, Args &&...args) {
  using R = typename detail::MemberFunctionTraits<Member>::Result;
  InvocationGuard guard(InvocationGuard::InvocationMode::Execute);
  stub.dispatch(member, std::forward<Args>(args)...);
  return WorkflowResultFuture<R>(
      guard.result<std::shared_future<::wfroute::internal::handle::Value>>());
}

} // namespace wfroute::user::workflow
