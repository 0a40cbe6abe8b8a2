#pragma once

/**
 * @file invocation_guard.h
 * @brief RAII guard that holds an invocation mode for its lifetime.
 */

#include "wfroute/internal/invocation/invocation_context.h"

namespace wfroute::user::workflow {

/**
 * @brief Enters an invocation context on construction and exits it on destruction.
 *
 * The context is thread-local; a guard must be destroyed on the thread that
 * created it.
 *
 * @par Usage
 * @code
 * InvocationGuard guard(InvocationMode::Start);
 * stub.call(&Greeter::greet, "Ann");
 * auto execution = guard.result<WorkflowExecution>();
 * @endcode
 *
 * @throws std::system_error (Reentrancy) from the constructor when a context
 *         is already active; the existing context is left untouched.
 */
class InvocationGuard {
public:
  using InvocationMode = ::wfroute::internal::invocation::InvocationMode;
  using Batch = ::wfroute::internal::invocation::SignalWithStartBatch;

  explicit InvocationGuard(InvocationMode mode, Batch *batch = nullptr);

  InvocationGuard(const InvocationGuard &) = delete;
  InvocationGuard &operator=(const InvocationGuard &) = delete;

  InvocationGuard(InvocationGuard &&other) noexcept;
  InvocationGuard &operator=(InvocationGuard &&other) noexcept;

  ~InvocationGuard();

  /// @brief Result of the call dispatched inside this guard.
  template <typename T> T result() const {
    return ::wfroute::internal::invocation::currentResult<T>();
  }

private:
  void release() noexcept;

  bool active_{false};
};

} // namespace wfroute::user::workflow
