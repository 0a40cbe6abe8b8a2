#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_execution.h"
#include "wfroute/internal/handle/workflow_handle.h"
#include "wfroute/internal/invocation/signal_with_start_batch.h"
#include "wfroute/user/workflow/invocation_guard.h"

namespace wfroute::user::workflow {

/**
 * @brief Batch that turns one workflow-method call and one signal-method call
 * into a single signalWithStart request.
 *
 * @code
 * SignalWithStartBatchRequest batch;
 * batch.add([&] { stub.call(&Greeter::greet, "Ann"); });
 * batch.add([&] { stub.call(&Greeter::cancel); });
 * auto execution = batch.invoke();
 * @endcode
 *
 * Both calls must target the same stub. A second start or second signal, a
 * call through another handle, or invoke() with a half missing fails with
 * InvalidState.
 */
class SignalWithStartBatchRequest final
    : public ::wfroute::internal::invocation::SignalWithStartBatch {
public:
  using Handle = ::wfroute::internal::handle::WorkflowHandle;
  using Arguments = ::wfroute::internal::handle::Arguments;
  using WorkflowExecution = ::wfroute::internal::handle::WorkflowExecution;

  void start(Handle &handle, const Arguments &args) override;
  void signal(Handle &handle, std::string_view name,
              const Arguments &args) override;

  /// @brief Run `fn` with this batch as the thread's SignalWithStart context.
  template <typename Fn> void add(Fn &&fn) {
    InvocationGuard guard(InvocationGuard::InvocationMode::SignalWithStart,
                          this);
    std::forward<Fn>(fn)();
  }

  /// @brief Send the combined request through the recorded handle.
  WorkflowExecution invoke();

private:
  void bindHandle(Handle &handle);

  Handle *handle_{nullptr};
  std::optional<Arguments> start_args_{};
  std::optional<std::string> signal_name_{};
  Arguments signal_args_{};
};

} // namespace wfroute::user::workflow
