#include "wfroute/user/workflow/signal_with_start_batch_request.h"

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/diagnostics/log/log.h"

namespace wfroute::user::workflow {

void SignalWithStartBatchRequest::bindHandle(Handle &handle) {
  if (handle_ == nullptr) {
    handle_ = &handle;
    return;
  }
  WFROUTE_THROW_IF(handle_ != &handle, InvalidState,
                   "signal-with-start batch used with different workflow stubs");
}

void SignalWithStartBatchRequest::start(Handle &handle, const Arguments &args) {
  bindHandle(handle);
  WFROUTE_THROW_IF(start_args_.has_value(), InvalidState,
                   "duplicate workflow method call in signal-with-start batch");
  start_args_ = args;
}

void SignalWithStartBatchRequest::signal(Handle &handle, std::string_view name,
                                         const Arguments &args) {
  bindHandle(handle);
  WFROUTE_THROW_IF(signal_name_.has_value(), InvalidState,
                   "duplicate signal call in signal-with-start batch: " +
                       std::string(name));
  signal_name_ = std::string(name);
  signal_args_ = args;
}

SignalWithStartBatchRequest::WorkflowExecution
SignalWithStartBatchRequest::invoke() {
  WFROUTE_THROW_UNLESS(handle_ != nullptr && start_args_.has_value() &&
                           signal_name_.has_value(),
                       InvalidState,
                       "signal-with-start batch needs both a workflow method "
                       "call and a signal call");
  WFROUTE_LOG_DEBUG(Dispatch, "signalWithStart '" + *signal_name_ + "'");
  return handle_->signalWithStart(*signal_name_, signal_args_, *start_args_);
}

} // namespace wfroute::user::workflow
