#pragma once

/**
 * @file workflow_handle.h
 * @brief Contract of the untyped workflow handle the router dispatches to.
 *
 * The handle owns everything network-facing: encoding, RPC, retries and
 * interceptors. Implementations report a start that collides with an existing
 * execution by throwing std::system_error carrying WfrouteErrc::DuplicateWorkflow.
 */

#include <future>
#include <optional>
#include <string>
#include <string_view>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_execution.h"
#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::handle {

class WorkflowHandle {
public:
  using Options = ::wfroute::internal::options::WorkflowOptions;

  virtual ~WorkflowHandle() = default;

  /// @brief Request a new execution. Does not wait for it to finish.
  virtual WorkflowExecution start(const Arguments &args) = 0;

  virtual void signal(std::string_view name, const Arguments &args) = 0;

  virtual Value query(std::string_view name, const ReturnType &return_type,
                      const Arguments &args) = 0;

  /// @brief Block until the execution completes and return its result.
  virtual Value getResult(const ReturnType &return_type) = 0;

  virtual std::shared_future<Value>
  getResultAsync(const ReturnType &return_type) = 0;

  /**
   * @brief Start the execution (if needed) and deliver a signal in one request.
   */
  virtual WorkflowExecution signalWithStart(std::string_view signal_name,
                                            const Arguments &signal_args,
                                            const Arguments &start_args) = 0;

  virtual std::optional<Options> getOptions() const = 0;

  /// @brief nullopt until the execution has been started or attached.
  virtual std::optional<WorkflowExecution> getExecution() const = 0;

  virtual std::optional<std::string> workflowType() const = 0;
};

} // namespace wfroute::internal::handle
