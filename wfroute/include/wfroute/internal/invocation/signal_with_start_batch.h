#pragma once

#include <string_view>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_handle.h"

namespace wfroute::internal::invocation {

/**
 * @brief Collector of the start and signal halves of a signal-with-start.
 *
 * The router only records into the batch; sending the combined request is up
 * to the batch owner.
 */
class SignalWithStartBatch {
public:
  virtual ~SignalWithStartBatch() = default;

  virtual void start(::wfroute::internal::handle::WorkflowHandle &handle,
                     const ::wfroute::internal::handle::Arguments &args) = 0;

  virtual void signal(::wfroute::internal::handle::WorkflowHandle &handle,
                      std::string_view name,
                      const ::wfroute::internal::handle::Arguments &args) = 0;
};

} // namespace wfroute::internal::invocation
