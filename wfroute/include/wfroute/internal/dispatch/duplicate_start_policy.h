#pragma once

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_handle.h"

namespace wfroute::internal::dispatch::duplicate_start_policy {

enum class StartOutcome {
  Started,            ///< The handle accepted the start request.
  AttachedToExisting, ///< Duplicate suppressed; the existing run is used.
};

/**
 * @brief Start the workflow ahead of a blocking or asynchronous result read.
 *
 * Always calls `handle.start(args)`. A DuplicateWorkflow error from the handle
 * is suppressed unless the handle's effective id reuse policy is
 * AllowDuplicate, in which case it propagates. Any other error propagates.
 *
 * Used by the Sync and Execute protocols only; Start mode calls
 * `handle.start` directly and never suppresses.
 */
StartOutcome startWorkflow(::wfroute::internal::handle::WorkflowHandle &handle,
                           const ::wfroute::internal::handle::Arguments &args);

} // namespace wfroute::internal::dispatch::duplicate_start_policy
