#include "wfroute/internal/dispatch/duplicate_start_policy.h"

#include <string>
#include <system_error>

#include "wfroute/internal/diagnostics/error/error.h"
#include "wfroute/internal/diagnostics/log/log.h"

namespace wfroute::internal::dispatch::duplicate_start_policy {
namespace {

namespace diag = ::wfroute::internal::diagnostics::error;
namespace opts = ::wfroute::internal::options;

bool allowsDuplicate(const ::wfroute::internal::handle::WorkflowHandle &handle) {
  const auto options = handle.getOptions();
  return options.has_value() && options->effectiveIdReusePolicy() ==
                                    opts::WorkflowIdReusePolicy::AllowDuplicate;
}

} // namespace

StartOutcome startWorkflow(::wfroute::internal::handle::WorkflowHandle &handle,
                           const ::wfroute::internal::handle::Arguments &args) {
  try {
    handle.start(args);
    return StartOutcome::Started;
  } catch (const std::system_error &ex) {
    if (!diag::hasErrc(ex, diag::WfrouteErrc::DuplicateWorkflow) ||
        allowsDuplicate(handle)) {
      throw;
    }
    // Not AllowDuplicate: a repeated start attaches to the running execution.
    WFROUTE_LOG_INFO(Dispatch, std::string("duplicate start suppressed: ") + ex.what());
    return StartOutcome::AttachedToExisting;
  }
}

} // namespace wfroute::internal::dispatch::duplicate_start_policy
