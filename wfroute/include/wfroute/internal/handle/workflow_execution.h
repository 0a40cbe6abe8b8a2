#pragma once

#include <string>

namespace wfroute::internal::handle {

/**
 * @brief Identity of one workflow run.
 */
struct WorkflowExecution {
  std::string workflow_id{};
  std::string run_id{};

  bool operator==(const WorkflowExecution &) const = default;
};

} // namespace wfroute::internal::handle
