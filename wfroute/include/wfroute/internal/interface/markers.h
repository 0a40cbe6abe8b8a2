#pragma once

/**
 * @file markers.h
 * @brief Declarative metadata attached to interface methods.
 *
 * An empty `name` means "derive the name from the method identifier".
 */

#include <string>
#include <variant>

#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::interface {

struct WorkflowMethod {
  std::string name{};
};

struct SignalMethod {
  std::string name{};
};

struct QueryMethod {
  std::string name{};
};

/// @brief Retry settings declared on the workflow method.
struct MethodRetry {
  ::wfroute::internal::options::RetryOptions retry{};
};

/// @brief Cron expression declared on the workflow method.
struct CronSchedule {
  std::string expression{};
};

using RoleMarker = std::variant<WorkflowMethod, SignalMethod, QueryMethod>;

} // namespace wfroute::internal::interface
