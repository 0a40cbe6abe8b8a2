#pragma once

/**
 * @file options_loader.h
 * @brief Read WorkflowOptions from YAML.
 *
 * @code{.yaml}
 * workflow_id: greeter-1
 * task_queue: greetings
 * id_reuse_policy: AllowDuplicate
 * cron_schedule: "0 * * * *"
 * execution_timeout_ms: 60000
 * retry:
 *   initial_interval_ms: 1000
 *   backoff_coefficient: 2.0
 *   maximum_attempts: 5
 *   do_not_retry: [IllegalArgument]
 * @endcode
 *
 * Every key is optional; an absent key leaves the field unset so the result
 * can be layered with mergeOptions().
 */

#include <string>

#include <yaml-cpp/yaml.h>

#include "wfroute/internal/diagnostics/error/error.h"
#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::config {

/// @throws std::system_error (ConfigurationError) naming the offending key.
::wfroute::internal::options::WorkflowOptions
loadWorkflowOptions(const YAML::Node &node);

/// @throws std::system_error (ConfigurationError) also when the file cannot be read.
::wfroute::internal::options::WorkflowOptions
loadWorkflowOptionsFile(const std::string &path);

/// @brief Non-throwing variant of loadWorkflowOptionsFile().
::wfroute::internal::diagnostics::error::WfrouteResult<
    ::wfroute::internal::options::WorkflowOptions>
tryLoadWorkflowOptionsFile(const std::string &path);

} // namespace wfroute::internal::config
