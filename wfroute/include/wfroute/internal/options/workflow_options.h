#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wfroute::internal::options {

/**
 * @brief Behaviour of a start request whose workflow id already has an execution.
 */
enum class WorkflowIdReusePolicy {
  AllowDuplicateFailedOnly, ///< Reuse only after a failed run (default).
  AllowDuplicate,           ///< Always start a new run.
  RejectDuplicate,          ///< Never start a second run for the id.
};

inline constexpr WorkflowIdReusePolicy kDefaultIdReusePolicy =
    WorkflowIdReusePolicy::AllowDuplicateFailedOnly;

std::string_view toString(WorkflowIdReusePolicy policy) noexcept;

/// @brief Parse the enumerator name; nullopt for anything else.
std::optional<WorkflowIdReusePolicy>
parseIdReusePolicy(std::string_view text) noexcept;

/**
 * @brief Server-side retry settings attached to a workflow start.
 *
 * Every field is optional so that partial values from different sources can
 * be layered with mergeRetryOptions().
 */
struct RetryOptions {
  std::optional<std::chrono::milliseconds> initial_interval{};
  std::optional<double> backoff_coefficient{};
  std::optional<std::chrono::milliseconds> maximum_interval{};
  std::optional<int> maximum_attempts{};
  std::vector<std::string> do_not_retry{};

  bool operator==(const RetryOptions &) const = default;
};

/**
 * @brief Options used when starting a workflow.
 *
 * Unset fields mean "not specified at this layer"; the handle falls back to
 * its own defaults for whatever is still unset after merging.
 */
struct WorkflowOptions {
  std::optional<std::string> workflow_id{};
  std::optional<std::string> task_queue{};
  std::optional<WorkflowIdReusePolicy> id_reuse_policy{};
  std::optional<RetryOptions> retry_options{};
  std::optional<std::string> cron_schedule{};
  std::optional<std::chrono::milliseconds> execution_timeout{};
  std::optional<std::chrono::milliseconds> run_timeout{};
  std::optional<std::chrono::milliseconds> task_timeout{};

  WorkflowIdReusePolicy effectiveIdReusePolicy() const noexcept {
    return id_reuse_policy.value_or(kDefaultIdReusePolicy);
  }

  bool operator==(const WorkflowOptions &) const = default;
};

/// @brief Field-wise overlay: set fields of `higher` replace those of `lower`.
RetryOptions mergeRetryOptions(const RetryOptions &lower,
                               const RetryOptions &higher);

/**
 * @brief Field-wise overlay of two option layers.
 *
 * Retry options are merged field by field as well, so a caller that only sets
 * `maximum_attempts` keeps the intervals declared on the method.
 */
WorkflowOptions mergeOptions(const WorkflowOptions &lower,
                             const WorkflowOptions &higher);

} // namespace wfroute::internal::options
