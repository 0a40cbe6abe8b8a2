#include "wfroute/internal/options/workflow_options.h"

#include <utility>

namespace wfroute::internal::options {
namespace {

template <typename T>
void overlay(std::optional<T> &target, const std::optional<T> &source) {
  if (source.has_value()) {
    target = source;
  }
}

} // namespace

std::string_view toString(WorkflowIdReusePolicy policy) noexcept {
  switch (policy) {
  case WorkflowIdReusePolicy::AllowDuplicateFailedOnly:
    return "AllowDuplicateFailedOnly";
  case WorkflowIdReusePolicy::AllowDuplicate:
    return "AllowDuplicate";
  case WorkflowIdReusePolicy::RejectDuplicate:
    return "RejectDuplicate";
  }
  return "Unknown";
}

std::optional<WorkflowIdReusePolicy>
parseIdReusePolicy(std::string_view text) noexcept {
  for (auto policy : {WorkflowIdReusePolicy::AllowDuplicateFailedOnly,
                      WorkflowIdReusePolicy::AllowDuplicate,
                      WorkflowIdReusePolicy::RejectDuplicate}) {
    if (toString(policy) == text) {
      return policy;
    }
  }
  return std::nullopt;
}

RetryOptions mergeRetryOptions(const RetryOptions &lower,
                               const RetryOptions &higher) {
  RetryOptions merged = lower;
  overlay(merged.initial_interval, higher.initial_interval);
  overlay(merged.backoff_coefficient, higher.backoff_coefficient);
  overlay(merged.maximum_interval, higher.maximum_interval);
  overlay(merged.maximum_attempts, higher.maximum_attempts);
  if (!higher.do_not_retry.empty()) {
    merged.do_not_retry = higher.do_not_retry;
  }
  return merged;
}

WorkflowOptions mergeOptions(const WorkflowOptions &lower,
                             const WorkflowOptions &higher) {
  WorkflowOptions merged = lower;
  overlay(merged.workflow_id, higher.workflow_id);
  overlay(merged.task_queue, higher.task_queue);
  overlay(merged.id_reuse_policy, higher.id_reuse_policy);
  overlay(merged.cron_schedule, higher.cron_schedule);
  overlay(merged.execution_timeout, higher.execution_timeout);
  overlay(merged.run_timeout, higher.run_timeout);
  overlay(merged.task_timeout, higher.task_timeout);
  if (higher.retry_options.has_value()) {
    merged.retry_options =
        lower.retry_options.has_value()
            ? mergeRetryOptions(*lower.retry_options, *higher.retry_options)
            : *higher.retry_options;
  }
  return merged;
}

} // namespace wfroute::internal::options
