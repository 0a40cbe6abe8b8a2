#include "wfroute/internal/options/workflow_options.h"

#include <gtest/gtest.h>

#include <chrono>

namespace opts = wfroute::internal::options;
using namespace std::chrono_literals;

TEST(WorkflowOptions, DefaultIdReusePolicyIsAllowDuplicateFailedOnly) {
  opts::WorkflowOptions options;
  EXPECT_EQ(options.effectiveIdReusePolicy(),
            opts::WorkflowIdReusePolicy::AllowDuplicateFailedOnly);
  options.id_reuse_policy = opts::WorkflowIdReusePolicy::RejectDuplicate;
  EXPECT_EQ(options.effectiveIdReusePolicy(),
            opts::WorkflowIdReusePolicy::RejectDuplicate);
}

TEST(WorkflowOptions, IdReusePolicyParsesItsOwnNames) {
  for (auto policy : {opts::WorkflowIdReusePolicy::AllowDuplicateFailedOnly,
                      opts::WorkflowIdReusePolicy::AllowDuplicate,
                      opts::WorkflowIdReusePolicy::RejectDuplicate}) {
    EXPECT_EQ(opts::parseIdReusePolicy(opts::toString(policy)), policy);
  }
  EXPECT_FALSE(opts::parseIdReusePolicy("allow_duplicate").has_value());
  EXPECT_FALSE(opts::parseIdReusePolicy("").has_value());
}

TEST(WorkflowOptions, MergeKeepsLowerFieldsUnsetAbove) {
  opts::WorkflowOptions lower;
  lower.task_queue = "greetings";
  lower.cron_schedule = "@daily";
  lower.run_timeout = 5000ms;

  opts::WorkflowOptions higher;
  higher.workflow_id = "greeter-1";
  higher.cron_schedule = "@hourly";

  const auto merged = opts::mergeOptions(lower, higher);
  EXPECT_EQ(merged.workflow_id, "greeter-1");
  EXPECT_EQ(merged.task_queue, "greetings");
  EXPECT_EQ(merged.cron_schedule, "@hourly");
  EXPECT_EQ(merged.run_timeout, 5000ms);
  EXPECT_FALSE(merged.id_reuse_policy.has_value());
}

TEST(WorkflowOptions, RetryOptionsMergeFieldByField) {
  opts::RetryOptions method_retry;
  method_retry.initial_interval = 1000ms;
  method_retry.maximum_attempts = 3;
  method_retry.do_not_retry = {"IllegalArgument"};

  opts::RetryOptions caller_retry;
  caller_retry.maximum_attempts = 10;

  opts::WorkflowOptions lower;
  lower.retry_options = method_retry;
  opts::WorkflowOptions higher;
  higher.retry_options = caller_retry;

  const auto merged = opts::mergeOptions(lower, higher);
  ASSERT_TRUE(merged.retry_options.has_value());
  EXPECT_EQ(merged.retry_options->initial_interval, 1000ms);
  EXPECT_EQ(merged.retry_options->maximum_attempts, 10);
  EXPECT_EQ(merged.retry_options->do_not_retry,
            std::vector<std::string>{"IllegalArgument"});
}

TEST(WorkflowOptions, RetryOptionsOnlyOnOneSideAreTakenAsIs) {
  opts::RetryOptions retry;
  retry.backoff_coefficient = 2.0;

  opts::WorkflowOptions with_retry;
  with_retry.retry_options = retry;

  EXPECT_EQ(opts::mergeOptions(with_retry, {}).retry_options, retry);
  EXPECT_EQ(opts::mergeOptions({}, with_retry).retry_options, retry);
  EXPECT_FALSE(opts::mergeOptions({}, {}).retry_options.has_value());
}
