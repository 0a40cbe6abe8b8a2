#include "wfroute/internal/config/options_loader.h"

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <unordered_set>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/diagnostics/log/log.h"

namespace wfroute::internal::config {
namespace {

namespace opts = ::wfroute::internal::options;

[[noreturn]] void fail(std::string_view context, const std::string &message) {
  WFROUTE_THROW(ConfigurationError, std::string(context) + ": " + message);
}

void expectKeys(const YAML::Node &node, std::string_view context,
                std::initializer_list<std::string_view> allowed) {
  std::unordered_set<std::string_view> allowed_set(allowed.begin(),
                                                   allowed.end());
  for (const auto &kv : node) {
    if (!kv.first.IsScalar()) {
      fail(context, "non-scalar key");
    }
    const auto key = kv.first.as<std::string>();
    if (allowed_set.count(key) == 0) {
      fail(context, "unknown key '" + key + "'");
    }
  }
}

YAML::Node scalarOrNull(const YAML::Node &node, const std::string &key,
                              std::string_view context) {
  const auto value = node[key];
  if (value && !value.IsScalar()) {
    fail(context, "key '" + key + "' must be a scalar");
  }
  return value;
}

template <typename T>
std::optional<T> readOptional(const YAML::Node &node, const std::string &key,
                              std::string_view context) {
  const auto value = scalarOrNull(node, key, context);
  if (!value) {
    return std::nullopt;
  }
  try {
    return value.as<T>();
  } catch (const YAML::BadConversion &) {
    fail(context, "key '" + key + "' has an invalid value '" +
                      value.Scalar() + "'");
  }
}

std::optional<std::chrono::milliseconds>
readDuration(const YAML::Node &node, const std::string &key,
             std::string_view context) {
  const auto millis = readOptional<long long>(node, key, context);
  if (!millis.has_value()) {
    return std::nullopt;
  }
  if (*millis < 0) {
    fail(context, "key '" + key + "' must not be negative");
  }
  return std::chrono::milliseconds(*millis);
}

opts::RetryOptions readRetry(const YAML::Node &node) {
  constexpr std::string_view kContext = "retry";
  if (!node.IsMap()) {
    fail(kContext, "must be a map");
  }
  expectKeys(node, kContext,
             {"initial_interval_ms", "backoff_coefficient",
              "maximum_interval_ms", "maximum_attempts", "do_not_retry"});
  opts::RetryOptions retry;
  retry.initial_interval = readDuration(node, "initial_interval_ms", kContext);
  retry.backoff_coefficient =
      readOptional<double>(node, "backoff_coefficient", kContext);
  retry.maximum_interval = readDuration(node, "maximum_interval_ms", kContext);
  retry.maximum_attempts = readOptional<int>(node, "maximum_attempts", kContext);
  if (const auto list = node["do_not_retry"]) {
    if (!list.IsSequence()) {
      fail(kContext, "key 'do_not_retry' must be a sequence");
    }
    for (const auto &item : list) {
      if (!item.IsScalar()) {
        fail(kContext, "entries of 'do_not_retry' must be scalars");
      }
      retry.do_not_retry.push_back(item.as<std::string>());
    }
  }
  return retry;
}

} // namespace

opts::WorkflowOptions loadWorkflowOptions(const YAML::Node &node) {
  constexpr std::string_view kContext = "workflow options";
  opts::WorkflowOptions options;
  if (!node || node.IsNull()) {
    return options;
  }
  if (!node.IsMap()) {
    fail(kContext, "must be a map");
  }
  expectKeys(node, kContext,
             {"workflow_id", "task_queue", "id_reuse_policy", "cron_schedule",
              "execution_timeout_ms", "run_timeout_ms", "task_timeout_ms",
              "retry"});

  options.workflow_id = readOptional<std::string>(node, "workflow_id", kContext);
  options.task_queue = readOptional<std::string>(node, "task_queue", kContext);
  options.cron_schedule =
      readOptional<std::string>(node, "cron_schedule", kContext);
  if (const auto policy =
          readOptional<std::string>(node, "id_reuse_policy", kContext)) {
    options.id_reuse_policy = opts::parseIdReusePolicy(*policy);
    if (!options.id_reuse_policy.has_value()) {
      fail(kContext, "unknown id_reuse_policy '" + *policy + "'");
    }
  }
  options.execution_timeout =
      readDuration(node, "execution_timeout_ms", kContext);
  options.run_timeout = readDuration(node, "run_timeout_ms", kContext);
  options.task_timeout = readDuration(node, "task_timeout_ms", kContext);
  if (const auto retry = node["retry"]) {
    options.retry_options = readRetry(retry);
  }
  return options;
}

opts::WorkflowOptions loadWorkflowOptionsFile(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    fail(path, ex.what());
  }
  auto options = loadWorkflowOptions(root);
  WFROUTE_LOG_DEBUG(Config, "loaded workflow options from " + path);
  return options;
}

::wfroute::internal::diagnostics::error::WfrouteResult<opts::WorkflowOptions>
tryLoadWorkflowOptionsFile(const std::string &path) {
  return ::wfroute::internal::diagnostics::error::captureResult(
      [&path] { return loadWorkflowOptionsFile(path); });
}

} // namespace wfroute::internal::config
