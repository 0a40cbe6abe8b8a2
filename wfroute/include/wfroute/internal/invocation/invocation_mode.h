#pragma once

#include <string_view>

namespace wfroute::internal::invocation {

/**
 * @brief Meaning given to the next typed call on the current thread.
 */
enum class InvocationMode {
  Sync,            ///< Perform the call and return its value (default).
  Start,           ///< Start the workflow; the result is its WorkflowExecution.
  Execute,         ///< Start the workflow; the result is a future of its value.
  SignalWithStart, ///< Record the call into a signal-with-start batch.
};

constexpr std::string_view toString(InvocationMode mode) noexcept {
  switch (mode) {
  case InvocationMode::Sync:
    return "Sync";
  case InvocationMode::Start:
    return "Start";
  case InvocationMode::Execute:
    return "Execute";
  case InvocationMode::SignalWithStart:
    return "SignalWithStart";
  }
  return "Unknown";
}

} // namespace wfroute::internal::invocation
