#pragma once

/**
 * @file invocation_context.h
 * @brief Thread-local invocation mode consulted by the router.
 *
 * At most one context is active per thread. A context is opened with enter(),
 * receives the outcome of the next dispatched call, and is closed with
 * exit(). Prefer the scoped InvocationGuard over calling enter/exit directly.
 */

#include <any>
#include <optional>
#include <string>
#include <typeinfo>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/invocation/invocation_mode.h"
#include "wfroute/internal/invocation/signal_with_start_batch.h"

namespace wfroute::internal::invocation {

class InvocationContext {
public:
  using Value = ::wfroute::internal::handle::Value;

  explicit InvocationContext(InvocationMode mode,
                             SignalWithStartBatch *batch = nullptr) noexcept
      : mode_(mode), batch_(batch) {}

  InvocationMode mode() const noexcept { return mode_; }

  /// @brief Non-null only in SignalWithStart mode.
  SignalWithStartBatch *batch() const noexcept { return batch_; }

  void setResult(Value value) { result_ = std::move(value); }
  bool hasResult() const noexcept { return result_.has_value(); }
  void clearResult() noexcept { result_.reset(); }

  /**
   * @throws std::system_error InvalidState when no call was dispatched yet
   *         or the mode produces no result (SignalWithStart).
   */
  const Value &result() const;

private:
  InvocationMode mode_;
  SignalWithStartBatch *batch_;
  std::optional<Value> result_{};
};

/**
 * @brief Activate a context on the calling thread.
 *
 * `batch` is required for SignalWithStart and rejected otherwise.
 * @throws std::system_error Reentrancy when a context is already active,
 *         InvalidArgument on a batch/mode mismatch.
 */
void enter(InvocationMode mode, SignalWithStartBatch *batch = nullptr);

/// @brief Clear the thread's context. No-op when none is active.
void exit() noexcept;

bool active() noexcept;

/// @brief The thread's active context, or nullptr.
InvocationContext *current() noexcept;

/// @throws std::system_error NoActiveContext when no context is active.
const InvocationContext::Value &currentResult();

/**
 * @brief Typed access to the current result.
 * @throws std::system_error InvalidState when the stored value is not a `T`.
 */
template <typename T> T currentResult() {
  const auto &value = currentResult();
  const auto *typed = std::any_cast<T>(&value);
  WFROUTE_THROW_IF(typed == nullptr, InvalidState,
                   std::string("invocation result is not of the requested type ") +
                       typeid(T).name());
  return *typed;
}

} // namespace wfroute::internal::invocation
