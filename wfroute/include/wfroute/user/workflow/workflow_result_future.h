#pragma once

#include <any>
#include <chrono>
#include <future>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/handle/value.h"

namespace wfroute::user::workflow {

/**
 * @brief Typed view over the untyped future produced in Execute mode.
 *
 * Cancellation and timeouts are whatever the handle's future provides.
 */
template <typename R> class WorkflowResultFuture {
public:
  using Value = ::wfroute::internal::handle::Value;

  WorkflowResultFuture() = default;
  explicit WorkflowResultFuture(std::shared_future<Value> future)
      : future_(std::move(future)) {}

  bool valid() const noexcept { return future_.valid(); }

  void wait() const { future_.wait(); }

  template <typename Rep, typename Period>
  std::future_status waitFor(std::chrono::duration<Rep, Period> timeout) const {
    return future_.wait_for(timeout);
  }

  /// @brief Block for the workflow result; rethrows the handle's failure.
  R get() const {
    WFROUTE_THROW_UNLESS(future_.valid(), InvalidState,
                         "workflow result future has no shared state");
    const Value &value = future_.get();
    if constexpr (std::is_void_v<R>) {
      return;
    } else {
      const auto *typed = std::any_cast<R>(&value);
      WFROUTE_THROW_IF(typed == nullptr, ReturnTypeMismatch,
                       std::string("workflow result is not a ") + typeid(R).name());
      return *typed;
    }
  }

  const std::shared_future<Value> &untyped() const noexcept { return future_; }

private:
  std::shared_future<Value> future_{};
};

} // namespace wfroute::user::workflow
