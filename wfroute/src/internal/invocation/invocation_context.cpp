#include "wfroute/internal/invocation/invocation_context.h"

#include "wfroute/internal/diagnostics/log/log.h"

namespace wfroute::internal::invocation {
namespace {

// One slot per thread; never shared between threads.
std::optional<InvocationContext> &currentStorage() {
  thread_local std::optional<InvocationContext> storage{};
  return storage;
}

} // namespace

const InvocationContext::Value &InvocationContext::result() const {
  WFROUTE_THROW_IF(mode_ == InvocationMode::SignalWithStart, InvalidState,
                   "no result is expected from a signal-with-start batch call");
  WFROUTE_THROW_UNLESS(result_.has_value(), InvalidState,
                       "no call has been dispatched in the current " +
                           std::string(toString(mode_)) + " context");
  return *result_;
}

void enter(InvocationMode mode, SignalWithStartBatch *batch) {
  auto &storage = currentStorage();
  WFROUTE_THROW_IF(storage.has_value(), Reentrancy,
                   "cannot enter " + std::string(toString(mode)) +
                       ": a " + std::string(toString(storage->mode())) +
                       " context is already active on this thread");
  if (mode == InvocationMode::SignalWithStart) {
    WFROUTE_THROW_IF_NULL(batch, "SignalWithStart requires a batch");
  } else {
    WFROUTE_THROW_IF(batch != nullptr, InvalidArgument,
                     "a batch is only accepted in SignalWithStart mode");
  }
  storage.emplace(mode, batch);
  WFROUTE_LOG_TRACE(Context, "enter " + std::string(toString(mode)));
}

void exit() noexcept { currentStorage().reset(); }

bool active() noexcept { return currentStorage().has_value(); }

InvocationContext *current() noexcept {
  auto &storage = currentStorage();
  return storage.has_value() ? &*storage : nullptr;
}

const InvocationContext::Value &currentResult() {
  auto *context = current();
  WFROUTE_THROW_IF(context == nullptr, NoActiveContext,
                   "invocation result requested outside of an invocation context");
  return context->result();
}

} // namespace wfroute::internal::invocation
