#include "wfroute/internal/dispatch/router.h"

#include <utility>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/diagnostics/log/log.h"
#include "wfroute/internal/dispatch/duplicate_start_policy.h"
#include "wfroute/internal/invocation/invocation_context.h"

namespace wfroute::internal::dispatch {
namespace {

namespace iface = ::wfroute::internal::interface;
namespace inv = ::wfroute::internal::invocation;
using Handle = Router::Handle;
using Value = Router::Value;

// ---------------------------------------------------------------------------
// Sync
// ---------------------------------------------------------------------------

void runSync(Handle &handle, const DispatchRecord &record,
             inv::InvocationContext &context) {
  switch (record.resolved.role) {
  case iface::MethodRole::EntryPoint:
    duplicate_start_policy::startWorkflow(handle, record.args);
    context.setResult(handle.getResult(record.return_type));
    return;
  case iface::MethodRole::Signal:
    WFROUTE_THROW_UNLESS(record.return_type.isVoid(), ReturnTypeMismatch,
                         "signal method must return void: " +
                             record.qualified_name);
    handle.signal(record.resolved.name, record.args);
    context.setResult(Value{});
    return;
  case iface::MethodRole::Query:
    WFROUTE_THROW_IF(record.return_type.isVoid(), ReturnTypeMismatch,
                     "query method cannot return void: " +
                         record.qualified_name);
    context.setResult(
        handle.query(record.resolved.name, record.return_type, record.args));
    return;
  }
}

// ---------------------------------------------------------------------------
// Start / Execute (entry point only)
// ---------------------------------------------------------------------------

void requireEntryPoint(const DispatchRecord &record, inv::InvocationMode mode) {
  WFROUTE_THROW_UNLESS(record.resolved.role == iface::MethodRole::EntryPoint,
                       UnsupportedInMode,
                       std::string(toString(mode)) +
                           " accepts only the workflow method, not " +
                           std::string(toString(record.resolved.role)) + " " +
                           record.qualified_name);
}

void runStart(Handle &handle, const DispatchRecord &record,
              inv::InvocationContext &context) {
  requireEntryPoint(record, inv::InvocationMode::Start);
  context.setResult(handle.start(record.args));
}

void runExecute(Handle &handle, const DispatchRecord &record,
                inv::InvocationContext &context) {
  requireEntryPoint(record, inv::InvocationMode::Execute);
  duplicate_start_policy::startWorkflow(handle, record.args);
  context.setResult(handle.getResultAsync(record.return_type));
}

// ---------------------------------------------------------------------------
// SignalWithStart (entry point and signals are recorded into the batch)
// ---------------------------------------------------------------------------

void runSignalWithStart(Handle &handle, const DispatchRecord &record,
                        inv::InvocationContext &context) {
  auto *batch = context.batch();
  WFROUTE_ASSERT(batch != nullptr, "SignalWithStart context without a batch");
  switch (record.resolved.role) {
  case iface::MethodRole::EntryPoint:
    batch->start(handle, record.args);
    return;
  case iface::MethodRole::Signal:
    batch->signal(handle, record.resolved.name, record.args);
    return;
  case iface::MethodRole::Query:
    WFROUTE_THROW(UnsupportedInBatch,
                  "signal-with-start batch does not accept query method " +
                      record.qualified_name);
  }
}

} // namespace

Router::Router(std::shared_ptr<const Descriptor> descriptor)
    : descriptor_(std::move(descriptor)) {
  WFROUTE_THROW_IF_NULL(descriptor_, "router requires an interface descriptor");
}

Value Router::dispatch(Handle &handle, const DispatchTarget &target,
                       const Arguments &args) const {
  if (const auto *reserved = std::get_if<ReservedMethod>(&target)) {
    switch (*reserved) {
    case ReservedMethod::ToString:
      return std::string(kStubSentinel);
    case ReservedMethod::UntypedStub:
      return &handle;
    }
  }
  if (const auto *undeclared = std::get_if<UndeclaredMethod>(&target)) {
    WFROUTE_THROW(InvalidTarget, undeclared->description);
  }
  return dispatchDeclared(handle, std::get<iface::MethodIndex>(target), args);
}

Value Router::dispatchDeclared(Handle &handle, iface::MethodIndex index,
                               const Arguments &args) const {
  // No active context: this call is an ephemeral Sync invocation.
  inv::InvocationContext ephemeral(inv::InvocationMode::Sync);
  auto *context = inv::current();
  if (context == nullptr) {
    context = &ephemeral;
  }
  // A failed call must not leave the previous call's outcome readable.
  context->clearResult();

  const auto &entry = descriptor_->method(index);
  const auto *resolved = descriptor_->resolved(index);
  WFROUTE_THROW_IF(resolved == nullptr, UnknownMethod,
                   descriptor_->qualifiedName(index) +
                       " has no WorkflowMethod, SignalMethod or QueryMethod marker");

  const DispatchRecord record{index, *resolved, entry.return_type, args,
                              descriptor_->qualifiedName(index)};

  WFROUTE_LOG_DEBUG(Dispatch, std::string(toString(context->mode())) + " " +
                                  std::string(toString(resolved->role)) + " '" +
                                  resolved->name + "' (" +
                                  record.qualified_name + ")");

  switch (context->mode()) {
  case inv::InvocationMode::Sync:
    runSync(handle, record, *context);
    return context->result();
  case inv::InvocationMode::Start:
    runStart(handle, record, *context);
    break;
  case inv::InvocationMode::Execute:
    runExecute(handle, record, *context);
    break;
  case inv::InvocationMode::SignalWithStart:
    runSignalWithStart(handle, record, *context);
    break;
  }
  return Value{};
}

} // namespace wfroute::internal::dispatch
