#include "wfroute/user/workflow/invocation_guard.h"

namespace wfroute::user::workflow {
namespace {

namespace invocation = ::wfroute::internal::invocation;

} // namespace

InvocationGuard::InvocationGuard(InvocationMode mode, Batch *batch) {
  invocation::enter(mode, batch);
  active_ = true;
}

InvocationGuard::InvocationGuard(InvocationGuard &&other) noexcept
    : active_(other.active_) {
  other.active_ = false;
}

InvocationGuard &InvocationGuard::operator=(InvocationGuard &&other) noexcept {
  if (this != &other) {
    release();
    active_ = other.active_;
    other.active_ = false;
  }
  return *this;
}

InvocationGuard::~InvocationGuard() { release(); }

void InvocationGuard::release() noexcept {
  if (!active_) {
    return;
  }
  invocation::exit();
  active_ = false;
}

} // namespace wfroute::user::workflow
