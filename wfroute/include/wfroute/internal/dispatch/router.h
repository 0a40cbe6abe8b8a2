#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>

#include "wfroute/internal/dispatch/dispatch_record.h"
#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_handle.h"
#include "wfroute/internal/interface/interface_descriptor.h"

namespace wfroute::internal::dispatch {

/// @brief Value returned for ReservedMethod::ToString.
inline constexpr std::string_view kStubSentinel = "WorkflowStub";

/**
 * @brief Translates typed interface calls into operations on a WorkflowHandle.
 *
 * Workflow:
 * 1. Reserved introspection targets are answered without touching the handle
 * 2. Undeclared targets fail with InvalidTarget
 * 3. The thread's InvocationContext selects the mode (Sync when none)
 * 4. The method's role and name come from the precomputed descriptor
 *    (UnknownMethod for a role-less method)
 * 5. The mode protocol runs against the handle
 * 6. Sync returns the produced value; other modes return an empty Value and
 *    leave the outcome in the InvocationContext
 *
 * The router never owns the handle. It holds no mutable state and may be
 * shared between threads.
 */
class Router {
public:
  using Value = ::wfroute::internal::handle::Value;
  using Arguments = ::wfroute::internal::handle::Arguments;
  using Handle = ::wfroute::internal::handle::WorkflowHandle;
  using Descriptor = ::wfroute::internal::interface::InterfaceDescriptor;

  explicit Router(std::shared_ptr<const Descriptor> descriptor);

  const Descriptor &descriptor() const noexcept { return *descriptor_; }

  /// @brief Map a member function pointer to its dispatch target.
  template <typename Member> DispatchTarget target(Member member) const {
    if (auto index = descriptor_->find(member)) {
      return *index;
    }
    return UndeclaredMethod{std::string(typeid(Member).name()) +
                            " is not declared on " +
                            descriptor_->interfaceName()};
  }

  /**
   * @brief Dispatch one call.
   * @throws std::system_error for every failure listed on Router, plus
   *         whatever the handle or batch throws.
   */
  Value dispatch(Handle &handle, const DispatchTarget &target,
                 const Arguments &args) const;

private:
  Value dispatchDeclared(Handle &handle,
                         ::wfroute::internal::interface::MethodIndex index,
                         const Arguments &args) const;

  std::shared_ptr<const Descriptor> descriptor_;
};

} // namespace wfroute::internal::dispatch
