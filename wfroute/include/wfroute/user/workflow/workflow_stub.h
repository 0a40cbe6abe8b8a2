#pragma once

/**
 * @file workflow_stub.h
 * @brief Typed front end of the dispatch router.
 */

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/dispatch/router.h"
#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/handle/workflow_handle.h"
#include "wfroute/internal/interface/descriptor_cache.h"
#include "wfroute/internal/interface/interface_declaration.h"
#include "wfroute/internal/interface/role_resolver.h"
#include "wfroute/internal/invocation/invocation_context.h"

namespace wfroute::user::workflow {

namespace detail {

template <typename Member> struct MemberFunctionTraits;

template <typename R, typename C, typename... Params>
struct MemberFunctionTraits<R (C::*)(Params...)> {
  using Result = R;
  using Class = C;
  template <typename... Args>
  static ::wfroute::internal::handle::Arguments pack(Args &&...args) {
    return ::wfroute::internal::handle::packArguments<Params...>(
        std::forward<Args>(args)...);
  }
};

template <typename R, typename C, typename... Params>
struct MemberFunctionTraits<R (C::*)(Params...) const>
    : MemberFunctionTraits<R (C::*)(Params...)> {};

} // namespace detail

/**
 * @brief Typed view of one workflow execution through interface `I`.
 *
 * `call(&I::method, args...)` routes through the Router: with no active
 * invocation context it performs the operation and returns its value; inside
 * a Start / Execute / SignalWithStart context it returns `R{}` and the real
 * outcome is read from the context (see async_invocation.h).
 *
 * The handle is shared with the caller; the router only borrows it.
 */
template <::wfroute::internal::interface::DeclaredWorkflowInterface I>
class WorkflowStub {
public:
  using Handle = ::wfroute::internal::handle::WorkflowHandle;
  using Descriptor = ::wfroute::internal::interface::InterfaceDescriptor;

  explicit WorkflowStub(std::shared_ptr<Handle> handle)
      : handle_(std::move(handle)),
        router_(::wfroute::internal::interface::DescriptorCache::get<I>()) {
    WFROUTE_THROW_IF_NULL(handle_, "workflow stub requires a handle");
  }

  /**
   * @brief Typed call.
   *
   * Sync: the operation's value. Other modes: `R{}`; a return type without a
   * default value is rejected before anything is dispatched.
   */
  template <typename Member, typename... Args>
  typename detail::MemberFunctionTraits<Member>::Result call(Member member,
                                                             Args &&...args) {
    using R = typename detail::MemberFunctionTraits<Member>::Result;
    static_assert(!std::is_reference_v<R>,
                  "workflow methods must return by value");

    namespace invocation = ::wfroute::internal::invocation;
    const auto *context = invocation::current();
    const bool sync =
        context == nullptr || context->mode() == invocation::InvocationMode::Sync;
    if constexpr (!std::is_void_v<R> && !std::is_default_constructible_v<R>) {
      WFROUTE_THROW_UNLESS(sync, InvalidState,
                           "return type has no default value outside Sync "
                           "mode; use start() or execute() instead");
    }

    auto value = dispatch(member, std::forward<Args>(args)...);
    if constexpr (std::is_void_v<R>) {
      return;
    } else {
      if (!sync) {
        if constexpr (std::is_default_constructible_v<R>) {
          return R{};
        }
      }
      auto *typed = std::any_cast<R>(&value);
      WFROUTE_THROW_IF(typed == nullptr, ReturnTypeMismatch,
                       "handle returned a value of the wrong type for " +
                           router_.descriptor().interfaceName());
      return std::move(*typed);
    }
  }

  /**
   * @brief Untyped call: dispatch and return the raw Value.
   *
   * Arguments are converted to the declared parameter types first.
   */
  template <typename Member, typename... Args>
  ::wfroute::internal::handle::Value dispatch(Member member, Args &&...args) {
    using Traits = detail::MemberFunctionTraits<Member>;
    static_assert(std::is_base_of_v<typename Traits::Class, I>,
                  "method does not belong to the workflow interface");
    return router_.dispatch(*handle_, router_.target(member),
                            Traits::pack(std::forward<Args>(args)...));
  }

  /// @brief Fixed sentinel; never contacts the handle.
  std::string toString() const {
    return std::any_cast<std::string>(router_.dispatch(
        *handle_, ::wfroute::internal::dispatch::ReservedMethod::ToString, {}));
  }

  /// @brief The untyped handle behind this stub.
  Handle &untyped() const {
    return *std::any_cast<Handle *>(router_.dispatch(
        *handle_, ::wfroute::internal::dispatch::ReservedMethod::UntypedStub,
        {}));
  }

  std::optional<std::string> workflowType() const {
    return router_.descriptor().workflowType();
  }

  const Descriptor &descriptor() const noexcept { return router_.descriptor(); }

private:
  std::shared_ptr<Handle> handle_;
  ::wfroute::internal::dispatch::Router router_;
};

/**
 * @brief Workflow type and effective options for starting a new `I` execution.
 *
 * Use the result to create the handle passed to WorkflowStub.
 * @throws std::system_error (MissingEntryPoint) when `I` has no workflow method.
 */
template <::wfroute::internal::interface::DeclaredWorkflowInterface I>
::wfroute::internal::interface::role_resolver::StartConfiguration
newWorkflowConfiguration(
    const ::wfroute::internal::options::WorkflowOptions &options = {}) {
  return ::wfroute::internal::interface::role_resolver::resolveStartConfiguration(
      *::wfroute::internal::interface::DescriptorCache::get<I>(), options);
}

} // namespace wfroute::user::workflow
