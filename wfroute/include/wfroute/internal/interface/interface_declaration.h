#pragma once

/**
 * @file interface_declaration.h
 * @brief Declarative description of a typed workflow interface.
 *
 * C++ has no runtime reflection, so each interface spells out its methods
 * once, in a WorkflowInterfaceTraits specialization:
 *
 * @code
 * class Greeter {
 * public:
 *   std::string greet(std::string name);
 *   void cancel();
 * };
 *
 * template <> struct wfroute::internal::interface::WorkflowInterfaceTraits<Greeter> {
 *   static InterfaceDeclaration declare() {
 *     return InterfaceBuilder<Greeter>("Greeter")
 *         .add(WFROUTE_METHOD(Greeter, greet, WorkflowMethod{"Greet"}))
 *         .add(WFROUTE_METHOD(Greeter, cancel, SignalMethod{"Cancel"}))
 *         .build();
 *   }
 * };
 * @endcode
 *
 * The declaration is only the input of the role resolver; it is never
 * consulted on the dispatch path.
 */

#include <any>
#include <concepts>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/interface/markers.h"
#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::interface {

struct MethodDeclaration {
  std::string identifier{};
  /// Member function pointer exactly as declared; the method identity.
  std::any member{};
  ::wfroute::internal::handle::ReturnType return_type =
      ::wfroute::internal::handle::ReturnType::of<void>();
  std::vector<RoleMarker> role_markers{};
  std::optional<MethodRetry> method_retry{};
  std::optional<CronSchedule> cron_schedule{};
};

struct InterfaceDeclaration {
  std::string name{};
  std::type_index type = typeid(void);
  ::wfroute::internal::options::WorkflowOptions defaults{};
  std::vector<MethodDeclaration> methods{};
};

namespace detail {

inline void applyMarker(MethodDeclaration &decl, WorkflowMethod marker) {
  decl.role_markers.emplace_back(std::move(marker));
}
inline void applyMarker(MethodDeclaration &decl, SignalMethod marker) {
  decl.role_markers.emplace_back(std::move(marker));
}
inline void applyMarker(MethodDeclaration &decl, QueryMethod marker) {
  decl.role_markers.emplace_back(std::move(marker));
}
inline void applyMarker(MethodDeclaration &decl, MethodRetry marker) {
  decl.method_retry = std::move(marker);
}
inline void applyMarker(MethodDeclaration &decl, CronSchedule marker) {
  decl.cron_schedule = std::move(marker);
}

template <typename R, typename Member, typename... Markers>
MethodDeclaration makeMethod(Member member, std::string identifier,
                             Markers &&...markers) {
  MethodDeclaration decl;
  decl.identifier = std::move(identifier);
  decl.member = member;
  decl.return_type = ::wfroute::internal::handle::ReturnType::of<R>();
  (applyMarker(decl, std::forward<Markers>(markers)), ...);
  return decl;
}

} // namespace detail

/// @brief Declare a non-const member function with its markers.
template <typename R, typename C, typename... Params, typename... Markers>
MethodDeclaration declareMethod(R (C::*member)(Params...),
                                std::string identifier, Markers &&...markers) {
  return detail::makeMethod<R>(member, std::move(identifier),
                               std::forward<Markers>(markers)...);
}

/// @brief Declare a const member function with its markers.
template <typename R, typename C, typename... Params, typename... Markers>
MethodDeclaration declareMethod(R (C::*member)(Params...) const,
                                std::string identifier, Markers &&...markers) {
  return detail::makeMethod<R>(member, std::move(identifier),
                               std::forward<Markers>(markers)...);
}

/**
 * @brief Fluent builder for an InterfaceDeclaration of interface `I`.
 */
template <typename I> class InterfaceBuilder {
public:
  explicit InterfaceBuilder(std::string name) {
    declaration_.name = std::move(name);
    declaration_.type = typeid(I);
  }

  InterfaceBuilder &add(MethodDeclaration method) {
    declaration_.methods.push_back(std::move(method));
    return *this;
  }

  /// @brief Interface-level default options (lowest precedence).
  InterfaceBuilder &defaults(::wfroute::internal::options::WorkflowOptions options) {
    declaration_.defaults = std::move(options);
    return *this;
  }

  InterfaceDeclaration build() { return std::move(declaration_); }

private:
  InterfaceDeclaration declaration_{};
};

/**
 * @brief Customization point: specialize with a static `declare()`.
 */
template <typename I> struct WorkflowInterfaceTraits {};

template <typename I>
concept DeclaredWorkflowInterface = requires {
  { WorkflowInterfaceTraits<I>::declare() } -> std::convertible_to<InterfaceDeclaration>;
};

} // namespace wfroute::internal::interface

/**
 * @brief Declare `Interface::method`, using the identifier as its simple name.
 */
#define WFROUTE_METHOD(Interface, method, ...)                                 \
  ::wfroute::internal::interface::declareMethod(                               \
      &Interface::method, #method __VA_OPT__(, ) __VA_ARGS__)
