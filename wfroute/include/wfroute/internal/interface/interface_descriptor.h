#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/interface/method_role.h"
#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::interface {

using MethodIndex = std::size_t;

/// @brief Role and wire name of one method.
struct ResolvedMethod {
  MethodRole role;
  std::string name;
};

struct MethodEntry {
  std::string identifier{};
  std::any member{};
  ::wfroute::internal::handle::ReturnType return_type =
      ::wfroute::internal::handle::ReturnType::of<void>();
  /// nullopt for a method without any role marker.
  std::optional<ResolvedMethod> resolved{};
};

/**
 * @brief Immutable role table of one workflow interface.
 *
 * Built by role_resolver::resolve() and shared through DescriptorCache.
 * Lookups by member function pointer are linear over the declared methods,
 * which are few; no per-call metadata inspection takes place.
 */
class InterfaceDescriptor {
public:
  using Options = ::wfroute::internal::options::WorkflowOptions;

  InterfaceDescriptor(std::string name, std::type_index type,
                      std::vector<MethodEntry> methods,
                      std::optional<MethodIndex> entry_point,
                      Options declared_options);

  const std::string &interfaceName() const noexcept { return name_; }
  std::type_index interfaceType() const noexcept { return type_; }

  std::size_t methodCount() const noexcept { return methods_.size(); }

  /// @throws std::system_error (InvalidTarget) when out of range.
  const MethodEntry &method(MethodIndex index) const;

  /**
   * @brief Find the declared method whose identity is `member`.
   * @return nullopt when `member` is not part of the declaration.
   */
  template <typename Member>
  std::optional<MethodIndex> find(Member member) const {
    for (MethodIndex i = 0; i < methods_.size(); ++i) {
      const auto *stored = std::any_cast<Member>(&methods_[i].member);
      if (stored != nullptr && *stored == member) {
        return i;
      }
    }
    return std::nullopt;
  }

  /// @brief Role and name of a method, or nullptr for a role-less method.
  const ResolvedMethod *resolved(MethodIndex index) const;

  bool hasEntryPoint() const noexcept { return entry_point_.has_value(); }
  std::optional<MethodIndex> entryPointIndex() const noexcept {
    return entry_point_;
  }

  /// @brief Resolved name of the entry point, i.e. the workflow type.
  std::optional<std::string> workflowType() const;

  /**
   * @brief Interface defaults overlaid with the entry point's MethodRetry and
   * CronSchedule. Caller options are layered on top at stub construction.
   */
  const Options &declaredOptions() const noexcept { return declared_options_; }

  /// @brief `Interface::identifier`, for messages.
  std::string qualifiedName(MethodIndex index) const;

private:
  std::string name_;
  std::type_index type_;
  std::vector<MethodEntry> methods_;
  std::optional<MethodIndex> entry_point_;
  Options declared_options_;
};

} // namespace wfroute::internal::interface
