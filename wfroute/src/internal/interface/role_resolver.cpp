#include "wfroute/internal/interface/role_resolver.h"

#include <optional>
#include <set>
#include <utility>
#include <variant>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/diagnostics/log/log.h"

namespace wfroute::internal::interface::role_resolver {
namespace {

namespace opts = ::wfroute::internal::options;

struct RoleOf {
  MethodRole operator()(const WorkflowMethod &) const noexcept {
    return MethodRole::EntryPoint;
  }
  MethodRole operator()(const SignalMethod &) const noexcept {
    return MethodRole::Signal;
  }
  MethodRole operator()(const QueryMethod &) const noexcept {
    return MethodRole::Query;
  }
};

ResolvedMethod resolveMarker(const RoleMarker &marker,
                             const std::string &identifier) {
  const auto role = std::visit(RoleOf{}, marker);
  const std::string &declared =
      std::visit([](const auto &m) -> const std::string & { return m.name; },
                 marker);
  return ResolvedMethod{role, declared.empty() ? identifier : declared};
}

opts::WorkflowOptions markerOptions(const MethodDeclaration &method) {
  opts::WorkflowOptions options;
  if (method.method_retry.has_value()) {
    options.retry_options = method.method_retry->retry;
  }
  if (method.cron_schedule.has_value()) {
    options.cron_schedule = method.cron_schedule->expression;
  }
  return options;
}

} // namespace

InterfaceDescriptor resolve(const InterfaceDeclaration &declaration) {
  std::vector<MethodEntry> entries;
  entries.reserve(declaration.methods.size());
  std::optional<MethodIndex> entry_point;
  std::set<std::pair<MethodRole, std::string>> used_names;
  opts::WorkflowOptions declared_options = declaration.defaults;

  for (const auto &method : declaration.methods) {
    const std::string qualified = declaration.name + "::" + method.identifier;
    WFROUTE_THROW_IF(method.role_markers.size() > 1, AmbiguousRole,
                     qualified + " must carry at most one of WorkflowMethod, "
                                 "SignalMethod or QueryMethod");

    MethodEntry entry;
    entry.identifier = method.identifier;
    entry.member = method.member;
    entry.return_type = method.return_type;

    if (!method.role_markers.empty()) {
      auto resolved = resolveMarker(method.role_markers.front(), method.identifier);
      WFROUTE_THROW_UNLESS(
          used_names.emplace(resolved.role, resolved.name).second,
          DuplicateName,
          qualified + " resolves to " + std::string(toString(resolved.role)) +
              " name '" + resolved.name + "' which is already taken");

      if (resolved.role == MethodRole::EntryPoint) {
        WFROUTE_THROW_IF(entry_point.has_value(), AmbiguousRole,
                         declaration.name +
                             " declares more than one workflow method: " +
                             entries[*entry_point].identifier + " and " +
                             method.identifier);
        entry_point = entries.size();
        declared_options =
            opts::mergeOptions(declared_options, markerOptions(method));
      }
      entry.resolved = std::move(resolved);
    }
    entries.push_back(std::move(entry));
  }

  WFROUTE_LOG_DEBUG(Resolver, "resolved " + declaration.name + ": " +
                                  std::to_string(entries.size()) + " methods" +
                                  (entry_point ? ", workflow type '" +
                                                     entries[*entry_point].resolved->name + "'"
                                               : std::string(", no workflow method")));

  return InterfaceDescriptor(declaration.name, declaration.type,
                             std::move(entries), entry_point,
                             std::move(declared_options));
}

StartConfiguration
resolveStartConfiguration(const InterfaceDescriptor &descriptor,
                          const opts::WorkflowOptions &caller_options) {
  auto workflow_type = descriptor.workflowType();
  WFROUTE_THROW_UNLESS(workflow_type.has_value(), MissingEntryPoint,
                       descriptor.interfaceName() +
                           " has no workflow method and cannot start a workflow");
  return StartConfiguration{
      std::move(*workflow_type),
      opts::mergeOptions(descriptor.declaredOptions(), caller_options)};
}

} // namespace wfroute::internal::interface::role_resolver
