#include "wfroute/internal/interface/interface_descriptor.h"

#include <utility>

#include "wfroute/internal/diagnostics/error/error_macros.h"

namespace wfroute::internal::interface {

InterfaceDescriptor::InterfaceDescriptor(std::string name, std::type_index type,
                                         std::vector<MethodEntry> methods,
                                         std::optional<MethodIndex> entry_point,
                                         Options declared_options)
    : name_(std::move(name)), type_(type), methods_(std::move(methods)),
      entry_point_(entry_point),
      declared_options_(std::move(declared_options)) {}

const MethodEntry &InterfaceDescriptor::method(MethodIndex index) const {
  WFROUTE_THROW_UNLESS(index < methods_.size(), InvalidTarget,
                       "method index " + std::to_string(index) +
                           " is not declared on " + name_);
  return methods_[index];
}

const ResolvedMethod *InterfaceDescriptor::resolved(MethodIndex index) const {
  const auto &entry = method(index);
  return entry.resolved.has_value() ? &*entry.resolved : nullptr;
}

std::optional<std::string> InterfaceDescriptor::workflowType() const {
  if (!entry_point_.has_value()) {
    return std::nullopt;
  }
  return methods_[*entry_point_].resolved->name;
}

std::string InterfaceDescriptor::qualifiedName(MethodIndex index) const {
  return name_ + "::" + method(index).identifier;
}

} // namespace wfroute::internal::interface
