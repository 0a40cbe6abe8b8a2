#pragma once

#include <string>
#include <variant>

#include "wfroute/internal/handle/value.h"
#include "wfroute/internal/interface/interface_descriptor.h"

namespace wfroute::internal::dispatch {

/// @brief Introspection calls answered by the router itself.
enum class ReservedMethod {
  ToString,    ///< Fixed sentinel string.
  UntypedStub, ///< The WorkflowHandle* behind the stub.
};

/// @brief A call whose target is not a method of the declared interface.
struct UndeclaredMethod {
  std::string description;
};

using DispatchTarget = std::variant<ReservedMethod,
                                    ::wfroute::internal::interface::MethodIndex,
                                    UndeclaredMethod>;

/**
 * @brief State of one intercepted call, alive for the duration of dispatch().
 */
struct DispatchRecord {
  ::wfroute::internal::interface::MethodIndex method;
  const ::wfroute::internal::interface::ResolvedMethod &resolved;
  const ::wfroute::internal::handle::ReturnType &return_type;
  const ::wfroute::internal::handle::Arguments &args;
  std::string qualified_name;
};

} // namespace wfroute::internal::dispatch
