#pragma once

#include <string>

#include "wfroute/internal/interface/interface_declaration.h"
#include "wfroute/internal/interface/interface_descriptor.h"
#include "wfroute/internal/options/workflow_options.h"

namespace wfroute::internal::interface::role_resolver {

/**
 * @brief Build the role table of an interface.
 *
 * For every declared method:
 * 1. count role markers; more than one fails with AmbiguousRole
 * 2. take the explicit marker name, or the method identifier when empty
 * 3. reject a resolved name already used by another method of the same role
 *    (DuplicateName)
 *
 * A second EntryPoint method fails with AmbiguousRole. The entry point's
 * MethodRetry / CronSchedule are merged over the interface defaults once, here.
 *
 * @throws std::system_error on any of the conditions above.
 */
InterfaceDescriptor resolve(const InterfaceDeclaration &declaration);

/// @brief What a handle for a new execution has to be created with.
struct StartConfiguration {
  std::string workflow_type;
  ::wfroute::internal::options::WorkflowOptions options;
};

/**
 * @brief Layer caller options over the declared ones for starting a workflow.
 *
 * Precedence: caller options > method markers > interface defaults.
 * @throws std::system_error (MissingEntryPoint) when the interface declares
 *         no workflow method.
 */
StartConfiguration
resolveStartConfiguration(const InterfaceDescriptor &descriptor,
                          const ::wfroute::internal::options::WorkflowOptions
                              &caller_options);

} // namespace wfroute::internal::interface::role_resolver
