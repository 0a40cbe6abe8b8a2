#pragma once

#include <cstddef>
#include <memory>
#include <typeindex>

#include "wfroute/internal/interface/interface_declaration.h"
#include "wfroute/internal/interface/interface_descriptor.h"

namespace wfroute::internal::interface {

/**
 * @brief Process-wide cache of resolved interface descriptors.
 *
 * Keyed by the interface type. Resolution runs under the cache lock, so each
 * interface is resolved at most once even under concurrent first use; a
 * resolution that throws leaves nothing behind. Cached descriptors are never
 * mutated and may be read from any thread.
 *
 * Static-only, like the other process-wide registries.
 */
class DescriptorCache {
public:
  using DescriptorPtr = std::shared_ptr<const InterfaceDescriptor>;
  using DeclareFn = InterfaceDeclaration (*)();

  DescriptorCache() = delete;

  template <DeclaredWorkflowInterface I> static DescriptorPtr get() {
    return getOrResolve(typeid(I), &WorkflowInterfaceTraits<I>::declare);
  }

  static DescriptorPtr getOrResolve(std::type_index type, DeclareFn declare);

  static bool contains(std::type_index type);
  static std::size_t size();

  /// @brief Drop every entry. Descriptors already handed out stay valid.
  static void clear();
};

} // namespace wfroute::internal::interface
