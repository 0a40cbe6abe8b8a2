#include "wfroute/internal/interface/descriptor_cache.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "wfroute/internal/diagnostics/error/error_macros.h"
#include "wfroute/internal/diagnostics/log/log.h"
#include "wfroute/internal/interface/role_resolver.h"

namespace wfroute::internal::interface {
namespace {

struct CacheState {
  std::mutex mutex;
  std::unordered_map<std::type_index, DescriptorCache::DescriptorPtr> entries;
};

CacheState &cacheState() {
  static CacheState state;
  return state;
}

} // namespace

DescriptorCache::DescriptorPtr
DescriptorCache::getOrResolve(std::type_index type, DeclareFn declare) {
  WFROUTE_THROW_IF_NULL(declare, "interface declaration function is null");
  auto &state = cacheState();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (auto it = state.entries.find(type); it != state.entries.end()) {
    WFROUTE_LOG_TRACE(Resolver, std::string("descriptor cache hit: ") +
                                    it->second->interfaceName());
    return it->second;
  }
  WFROUTE_LOG_TRACE(Resolver, std::string("descriptor cache miss: ") + type.name());
  auto descriptor = std::make_shared<const InterfaceDescriptor>(
      role_resolver::resolve(declare()));
  WFROUTE_THROW_UNLESS(descriptor->interfaceType() == type, InvalidState,
                       "declaration of " + descriptor->interfaceName() +
                           " was built for a different interface type");
  state.entries.emplace(type, descriptor);
  return descriptor;
}

bool DescriptorCache::contains(std::type_index type) {
  auto &state = cacheState();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.entries.count(type) > 0;
}

std::size_t DescriptorCache::size() {
  auto &state = cacheState();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.entries.size();
}

void DescriptorCache::clear() {
  auto &state = cacheState();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.entries.clear();
}

} // namespace wfroute::internal::interface
