#pragma once

#include <string_view>

namespace wfroute::internal::interface {

/**
 * @brief Semantic role of an interface method.
 */
enum class MethodRole {
  EntryPoint, ///< Starts the workflow and names its type.
  Signal,     ///< One-way notification to a running execution.
  Query,      ///< Synchronous read of execution state.
};

constexpr std::string_view toString(MethodRole role) noexcept {
  switch (role) {
  case MethodRole::EntryPoint:
    return "EntryPoint";
  case MethodRole::Signal:
    return "Signal";
  case MethodRole::Query:
    return "Query";
  }
  return "Unknown";
}

} // namespace wfroute::internal::interface
