#pragma once

#include <any>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace wfroute::internal::handle {

/// @brief Untyped payload exchanged with the handle. Encoding is the handle's job.
using Value = std::any;

/// @brief Positional call arguments in declaration order.
using Arguments = std::vector<Value>;

/**
 * @brief Declared return type of an interface method.
 *
 * Passed to the handle so that it can decode a result or query response into
 * the type the caller expects.
 */
class ReturnType {
public:
  template <typename R> static ReturnType of() noexcept {
    return ReturnType(typeid(R), std::is_void_v<R>);
  }

  std::type_index type() const noexcept { return type_; }
  bool isVoid() const noexcept { return is_void_; }

  /// @brief Implementation-defined type name, for diagnostics only.
  std::string_view name() const noexcept { return type_.name(); }

  bool operator==(const ReturnType &other) const noexcept {
    return type_ == other.type_;
  }

private:
  ReturnType(const std::type_info &info, bool is_void) noexcept
      : type_(info), is_void_(is_void) {}

  std::type_index type_;
  bool is_void_;
};

/**
 * @brief Pack call arguments, each converted to its declared parameter type.
 *
 * `packArguments<std::string>("Ann")` stores a std::string, not a const char*.
 */
template <typename... Params, typename... Args>
Arguments packArguments(Args &&...args) {
  static_assert(sizeof...(Params) == sizeof...(Args),
                "argument count does not match the declared parameters");
  Arguments packed;
  packed.reserve(sizeof...(Args));
  (packed.emplace_back(std::in_place_type<std::decay_t<Params>>,
                       std::forward<Args>(args)),
   ...);
  return packed;
}

} // namespace wfroute::internal::handle
