#pragma once

/**
 * @file error_impl.h
 * @brief error.h のインライン実装。直接インクルードしない。
 */

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>

namespace wfroute::internal::diagnostics::error {

// ============================================================================
// カテゴリ
// ============================================================================

inline const char* WfrouteErrorCategory::name() const noexcept { return "wfroute"; }

inline std::string WfrouteErrorCategory::message(int condition) const {
    switch (static_cast<WfrouteErrc>(condition)) {
        case WfrouteErrc::Success:            return "success";
        case WfrouteErrc::Unknown:            return "unknown error";
        case WfrouteErrc::InvalidArgument:    return "invalid argument";
        case WfrouteErrc::InvalidState:       return "invalid state";
        case WfrouteErrc::AmbiguousRole:      return "ambiguous method role";
        case WfrouteErrc::DuplicateName:      return "duplicate resolved name";
        case WfrouteErrc::MissingEntryPoint:  return "missing workflow method";
        case WfrouteErrc::InvalidTarget:      return "invalid dispatch target";
        case WfrouteErrc::UnknownMethod:      return "method has no role";
        case WfrouteErrc::ReturnTypeMismatch: return "return type mismatch";
        case WfrouteErrc::UnsupportedInMode:  return "role not supported in invocation mode";
        case WfrouteErrc::UnsupportedInBatch: return "role not supported in signal-with-start batch";
        case WfrouteErrc::Reentrancy:         return "invocation context already active";
        case WfrouteErrc::NoActiveContext:    return "no active invocation context";
        case WfrouteErrc::DuplicateWorkflow:  return "workflow already started";
        case WfrouteErrc::ConfigurationError: return "configuration error";
    }
    return "unrecognized wfroute error " + std::to_string(condition);
}

inline const std::error_category& wfrouteErrorCategory() {
    static const WfrouteErrorCategory category;
    return category;
}

inline std::error_code makeErrorCode(WfrouteErrc errc) {
    return std::error_code(static_cast<int>(errc), wfrouteErrorCategory());
}

inline std::error_code make_error_code(WfrouteErrc errc) { return makeErrorCode(errc); }

inline std::optional<WfrouteErrc> errcOf(const std::error_code& code) noexcept {
    if (code.category() != wfrouteErrorCategory()) {
        return std::nullopt;
    }
    return static_cast<WfrouteErrc>(code.value());
}

inline bool hasErrc(const std::system_error& ex, WfrouteErrc errc) noexcept {
    return errcOf(ex.code()) == errc;
}

// ============================================================================
// WfrouteError
// ============================================================================

inline WfrouteError::WfrouteError(WfrouteErrc errc, std::string message)
    : code_(makeErrorCode(errc)), message_(std::move(message)) {}

inline WfrouteError::WfrouteError(std::error_code code, std::string message)
    : code_(code), message_(std::move(message)) {}

inline WfrouteErrc WfrouteError::errc() const noexcept {
    return errcOf(code_).value_or(WfrouteErrc::Unknown);
}

inline std::string WfrouteError::describe() const {
    std::string out = code_.message();
    if (const auto errc = errcOf(code_)) {
        out += " [";
        out += errcName(*errc);
        out += ']';
    }
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    return out;
}

inline WfrouteError makeError(WfrouteErrc errc, std::string message) {
    return WfrouteError(errc, std::move(message));
}

inline void throwError(const WfrouteError& error) {
    throw std::system_error(error.code(), error.describe());
}

inline void throwError(WfrouteErrc errc, std::string message) {
    throwError(WfrouteError(errc, std::move(message)));
}

inline void fatalError(const WfrouteError& error) {
    std::fprintf(stderr, "[WFROUTE][FATAL] %s\n", error.describe().c_str());
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// WfrouteResult
// ============================================================================

template <typename T>
T& WfrouteResult<T>::value() & {
    if (has_error()) {
        throwError(std::get<1>(state_));
    }
    return std::get<0>(state_);
}

template <typename T>
const T& WfrouteResult<T>::value() const& {
    if (has_error()) {
        throwError(std::get<1>(state_));
    }
    return std::get<0>(state_);
}

template <typename T>
T&& WfrouteResult<T>::value() && {
    if (has_error()) {
        throwError(std::get<1>(state_));
    }
    return std::get<0>(std::move(state_));
}

template <typename T>
template <typename U>
T WfrouteResult<T>::value_or(U&& fallback) const& {
    if (has_value()) {
        return std::get<0>(state_);
    }
    return static_cast<T>(std::forward<U>(fallback));
}

template <typename T>
const WfrouteError& WfrouteResult<T>::error() const {
    if (!has_error()) {
        throwError(WfrouteErrc::InvalidState, "result holds a value, not an error");
    }
    return std::get<1>(state_);
}

inline void WfrouteResult<void>::value() const {
    if (error_.has_value()) {
        throwError(*error_);
    }
}

inline const WfrouteError& WfrouteResult<void>::error() const {
    if (!error_.has_value()) {
        throwError(WfrouteErrc::InvalidState, "result holds a value, not an error");
    }
    return *error_;
}

template <typename Fn>
auto captureResult(Fn&& fn) -> WfrouteResult<std::invoke_result_t<Fn>> {
    using T = std::invoke_result_t<Fn>;
    try {
        if constexpr (std::is_void_v<T>) {
            std::invoke(std::forward<Fn>(fn));
            return WfrouteResult<void>::success();
        } else {
            return WfrouteResult<T>::success(std::invoke(std::forward<Fn>(fn)));
        }
    } catch (const std::system_error& ex) {
        return WfrouteResult<T>::failure(WfrouteError(ex.code(), ex.what()));
    } catch (const std::exception& ex) {
        return WfrouteResult<T>::failure(WfrouteErrc::Unknown, ex.what());
    }
}

template <typename T>
T unwrapOrThrow(WfrouteResult<T>&& result) {
    return std::move(result).value();
}

inline void unwrapOrThrow(WfrouteResult<void>&& result) { result.value(); }

}  // namespace wfroute::internal::diagnostics::error
