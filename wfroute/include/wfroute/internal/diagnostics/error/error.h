#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace wfroute::internal::diagnostics::error {

/**
 * @brief wfroute のエラー種別。
 *
 * 値は安定しており、ログや外部へのエラー報告にそのまま使ってよい。
 */
enum class WfrouteErrc {
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,

    // ロール解決
    AmbiguousRole = 4,         ///< ロールマーカーが 2 つ以上、またはエントリポイントが 2 つ以上
    DuplicateName = 5,         ///< 同一ロール内で解決名が衝突
    MissingEntryPoint = 6,     ///< 起動を要求したがエントリポイントが無い

    // ディスパッチ
    InvalidTarget = 7,         ///< インターフェースに宣言されていない呼び出し先
    UnknownMethod = 8,         ///< ロールを持たないメソッド
    ReturnTypeMismatch = 9,
    UnsupportedInMode = 10,
    UnsupportedInBatch = 11,

    // 呼び出しコンテキスト
    Reentrancy = 12,
    NoActiveContext = 13,

    // ハンドル由来。ハンドル実装が送出する。
    DuplicateWorkflow = 14,

    ConfigurationError = 15,
};

}  // namespace wfroute::internal::diagnostics::error

// WfrouteError の error_code 引数コンストラクタより先に見えている必要がある。
namespace std {

template <>
struct is_error_code_enum<wfroute::internal::diagnostics::error::WfrouteErrc> : true_type {};

}  // namespace std

namespace wfroute::internal::diagnostics::error {

/// @brief 列挙子名（"AmbiguousRole" など）。
constexpr std::string_view errcName(WfrouteErrc errc) noexcept {
    switch (errc) {
        case WfrouteErrc::Success:            return "Success";
        case WfrouteErrc::Unknown:            return "Unknown";
        case WfrouteErrc::InvalidArgument:    return "InvalidArgument";
        case WfrouteErrc::InvalidState:       return "InvalidState";
        case WfrouteErrc::AmbiguousRole:      return "AmbiguousRole";
        case WfrouteErrc::DuplicateName:      return "DuplicateName";
        case WfrouteErrc::MissingEntryPoint:  return "MissingEntryPoint";
        case WfrouteErrc::InvalidTarget:      return "InvalidTarget";
        case WfrouteErrc::UnknownMethod:      return "UnknownMethod";
        case WfrouteErrc::ReturnTypeMismatch: return "ReturnTypeMismatch";
        case WfrouteErrc::UnsupportedInMode:  return "UnsupportedInMode";
        case WfrouteErrc::UnsupportedInBatch: return "UnsupportedInBatch";
        case WfrouteErrc::Reentrancy:         return "Reentrancy";
        case WfrouteErrc::NoActiveContext:    return "NoActiveContext";
        case WfrouteErrc::DuplicateWorkflow:  return "DuplicateWorkflow";
        case WfrouteErrc::ConfigurationError: return "ConfigurationError";
    }
    return "Unrecognized";
}

/// @brief `std::error_code` に載せるためのカテゴリ。名前は "wfroute"。
class WfrouteErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override;
    std::string message(int condition) const override;
};

const std::error_category& wfrouteErrorCategory();

std::error_code makeErrorCode(WfrouteErrc errc);

/// @brief ADL 用。`std::error_code ec = WfrouteErrc::Reentrancy;` を可能にする。
std::error_code make_error_code(WfrouteErrc errc);

/// @brief wfroute カテゴリのコードなら対応する WfrouteErrc、それ以外は nullopt。
std::optional<WfrouteErrc> errcOf(const std::error_code& code) noexcept;

/// @brief 例外が指定した WfrouteErrc を運んでいるか。
bool hasErrc(const std::system_error& ex, WfrouteErrc errc) noexcept;

/**
 * @brief エラーコードと詳細メッセージの組。
 *
 * 例外として送出する場合は std::system_error に変換される（throwError）。
 * 例外を使わない経路では WfrouteResult の失敗値として運ばれる。
 */
class WfrouteError {
public:
    explicit WfrouteError(WfrouteErrc errc, std::string message = {});
    explicit WfrouteError(std::error_code code, std::string message = {});

    /// wfroute 以外のカテゴリでは Unknown。
    WfrouteErrc errc() const noexcept;
    const std::error_code& code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    /// "<カテゴリメッセージ> [<列挙子名>]: <詳細>" 形式。
    std::string describe() const;

private:
    std::error_code code_;
    std::string message_;
};

WfrouteError makeError(WfrouteErrc errc, std::string message = {});

/// @brief std::system_error(code, describe()) を送出する。
[[noreturn]] void throwError(const WfrouteError& error);
[[noreturn]] void throwError(WfrouteErrc errc, std::string message = {});

/// @brief stderr に出力して abort する。不変条件違反専用。
[[noreturn]] void fatalError(const WfrouteError& error);

/**
 * @brief 値または WfrouteError のどちらかを保持する。
 *
 * 失敗状態で value() を呼ぶと保持しているエラーを送出する。
 */
template <typename T>
class WfrouteResult {
public:
    static WfrouteResult success(T value) {
        return WfrouteResult(std::in_place_index<0>, std::move(value));
    }
    static WfrouteResult failure(WfrouteError error) {
        return WfrouteResult(std::in_place_index<1>, std::move(error));
    }
    static WfrouteResult failure(WfrouteErrc errc, std::string message = {}) {
        return failure(WfrouteError(errc, std::move(message)));
    }

    bool has_value() const noexcept { return state_.index() == 0; }
    bool has_error() const noexcept { return state_.index() == 1; }

    T& value() &;
    const T& value() const&;
    T&& value() &&;

    template <typename U>
    T value_or(U&& fallback) const&;

    /// @throws std::system_error (InvalidState) 成功状態の場合。
    const WfrouteError& error() const;

private:
    template <std::size_t I, typename V>
    WfrouteResult(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, WfrouteError> state_;
};

template <>
class WfrouteResult<void> {
public:
    static WfrouteResult success() { return WfrouteResult(std::nullopt); }
    static WfrouteResult failure(WfrouteError error) { return WfrouteResult(std::move(error)); }
    static WfrouteResult failure(WfrouteErrc errc, std::string message = {}) {
        return failure(WfrouteError(errc, std::move(message)));
    }

    bool has_value() const noexcept { return !error_.has_value(); }
    bool has_error() const noexcept { return error_.has_value(); }

    void value() const;
    const WfrouteError& error() const;

private:
    explicit WfrouteResult(std::optional<WfrouteError> error) : error_(std::move(error)) {}

    std::optional<WfrouteError> error_;
};

/**
 * @brief `fn` を実行し、送出された例外を失敗値へ変換する。
 *
 * std::system_error はコードを保ったまま、その他の std::exception は Unknown になる。
 * std::exception 以外の例外はそのまま伝播する。
 */
template <typename Fn>
auto captureResult(Fn&& fn) -> WfrouteResult<std::invoke_result_t<Fn>>;

/// @brief 成功なら値を返し、失敗なら保持しているエラーを送出する。
template <typename T>
T unwrapOrThrow(WfrouteResult<T>&& result);

void unwrapOrThrow(WfrouteResult<void>&& result);

}  // namespace wfroute::internal::diagnostics::error

#include "wfroute/internal/diagnostics/error/error_impl.h"
