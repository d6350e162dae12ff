#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace spool {

/**
 * ErrorCode - Every failure the sync stack can report.
 *
 * Codes are grouped the way callers react to them: crypto failures are
 * per-record, store failures are per-operation, protocol failures reject
 * a whole batch or page, and cursor failures need user action.
 */
enum class ErrorCode {
    // Crypto
    AuthenticationFailed,
    DecodeError,
    UnsupportedVersion,
    KeyDerivationFailed,

    // Local or server store
    DuplicateId,
    NotFound,
    IoFailure,

    // Wire protocol
    MalformedPayload,
    PayloadTooLarge,

    // Sync engine
    SyncCursorInvalid,
    Transport,
    Unauthorized,
    Busy,
    Cancelled,

    // Settings
    InvalidConfig
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::AuthenticationFailed: return "AuthenticationFailed";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorCode::KeyDerivationFailed: return "KeyDerivationFailed";
        case ErrorCode::DuplicateId: return "DuplicateId";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::MalformedPayload: return "MalformedPayload";
        case ErrorCode::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorCode::SyncCursorInvalid: return "SyncCursorInvalid";
        case ErrorCode::Transport: return "Transport";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Busy: return "Busy";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_crypto_error(ErrorCode code) noexcept {
    return code == ErrorCode::AuthenticationFailed
        || code == ErrorCode::DecodeError
        || code == ErrorCode::UnsupportedVersion
        || code == ErrorCode::KeyDerivationFailed;
}

[[nodiscard]] constexpr bool is_store_error(ErrorCode code) noexcept {
    return code == ErrorCode::DuplicateId
        || code == ErrorCode::NotFound
        || code == ErrorCode::IoFailure;
}

[[nodiscard]] constexpr bool is_protocol_error(ErrorCode code) noexcept {
    return code == ErrorCode::MalformedPayload
        || code == ErrorCode::PayloadTooLarge;
}

/**
 * Error - A failure with a classifying code and a human readable message.
 */
struct Error {
    ErrorCode code{ErrorCode::IoFailure};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 *   Result<int> parse_limit(std::string_view s);
 *   auto doubled = parse_limit("10").map([](int x) { return x * 2; });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - Success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

/**
 * Shorthand for building an error Result of any value type.
 */
template<typename T = void>
[[nodiscard]] Result<T, Error> fail(ErrorCode code, std::string message) {
    return Result<T, Error>::err(Error{code, std::move(message)});
}

} // namespace spool
