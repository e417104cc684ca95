/**
 * @file result.hpp
 * @brief Monadic error handling type for CodeSandbox.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the error-handling mechanism for infrastructure
 * failures (configuration, queue I/O, process spawning, delivery). Faults
 * raised by user code are not errors at this level; they are carried as
 * Outcome states (see core/types.hpp).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace code_sandbox {

/**
 * @brief Coarse classification of infrastructure failures.
 */
enum class ErrorCode : uint8_t {
    Internal,
    Io,
    InvalidRequest,
    QueueUnavailable,
    CapacityExhausted,
    SandboxSetup,
    ChannelGone,
    ChannelUnavailable
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:           return "internal";
        case ErrorCode::Io:                 return "io";
        case ErrorCode::InvalidRequest:     return "invalid_request";
        case ErrorCode::QueueUnavailable:   return "queue_unavailable";
        case ErrorCode::CapacityExhausted:  return "capacity_exhausted";
        case ErrorCode::SandboxSetup:       return "sandbox_setup";
        case ErrorCode::ChannelGone:        return "channel_gone";
        case ErrorCode::ChannelUnavailable: return "channel_unavailable";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message and a code.
 */
struct Error {
    std::string message;
    ErrorCode code = ErrorCode::Internal;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>, a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 *
 * @note When C++23 std::expected becomes widely available on target
 *       compilers, this can be replaced with a type alias.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace code_sandbox
