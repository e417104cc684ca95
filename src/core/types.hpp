/**
 * @file types.hpp
 * @brief Vocabulary types shared by the validator, runner and dispatcher.
 * @author Dimitris Kafetzis
 *
 * Defines Submission, Violation, Outcome, Job and Delivery. An Outcome is a
 * closed state: exactly one of completed / runtime fault / timeout /
 * resource exceeded / rejected holds, and the factories are the only way to
 * build one.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using DeliveryHandle = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Violations
// ─────────────────────────────────────────────

enum class ViolationKind : uint8_t {
    SyntaxError,          ///< Source failed to parse; validation fails closed
    SourceTooLarge,       ///< Rejected before parsing
    DisallowedImport,     ///< Module not in the allow-list
    RestrictedCall,       ///< Reference to a blocked built-in capability
    DisallowedConstruct   ///< Reflection / dunder surface access
};

[[nodiscard]] constexpr std::string_view to_string(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::SyntaxError:         return "syntax_error";
        case ViolationKind::SourceTooLarge:      return "source_too_large";
        case ViolationKind::DisallowedImport:    return "disallowed_import";
        case ViolationKind::RestrictedCall:      return "restricted_call";
        case ViolationKind::DisallowedConstruct: return "disallowed_construct";
    }
    return "unknown";
}

struct SourceLocation {
    uint32_t line{1};     ///< 1-based
    uint32_t column{0};   ///< 0-based, in bytes

    bool operator==(const SourceLocation&) const = default;
};

struct Violation {
    ViolationKind kind;
    SourceLocation location;
    std::string message;

    bool operator==(const Violation&) const = default;
};

// ─────────────────────────────────────────────
// Faults
// ─────────────────────────────────────────────

/**
 * @brief Coarse category of a failed execution.
 */
enum class ErrorKind : uint8_t {
    DivisionByZero,
    TypeError,
    ValueError,
    NameError,
    IndexError,
    KeyError,
    AttributeError,
    ImportError,
    RecursionError,
    SyntaxError,
    AssertionError,
    Uncategorized,
    Timeout,
    ResourceExceeded,
    ValidationRejected
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DivisionByZero:     return "division_by_zero";
        case ErrorKind::TypeError:          return "type_error";
        case ErrorKind::ValueError:         return "value_error";
        case ErrorKind::NameError:          return "name_error";
        case ErrorKind::IndexError:         return "index_error";
        case ErrorKind::KeyError:           return "key_error";
        case ErrorKind::AttributeError:     return "attribute_error";
        case ErrorKind::ImportError:        return "import_error";
        case ErrorKind::RecursionError:     return "recursion_error";
        case ErrorKind::SyntaxError:        return "syntax_error";
        case ErrorKind::AssertionError:     return "assertion_error";
        case ErrorKind::Uncategorized:      return "uncategorized";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::ResourceExceeded:   return "resource_exceeded";
        case ErrorKind::ValidationRejected: return "validation_rejected";
    }
    return "unknown";
}

/**
 * @brief Why an execution did not complete normally.
 *
 * type_name is the interpreter-level name reported on the wire as
 * `error_type` (e.g. "ZeroDivisionError", "TimeoutError").
 */
struct Fault {
    ErrorKind kind{ErrorKind::Uncategorized};
    std::string type_name;
    std::string message;

    bool operator==(const Fault&) const = default;
};

// ─────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────

enum class OutcomeStatus : uint8_t {
    Completed,
    RuntimeFault,
    TimedOut,
    ResourceExceeded,
    Rejected
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Completed:        return "completed";
        case OutcomeStatus::RuntimeFault:     return "runtime_fault";
        case OutcomeStatus::TimedOut:         return "timed_out";
        case OutcomeStatus::ResourceExceeded: return "resource_exceeded";
        case OutcomeStatus::Rejected:         return "rejected";
    }
    return "unknown";
}

/// Captured standard streams of one execution.
struct CapturedOutput {
    std::string stdout_text;
    std::string stderr_text;

    bool operator==(const CapturedOutput&) const = default;
};

/**
 * @brief The result of one execution attempt.
 */
class Outcome {
public:
    static Outcome make_completed(CapturedOutput output, Duration elapsed);
    static Outcome make_fault(Fault fault, CapturedOutput output, Duration elapsed);
    static Outcome make_timeout(std::chrono::milliseconds limit,
                                CapturedOutput output, Duration elapsed);
    static Outcome make_resource_exceeded(std::string type_name, std::string message,
                                          CapturedOutput output, Duration elapsed);
    static Outcome make_rejected(std::vector<Violation> violations);

    [[nodiscard]] OutcomeStatus status() const noexcept { return status_; }

    /// False only when the validator rejected the source.
    [[nodiscard]] bool accepted() const noexcept { return status_ != OutcomeStatus::Rejected; }
    [[nodiscard]] bool succeeded() const noexcept { return status_ == OutcomeStatus::Completed; }
    [[nodiscard]] bool timed_out() const noexcept { return status_ == OutcomeStatus::TimedOut; }

    [[nodiscard]] const std::string& stdout_text() const noexcept { return output_.stdout_text; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return output_.stderr_text; }
    [[nodiscard]] const std::optional<Fault>& fault() const noexcept { return fault_; }
    [[nodiscard]] std::optional<std::string> error() const;
    [[nodiscard]] std::optional<std::string> error_type() const;
    [[nodiscard]] std::optional<ErrorKind> error_kind() const;
    [[nodiscard]] Duration elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }

    bool operator==(const Outcome&) const = default;

private:
    Outcome(OutcomeStatus status, CapturedOutput output, std::optional<Fault> fault,
            Duration elapsed, std::vector<Violation> violations);

    OutcomeStatus status_;
    CapturedOutput output_;
    std::optional<Fault> fault_;
    Duration elapsed_{0};
    std::vector<Violation> violations_;
};

// ─────────────────────────────────────────────
// Submission / Job / Delivery
// ─────────────────────────────────────────────

/**
 * @brief One request to execute code.
 *
 * timeout is already clamped to the configured ceiling when the
 * Dispatcher builds a Submission; nothing downstream trusts the caller's
 * value.
 */
struct Submission {
    std::string source;
    std::chrono::milliseconds timeout{0};
    std::optional<DeliveryHandle> delivery_handle;
};

/**
 * @brief Queued unit of accepted work (async path only).
 */
struct Job {
    JobId id;
    Submission submission;
    Timestamp enqueued_at;
    uint32_t attempt{0};   ///< Incremented by the queue on every claim
};

struct Delivery {
    JobId job_id;
    Outcome outcome;
};

}  // namespace code_sandbox
