/**
 * @file types.cpp
 * @brief Outcome factories and derived observers.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <format>
#include <utility>

namespace code_sandbox {

Outcome::Outcome(OutcomeStatus status, CapturedOutput output, std::optional<Fault> fault,
                 Duration elapsed, std::vector<Violation> violations)
    : status_(status)
    , output_(std::move(output))
    , fault_(std::move(fault))
    , elapsed_(elapsed)
    , violations_(std::move(violations)) {}

Outcome Outcome::make_completed(CapturedOutput output, Duration elapsed) {
    return Outcome(OutcomeStatus::Completed, std::move(output), std::nullopt, elapsed, {});
}

Outcome Outcome::make_fault(Fault fault, CapturedOutput output, Duration elapsed) {
    // Timeouts, resource ceilings and rejections have dedicated states
    if (fault.kind == ErrorKind::Timeout || fault.kind == ErrorKind::ResourceExceeded
        || fault.kind == ErrorKind::ValidationRejected) {
        fault.kind = ErrorKind::Uncategorized;
    }
    return Outcome(OutcomeStatus::RuntimeFault, std::move(output), std::move(fault),
                   elapsed, {});
}

Outcome Outcome::make_timeout(std::chrono::milliseconds limit,
                              CapturedOutput output, Duration elapsed) {
    auto seconds = static_cast<double>(limit.count()) / 1000.0;
    Fault fault{
        .kind = ErrorKind::Timeout,
        .type_name = "TimeoutError",
        .message = std::format("Execution timed out after {:g} seconds", seconds)
    };
    return Outcome(OutcomeStatus::TimedOut, std::move(output), std::move(fault), elapsed, {});
}

Outcome Outcome::make_resource_exceeded(std::string type_name, std::string message,
                                        CapturedOutput output, Duration elapsed) {
    Fault fault{
        .kind = ErrorKind::ResourceExceeded,
        .type_name = std::move(type_name),
        .message = std::move(message)
    };
    return Outcome(OutcomeStatus::ResourceExceeded, std::move(output), std::move(fault),
                   elapsed, {});
}

Outcome Outcome::make_rejected(std::vector<Violation> violations) {
    Fault fault{
        .kind = ErrorKind::ValidationRejected,
        .type_name = "SecurityError",
        .message = "Security validation failed"
    };
    return Outcome(OutcomeStatus::Rejected, CapturedOutput{}, std::move(fault),
                   Duration{0}, std::move(violations));
}

std::optional<std::string> Outcome::error() const {
    if (!fault_) return std::nullopt;
    return fault_->message;
}

std::optional<std::string> Outcome::error_type() const {
    if (!fault_) return std::nullopt;
    return fault_->type_name;
}

std::optional<ErrorKind> Outcome::error_kind() const {
    if (!fault_) return std::nullopt;
    return fault_->kind;
}

}  // namespace code_sandbox
