/**
 * @file runner.hpp
 * @brief Executes validator-accepted source in a fresh sandboxed interpreter.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "runner/execution_limits.hpp"
#include "runner/execution_slots.hpp"
#include "runner/sandbox_process.hpp"
#include "validator/security_policy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace code_sandbox {

/**
 * @brief Process-per-execution runner.
 *
 * Every call holds one ExecutionSlots slot for the lifetime of its child
 * process. Faults of the user code come back as Outcome states; an Error is
 * returned only for infrastructure failures (no free slot, sandbox setup,
 * supervisor I/O).
 */
class Runner {
public:
    Runner(ExecutionLimits limits, std::shared_ptr<const SecurityPolicy> policy, Logger& logger);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    /// Sync path: waits at most limits().slot_wait for a slot.
    [[nodiscard]] Result<Outcome> run(const Submission& submission);

    /// Worker path: runs under a slot the caller took from slots() before claiming.
    [[nodiscard]] Result<Outcome> run_in_slot(const Submission& submission, ExecutionSlots::Slot slot);

    [[nodiscard]] const ExecutionLimits& limits() const noexcept { return limits_; }
    [[nodiscard]] ExecutionSlots& slots() noexcept { return slots_; }

private:
    Result<Outcome> execute(const Submission& submission);
    [[nodiscard]] Outcome interpret(ProcessReport report, std::chrono::milliseconds timeout) const;

    ExecutionLimits limits_;
    std::shared_ptr<const SecurityPolicy> policy_;
    Logger& logger_;
    ExecutionSlots slots_;
    std::vector<std::string> arguments_;
};

static_assert(RunnerLike<Runner>);

}  // namespace code_sandbox
