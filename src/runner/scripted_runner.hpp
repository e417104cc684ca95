/**
 * @file scripted_runner.hpp
 * @brief Runner stand-in that returns scripted outcomes without spawning processes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "runner/execution_limits.hpp"
#include "runner/execution_slots.hpp"
#include "validator/security_policy.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace code_sandbox {

// ─────────────────────────────────────────────
// ScriptedRunner
// ─────────────────────────────────────────────

/**
 * @brief Scripted runner for testing and simulation.
 *
 * Holds the same ExecutionSlots discipline as Runner, so concurrency
 * ceilings behave identically, but answers from a queue of scripted
 * results (or echoes the source to stdout when the script is empty).
 * Satisfies RunnerLike.
 */
class ScriptedRunner {
public:
    using Script = std::function<Result<Outcome>(const Submission&)>;

    ScriptedRunner(ExecutionLimits limits, std::shared_ptr<const SecurityPolicy> policy, Logger& logger);

    // RunnerLike interface
    Result<Outcome> run(const Submission& submission);
    Result<Outcome> run_in_slot(const Submission& submission, ExecutionSlots::Slot slot);

    // Test helpers
    void push_result(Result<Outcome> result);
    void set_script(Script script);
    void set_execution_delay(std::chrono::milliseconds delay);

    [[nodiscard]] size_t call_count() const noexcept { return calls_.load(); }
    [[nodiscard]] std::vector<Submission> submissions() const;
    [[nodiscard]] const ExecutionLimits& limits() const noexcept { return limits_; }
    [[nodiscard]] ExecutionSlots& slots() noexcept { return slots_; }

private:
    Result<Outcome> execute(const Submission& submission);

    ExecutionLimits limits_;
    Logger& logger_;
    ExecutionSlots slots_;

    mutable std::mutex mutex_;
    std::deque<Result<Outcome>> scripted_;
    Script script_;
    std::chrono::milliseconds delay_{0};
    std::vector<Submission> seen_;
    std::atomic<size_t> calls_{0};
};

static_assert(RunnerLike<ScriptedRunner>);

}  // namespace code_sandbox
