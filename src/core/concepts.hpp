/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for CodeSandbox interfaces.
 * @author Dimitris Kafetzis
 *
 * The dispatch layer is templated on its runner so tests can substitute a
 * counting spy for the process-spawning Runner without virtual dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "runner/execution_slots.hpp"

#include <concepts>
#include <utility>

namespace code_sandbox {

// ─────────────────────────────────────────────
// RunnerLike
// ─────────────────────────────────────────────

/**
 * @concept RunnerLike
 * @brief Constrains types that can execute accepted source.
 *
 * run() is the sync path: it may fail fast with CapacityExhausted when no
 * execution slot frees up in time. Workers take a slot from slots() first
 * and only then claim a job, handing the slot to run_in_slot(), so a lease
 * never ticks while its job waits for capacity.
 */
template <typename T>
concept RunnerLike = requires(T runner, const Submission& submission, ExecutionSlots::Slot slot) {
    { runner.run(submission) } -> std::same_as<Result<Outcome>>;
    { runner.run_in_slot(submission, std::move(slot)) } -> std::same_as<Result<Outcome>>;
    { runner.slots() } -> std::same_as<ExecutionSlots&>;
};

}  // namespace code_sandbox
