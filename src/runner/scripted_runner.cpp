/**
 * @file scripted_runner.cpp
 * @brief ScriptedRunner implementation.
 * @author Dimitris Kafetzis
 */

#include "runner/scripted_runner.hpp"

#include <format>
#include <optional>
#include <thread>
#include <utility>

namespace code_sandbox {

ScriptedRunner::ScriptedRunner(ExecutionLimits limits,
                               std::shared_ptr<const SecurityPolicy> /*policy*/,
                               Logger& logger)
    : limits_(std::move(limits))
    , logger_(logger)
    , slots_(limits_.concurrency_limit) {}

Result<Outcome> ScriptedRunner::run(const Submission& submission) {
    auto slot = slots_.try_acquire_for(limits_.slot_wait);
    if (!slot) {
        return Error{ErrorCode::CapacityExhausted,
                     std::format("All {} execution slots are busy", slots_.capacity())};
    }
    return execute(submission);
}

Result<Outcome> ScriptedRunner::run_in_slot(const Submission& submission, ExecutionSlots::Slot slot) {
    auto held = std::move(slot);
    return execute(submission);
}

void ScriptedRunner::push_result(Result<Outcome> result) {
    std::lock_guard lock(mutex_);
    scripted_.push_back(std::move(result));
}

void ScriptedRunner::set_script(Script script) {
    std::lock_guard lock(mutex_);
    script_ = std::move(script);
}

void ScriptedRunner::set_execution_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    delay_ = delay;
}

std::vector<Submission> ScriptedRunner::submissions() const {
    std::lock_guard lock(mutex_);
    return seen_;
}

Result<Outcome> ScriptedRunner::execute(const Submission& submission) {
    ++calls_;

    std::chrono::milliseconds delay;
    Script script;
    std::optional<Result<Outcome>> next;
    {
        std::lock_guard lock(mutex_);
        seen_.push_back(submission);
        delay = delay_;
        script = script_;
        if (!scripted_.empty()) {
            next.emplace(std::move(scripted_.front()));
            scripted_.pop_front();
        }
    }

    logger_.debug("Scripted execution of " + std::to_string(submission.source.size()) + " bytes");
    if (delay > std::chrono::milliseconds::zero()) {
        std::this_thread::sleep_for(delay);
    }

    if (next) return std::move(*next);
    if (script) return script(submission);
    return Outcome::make_completed(CapturedOutput{submission.source, ""},
                                   std::chrono::duration_cast<Duration>(delay));
}

}  // namespace code_sandbox
