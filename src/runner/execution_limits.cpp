/**
 * @file execution_limits.cpp
 * @brief ExecutionLimits construction and timeout clamping.
 * @author Dimitris Kafetzis
 */

#include "runner/execution_limits.hpp"

#include <algorithm>

namespace code_sandbox {

ExecutionLimits ExecutionLimits::from_config(const ExecutionConfig& config) {
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    return ExecutionLimits{
        .interpreter = config.interpreter,
        .default_timeout = std::chrono::duration_cast<milliseconds>(
            seconds(config.default_timeout_seconds)),
        .max_timeout = std::chrono::duration_cast<milliseconds>(
            seconds(config.max_timeout_seconds)),
        .memory_bytes = config.memory_limit_mb * 1024 * 1024,
        .max_output_bytes = config.max_output_bytes,
        .max_processes = config.max_processes,
        .concurrency_limit = config.concurrency_limit,
        .slot_wait = milliseconds(config.slot_wait_ms),
        .network_isolation = config.network_isolation == "best_effort"
            ? NetworkIsolation::BestEffort
            : NetworkIsolation::Required,
        .work_dir = config.work_dir,
        .visible_paths = {config.visible_paths.begin(), config.visible_paths.end()},
    };
}

std::chrono::milliseconds ExecutionLimits::clamp_timeout(
    std::optional<std::chrono::milliseconds> requested) const noexcept {
    auto timeout = requested.value_or(default_timeout);
    if (timeout <= std::chrono::milliseconds::zero()) timeout = default_timeout;
    return std::min(timeout, max_timeout);
}

}  // namespace code_sandbox
