/**
 * @file execution_limits.hpp
 * @brief Immutable per-execution ceilings derived from ExecutionConfig.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace code_sandbox {

/// Policy for the child's private user, mount and network namespaces.
enum class NetworkIsolation : uint8_t {
    Required,     ///< Fail the execution when the namespaces or the private root cannot be set up
    BestEffort    ///< Run anyway, relying on rlimits and the runtime guard
};

[[nodiscard]] constexpr std::string_view to_string(NetworkIsolation mode) noexcept {
    switch (mode) {
        case NetworkIsolation::Required:   return "required";
        case NetworkIsolation::BestEffort: return "best_effort";
    }
    return "unknown";
}

struct ExecutionLimits {
    std::filesystem::path interpreter;
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds max_timeout{30000};
    uint64_t memory_bytes = 256ULL * 1024 * 1024;
    uint64_t max_output_bytes = 65536;
    uint32_t max_processes = 1;
    uint32_t concurrency_limit = 4;
    std::chrono::milliseconds slot_wait{0};
    NetworkIsolation network_isolation = NetworkIsolation::Required;
    std::filesystem::path work_dir;
    std::vector<std::filesystem::path> visible_paths;

    static ExecutionLimits from_config(const ExecutionConfig& config);

    /**
     * @brief Effective wall-clock ceiling for one execution.
     *
     * A missing request uses the default; anything above the configured
     * maximum is clamped down to it.
     */
    [[nodiscard]] std::chrono::milliseconds clamp_timeout(
        std::optional<std::chrono::milliseconds> requested) const noexcept;
};

}  // namespace code_sandbox
