/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace code_sandbox {

enum class DispatchPath : uint8_t {
    Sync,
    Async,
    Worker
};

[[nodiscard]] constexpr std::string_view to_string(DispatchPath path) noexcept {
    switch (path) {
        case DispatchPath::Sync:   return "sync";
        case DispatchPath::Async:  return "async";
        case DispatchPath::Worker: return "worker";
    }
    return "unknown";
}

/**
 * @brief Running totals, readable without parsing the event stream.
 */
struct MetricsSnapshot {
    uint64_t executions = 0;
    uint64_t rejections = 0;
    uint64_t enqueued = 0;
    uint64_t delivered = 0;
    uint64_t dead_lettered = 0;
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution(DispatchPath path, const Outcome& outcome);
    void record_rejection(DispatchPath path, size_t violation_count);
    void record_job_enqueued(const JobId& id);
    void record_job_delivered(const JobId& id, uint32_t attempt, bool recipient_gone);
    void record_job_dead_lettered(const JobId& id, std::string_view reason);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] MetricsSnapshot snapshot() const noexcept;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> rejections_{0};
    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dead_lettered_{0};

    void emit(std::string_view json_line);
};

}  // namespace code_sandbox
