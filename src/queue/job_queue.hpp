/**
 * @file job_queue.hpp
 * @brief Job queue interface with lease-based at-least-once delivery.
 * @author Dimitris Kafetzis
 *
 * Lifecycle of one job:
 *
 *   enqueue ──► ready ──claim──► claimed ──ack──► (gone)
 *                 ▲                 │
 *                 └──nack / lease───┤
 *                      expiry       └──attempts exhausted / dead_letter──► dead
 *
 * claim() increments the attempt count. A claimed job whose lease is not
 * acked within the visibility timeout becomes ready again, so a worker
 * crash never loses it; redelivery means consumers must tolerate
 * duplicates.
 *
 * Backends use virtual dispatch; the backend is selected from configuration
 * once at startup.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace code_sandbox {

struct QueueOptions {
    uint32_t capacity = 1024;
    std::chrono::milliseconds visibility_timeout{60000};
    uint32_t max_delivery_attempts = 3;

    static QueueOptions from_config(const QueueConfig& config);
};

/**
 * @brief One leased job.
 *
 * `job` holds an Error when the stored record could not be decoded; the
 * consumer is expected to dead-letter such a lease rather than retry it.
 */
struct ClaimedJob {
    JobId id;
    uint32_t attempt;
    Result<Job> job;
};

class IJobQueue {
public:
    virtual ~IJobQueue() = default;

    /// QueueUnavailable when full or when the backing store fails.
    virtual Result<void> enqueue(const Job& job) = 0;

    /// Non-blocking; nullopt when nothing is ready.
    virtual Result<std::optional<ClaimedJob>> claim() = 0;

    virtual Result<void> ack(const JobId& id) = 0;

    /// Return a claimed job for redelivery, or dead-letter it when its
    /// attempts are exhausted.
    virtual Result<void> nack(const JobId& id) = 0;

    virtual Result<void> dead_letter(const JobId& id, std::string_view reason) = 0;

    /// True when claim() would find a ready job or an expired lease to reclaim.
    [[nodiscard]] virtual bool has_claimable() const = 0;

    [[nodiscard]] virtual size_t ready_count() const = 0;
    [[nodiscard]] virtual size_t in_flight_count() const = 0;
    [[nodiscard]] virtual size_t dead_count() const = 0;
};

/**
 * @brief Build the backend named by `queue.backend` ("directory" or "memory").
 */
Result<std::unique_ptr<IJobQueue>> make_job_queue(const QueueConfig& config);

}  // namespace code_sandbox
