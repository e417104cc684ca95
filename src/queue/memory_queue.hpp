/**
 * @file memory_queue.hpp
 * @brief Non-persistent IJobQueue with the same lease semantics.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "queue/job_queue.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace code_sandbox {

class InMemoryJobQueue : public IJobQueue {
public:
    explicit InMemoryJobQueue(QueueOptions options);

    Result<void> enqueue(const Job& job) override;
    Result<std::optional<ClaimedJob>> claim() override;
    Result<void> ack(const JobId& id) override;
    Result<void> nack(const JobId& id) override;
    Result<void> dead_letter(const JobId& id, std::string_view reason) override;

    [[nodiscard]] bool has_claimable() const override;
    [[nodiscard]] size_t ready_count() const override;
    [[nodiscard]] size_t in_flight_count() const override;
    [[nodiscard]] size_t dead_count() const override;

    struct DeadLetter {
        Job job;
        std::string reason;
    };

    /// Snapshot of the dead-letter list (tests and diagnostics).
    [[nodiscard]] std::vector<DeadLetter> dead_letters() const;

private:
    struct Lease {
        Job job;
        SteadyTime leased_at;
    };

    void reclaim_expired_locked(SteadyTime now);
    void retire_locked(Job job, std::string reason);

    QueueOptions options_;
    std::deque<Job> ready_;
    std::unordered_map<JobId, Lease> claimed_;
    std::vector<DeadLetter> dead_;
    mutable std::mutex mutex_;
};

}  // namespace code_sandbox
