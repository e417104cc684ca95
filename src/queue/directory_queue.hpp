/**
 * @file directory_queue.hpp
 * @brief Durable IJobQueue backed by a spool directory.
 * @author Dimitris Kafetzis
 *
 * Layout under the root:
 *
 *   tmp/      records being written
 *   ready/    published, waiting for a worker
 *   claimed/  leased; the file's mtime is the lease start
 *   dead/     dead letters, with a <id>.reason sidecar
 *
 * Every state change is a rename(2) within one filesystem, so a record is
 * always in exactly one directory and concurrent claimers race safely: the
 * loser's rename fails and it moves on. The queue survives restarts; jobs
 * left in claimed/ by a crashed process are redelivered once their lease
 * expires.
 */

#pragma once

#include "queue/job_queue.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace code_sandbox {

class DirectoryJobQueue : public IJobQueue {
public:
    /// Creates the directory layout; Io error when that fails.
    static Result<std::unique_ptr<DirectoryJobQueue>> open(const std::filesystem::path& root,
                                                          QueueOptions options);

    Result<void> enqueue(const Job& job) override;
    Result<std::optional<ClaimedJob>> claim() override;
    Result<void> ack(const JobId& id) override;
    Result<void> nack(const JobId& id) override;
    Result<void> dead_letter(const JobId& id, std::string_view reason) override;

    [[nodiscard]] bool has_claimable() const override;
    [[nodiscard]] size_t ready_count() const override;
    [[nodiscard]] size_t in_flight_count() const override;
    [[nodiscard]] size_t dead_count() const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    DirectoryJobQueue(std::filesystem::path root, QueueOptions options);

    [[nodiscard]] std::filesystem::path record_path(std::string_view state, const JobId& id) const;
    [[nodiscard]] size_t count_records(std::string_view state) const;
    [[nodiscard]] std::vector<std::filesystem::path> expired_leases() const;

    Result<void> write_record(const std::filesystem::path& target, std::string_view contents) const;
    Result<void> retire(const JobId& id, std::string_view reason);
    Result<void> release(const JobId& id, uint32_t attempt);
    void reclaim_expired();

    std::filesystem::path root_;
    QueueOptions options_;
    mutable std::mutex mutex_;
};

}  // namespace code_sandbox
