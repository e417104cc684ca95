/**
 * @file memory_queue.cpp
 * @brief InMemoryJobQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "queue/memory_queue.hpp"

#include <algorithm>
#include <format>

namespace code_sandbox {

InMemoryJobQueue::InMemoryJobQueue(QueueOptions options)
    : options_(options) {}

Result<void> InMemoryJobQueue::enqueue(const Job& job) {
    std::lock_guard lock(mutex_);
    if (ready_.size() + claimed_.size() >= options_.capacity) {
        return Error{ErrorCode::QueueUnavailable,
                     std::format("Queue is full (capacity {})", options_.capacity)};
    }
    ready_.push_back(job);
    return Result<void>{};
}

Result<std::optional<ClaimedJob>> InMemoryJobQueue::claim() {
    std::lock_guard lock(mutex_);
    reclaim_expired_locked(std::chrono::steady_clock::now());

    while (!ready_.empty()) {
        Job job = std::move(ready_.front());
        ready_.pop_front();

        ++job.attempt;
        if (job.attempt > options_.max_delivery_attempts) {
            retire_locked(std::move(job), "delivery attempts exhausted");
            continue;
        }

        ClaimedJob claimed{.id = job.id, .attempt = job.attempt, .job = job};
        claimed_.insert_or_assign(job.id, Lease{std::move(job), std::chrono::steady_clock::now()});
        return std::optional<ClaimedJob>(std::move(claimed));
    }
    return std::optional<ClaimedJob>{};
}

Result<void> InMemoryJobQueue::ack(const JobId& id) {
    std::lock_guard lock(mutex_);
    if (claimed_.erase(id) == 0) {
        return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};
    }
    return Result<void>{};
}

Result<void> InMemoryJobQueue::nack(const JobId& id) {
    std::lock_guard lock(mutex_);
    auto it = claimed_.find(id);
    if (it == claimed_.end()) {
        return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};
    }
    Job job = std::move(it->second.job);
    claimed_.erase(it);

    if (job.attempt >= options_.max_delivery_attempts) {
        retire_locked(std::move(job), "delivery attempts exhausted");
    } else {
        ready_.push_back(std::move(job));
    }
    return Result<void>{};
}

Result<void> InMemoryJobQueue::dead_letter(const JobId& id, std::string_view reason) {
    std::lock_guard lock(mutex_);
    auto it = claimed_.find(id);
    if (it == claimed_.end()) {
        return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};
    }
    Job job = std::move(it->second.job);
    claimed_.erase(it);
    retire_locked(std::move(job), std::string(reason));
    return Result<void>{};
}

bool InMemoryJobQueue::has_claimable() const {
    std::lock_guard lock(mutex_);
    if (!ready_.empty()) return true;
    const auto now = std::chrono::steady_clock::now();
    return std::any_of(claimed_.begin(), claimed_.end(), [&](const auto& entry) {
        return now - entry.second.leased_at >= options_.visibility_timeout;
    });
}

size_t InMemoryJobQueue::ready_count() const {
    std::lock_guard lock(mutex_);
    return ready_.size();
}

size_t InMemoryJobQueue::in_flight_count() const {
    std::lock_guard lock(mutex_);
    return claimed_.size();
}

size_t InMemoryJobQueue::dead_count() const {
    std::lock_guard lock(mutex_);
    return dead_.size();
}

std::vector<InMemoryJobQueue::DeadLetter> InMemoryJobQueue::dead_letters() const {
    std::lock_guard lock(mutex_);
    return dead_;
}

void InMemoryJobQueue::reclaim_expired_locked(SteadyTime now) {
    for (auto it = claimed_.begin(); it != claimed_.end();) {
        if (now - it->second.leased_at < options_.visibility_timeout) {
            ++it;
            continue;
        }
        Job job = std::move(it->second.job);
        it = claimed_.erase(it);
        if (job.attempt >= options_.max_delivery_attempts) {
            retire_locked(std::move(job), "lease expired on final attempt");
        } else {
            ready_.push_back(std::move(job));
        }
    }
}

void InMemoryJobQueue::retire_locked(Job job, std::string reason) {
    dead_.push_back(DeadLetter{std::move(job), std::move(reason)});
}

}  // namespace code_sandbox
