/**
 * @file worker_pool.hpp
 * @brief std::jthread workers that drain the job queue.
 * @author Dimitris Kafetzis
 *
 * Each worker loops: take an execution slot, claim one job, re-validate,
 * run, publish, ack.
 *
 *   undecodable record        → dead_letter
 *   no delivery handle        → logged, acked (dropped)
 *   published                 → ack
 *   recipient gone            → logged, acked (result lost, never retried)
 *   channel unavailable       → nack (queue redelivers)
 *   unexpected exception      → logged, nack
 *
 * The slot is taken before the claim. A claimed job therefore starts
 * running at once and its lease never expires while it waits for
 * capacity; a worker stopped while waiting has claimed nothing. Slots are
 * shared with the sync path through the runner, so workers never push the
 * number of live sandboxes past the configured ceiling.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "notify/notification_channel.hpp"
#include "protocol/wire_codec.hpp"
#include "queue/job_queue.hpp"
#include "telemetry/metrics_collector.hpp"
#include "validator/validator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace code_sandbox {

struct WorkerPoolOptions {
    uint32_t worker_count = 2;
    std::chrono::milliseconds poll_interval{50};   ///< Idle wait between empty claims
};

template <RunnerLike RunnerT>
class WorkerPool {
public:
    WorkerPool(WorkerPoolOptions options,
               const Validator& validator,
               RunnerT& runner,
               IJobQueue& queue,
               INotificationChannel& channel,
               Logger& logger,
               MetricsCollector& metrics)
        : options_(options)
        , validator_(validator)
        , runner_(runner)
        , queue_(queue)
        , channel_(channel)
        , logger_(logger)
        , metrics_(metrics) {}

    ~WorkerPool() { stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // ── Lifecycle ────────────────────────────

    void start() {
        if (running_.exchange(true)) return;
        workers_.reserve(options_.worker_count);
        for (uint32_t i = 0; i < options_.worker_count; ++i) {
            workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
        }
        logger_.info("Worker pool started: workers=" + std::to_string(options_.worker_count));
    }

    /// Stop claiming; in-flight jobs run to completion before this returns.
    void stop() {
        if (!running_.exchange(false)) return;
        for (auto& worker : workers_) {
            worker.request_stop();
        }
        wake_cv_.notify_all();
        workers_.clear();  // joins
        logger_.info("Worker pool stopped");
    }

    /// Cut the idle wait short after new work was enqueued.
    void wake() {
        {
            std::lock_guard lock(wake_mutex_);
            work_hint_ = true;
        }
        wake_cv_.notify_one();
    }

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    /// Workers waiting for a slot or holding a job.
    [[nodiscard]] size_t busy_count() const noexcept { return busy_.load(); }

    /**
     * @brief Claim and fully handle one job on the calling thread.
     *
     * Blocks for an execution slot first; the slot goes back unused when
     * another worker won the race for the job. An empty queue is seen
     * before any slot is taken, so idle workers never crowd out sync runs.
     * @return false when the queue had nothing ready or `stop` fired first.
     */
    bool process_next(std::stop_token stop = {}) {
        if (!queue_.has_claimable()) return false;

        BusyMark mark(busy_);
        auto slot = runner_.slots().acquire(stop);
        if (!slot) return false;

        auto claimed = queue_.claim();
        if (!claimed) {
            logger_.error("Queue claim failed: " + claimed.error().message);
            return false;
        }
        if (!claimed->has_value()) return false;

        handle(std::move(**claimed), std::move(*slot));
        return true;
    }

private:
    struct BusyMark {
        explicit BusyMark(std::atomic<size_t>& count) : count_(count) { ++count_; }
        ~BusyMark() { --count_; }
        BusyMark(const BusyMark&) = delete;
        BusyMark& operator=(const BusyMark&) = delete;

        std::atomic<size_t>& count_;
    };

    void worker_loop(std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (process_next(stop)) continue;

            std::unique_lock lock(wake_mutex_);
            static_cast<void>(wake_cv_.wait_for(lock, stop, options_.poll_interval,
                                                [this] { return work_hint_; }));
            work_hint_ = false;
        }
    }

    void handle(ClaimedJob claimed, ExecutionSlots::Slot slot) {
        auto log = logger_.for_job(claimed.id);
        if (!claimed.job) {
            log.error("Dead-lettering undecodable record: " + claimed.job.error().message);
            settle(log, queue_.dead_letter(claimed.id, claimed.job.error().message));
            metrics_.record_job_dead_lettered(claimed.id, claimed.job.error().message);
            return;
        }

        try {
            deliver(log, *claimed.job, std::move(slot));
        } catch (const std::exception& e) {
            log.error(std::string("Failed: ") + e.what());
            settle(log, queue_.nack(claimed.id));
        }
    }

    void deliver(JobLogger& log, const Job& job, ExecutionSlots::Slot slot) {
        if (!job.submission.delivery_handle) {
            log.error("No delivery handle; dropping job");
            settle(log, queue_.ack(job.id));
            return;
        }
        const auto& handle = *job.submission.delivery_handle;
        log.info("Processing attempt " + std::to_string(job.attempt));

        auto outcome = execute(log, job, std::move(slot));
        auto published = channel_.publish(handle, encode_delivery(Delivery{job.id, outcome}));
        if (published) {
            log.info("Delivered result");
            metrics_.record_job_delivered(job.id, job.attempt, false);
            settle(log, queue_.ack(job.id));
        } else if (published.error().code == ErrorCode::ChannelGone) {
            log.warn("Recipient gone, result dropped: " + published.error().message);
            metrics_.record_job_delivered(job.id, job.attempt, true);
            settle(log, queue_.ack(job.id));
        } else {
            log.error("Delivery failed: " + published.error().message);
            settle(log, queue_.nack(job.id));
        }
    }

    Outcome execute(JobLogger& log, const Job& job, ExecutionSlots::Slot slot) {
        // Queue records are not trusted to have passed validation
        auto verdict = validator_.validate(job.submission.source);
        if (!verdict) {
            log.warn("Failed re-validation");
            metrics_.record_rejection(DispatchPath::Worker, verdict.error().size());
            return Outcome::make_rejected(std::move(verdict.error()));
        }

        auto outcome = runner_.run_in_slot(job.submission, std::move(slot));
        if (!outcome) {
            log.error("Execution failed: " + outcome.error().message);
            return Outcome::make_fault(
                Fault{
                    .kind = ErrorKind::Uncategorized,
                    .type_name = std::string(kDispatchFailureType),
                    .message = "Internal execution error: " + outcome.error().message,
                },
                CapturedOutput{}, Duration{0});
        }

        metrics_.record_execution(DispatchPath::Worker, *outcome);
        return std::move(*outcome);
    }

    static void settle(JobLogger& log, const Result<void>& result) {
        if (!result) {
            log.warn("Queue settlement failed: " + result.error().message);
        }
    }

    WorkerPoolOptions options_;
    const Validator& validator_;
    RunnerT& runner_;
    IJobQueue& queue_;
    INotificationChannel& channel_;
    Logger& logger_;
    MetricsCollector& metrics_;

    std::vector<std::jthread> workers_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool work_hint_{false};
    std::atomic<bool> running_{false};
    std::atomic<size_t> busy_{0};
};

}  // namespace code_sandbox
