/**
 * @file dispatcher.hpp
 * @brief Sync and async dispatch of submissions.
 * @author Dimitris Kafetzis
 *
 *   dispatch_sync:   validate ──reject──► Outcome{rejected}
 *                       └──accept──► runner.run() ──► Outcome
 *
 *   dispatch_async:  validate ──reject──► AsyncReceipt{violations}
 *                       └──accept──► queue.enqueue(Job) ──► AsyncReceipt{job_id}
 *
 * Rejected source never reaches the runner or the queue. Template-
 * parameterized on RunnerT so tests can count runner invocations.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "queue/job_id.hpp"
#include "queue/job_queue.hpp"
#include "runner/execution_limits.hpp"
#include "telemetry/metrics_collector.hpp"
#include "validator/validator.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace code_sandbox {

/**
 * @brief Immediate answer to an async submission.
 *
 * Exactly one of job_id / violations is meaningful: a queued job, or the
 * reasons the source was refused.
 */
struct AsyncReceipt {
    std::optional<JobId> job_id;
    std::vector<Violation> violations;

    [[nodiscard]] bool queued() const noexcept { return job_id.has_value(); }
};

template <RunnerLike RunnerT>
class Dispatcher {
public:
    Dispatcher(const Validator& validator,
               RunnerT& runner,
               IJobQueue& queue,
               const ExecutionLimits& limits,
               Logger& logger,
               MetricsCollector& metrics)
        : validator_(validator)
        , runner_(runner)
        , queue_(queue)
        , limits_(limits)
        , logger_(logger)
        , metrics_(metrics) {}

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Validate then execute inline.
     *
     * An Error means the submission could not be executed at all (no
     * execution slot, sandbox setup failure); the caller reports it as a
     * dispatch failure.
     */
    Result<Outcome> dispatch_sync(Submission submission) {
        submission.timeout = limits_.clamp_timeout(submission.timeout);

        auto verdict = validator_.validate(submission.source);
        if (!verdict) {
            metrics_.record_rejection(DispatchPath::Sync, verdict.error().size());
            return Outcome::make_rejected(std::move(verdict.error()));
        }

        Result<Outcome> outcome = Error{ErrorCode::Internal, "Runner did not produce an outcome"};
        try {
            outcome = runner_.run(submission);
        } catch (const std::exception& e) {
            outcome = Error{ErrorCode::Internal, std::string("Runner raised: ") + e.what()};
        }

        if (!outcome) {
            logger_.error("Sync dispatch failed: " + outcome.error().message);
            return outcome.error();
        }
        metrics_.record_execution(DispatchPath::Sync, *outcome);
        return outcome;
    }

    /**
     * @brief Validate, then enqueue a Job without waiting for execution.
     *
     * Enqueue failures come back as an Error and nothing is queued.
     */
    Result<AsyncReceipt> dispatch_async(Submission submission, DeliveryHandle handle) {
        submission.timeout = limits_.clamp_timeout(submission.timeout);
        submission.delivery_handle = std::move(handle);

        auto verdict = validator_.validate(submission.source);
        if (!verdict) {
            metrics_.record_rejection(DispatchPath::Async, verdict.error().size());
            return AsyncReceipt{.job_id = std::nullopt, .violations = std::move(verdict.error())};
        }

        Job job{
            .id = generate_job_id(),
            .submission = std::move(submission),
            .enqueued_at = std::chrono::system_clock::now(),
            .attempt = 0,
        };

        if (auto queued = queue_.enqueue(job); !queued) {
            logger_.for_job(job.id).error("Enqueue failed: " + queued.error().message);
            return queued.error();
        }

        logger_.for_job(job.id).debug("Queued");
        metrics_.record_job_enqueued(job.id);
        return AsyncReceipt{.job_id = job.id, .violations = {}};
    }

    /// Validation only; no execution, no queueing.
    [[nodiscard]] std::vector<Violation> check(std::string_view source) const {
        auto verdict = validator_.validate(source);
        if (verdict) return {};
        return verdict.error();
    }

private:
    const Validator& validator_;
    RunnerT& runner_;
    IJobQueue& queue_;
    ExecutionLimits limits_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

}  // namespace code_sandbox
