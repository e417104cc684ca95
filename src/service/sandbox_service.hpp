/**
 * @file sandbox_service.hpp
 * @brief Top-level SandboxService facade tying all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Answering protocol requests (execute / execute_async / validate)
 *   2. Running the worker pool that drains the job queue
 *   3. Exposing logger, metrics and queue state
 *
 * Template-parameterized on RunnerT for testability (Runner or ScriptedRunner). A
 * RunnerT must be constructible from (ExecutionLimits,
 * shared_ptr<const SecurityPolicy>, Logger&).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/worker_pool.hpp"
#include "notify/notification_channel.hpp"
#include "protocol/wire_codec.hpp"
#include "queue/job_queue.hpp"
#include "runner/execution_limits.hpp"
#include "runner/runner.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "validator/security_policy.hpp"
#include "validator/validator.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace code_sandbox {

template <RunnerLike RunnerT = Runner>
class SandboxService {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;   ///< nullptr discards metrics
        LogLevel log_level = LogLevel::Info;
    };

    SandboxService(Options opts, INotificationChannel& channel);
    ~SandboxService();

    // Non-copyable, non-movable
    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Requests ─────────────────────────────

    /// One request line in, one response line out. Never throws.
    std::string handle_request(std::string_view line);

    Result<Outcome> execute(std::string source, std::optional<std::chrono::milliseconds> timeout);

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    RunnerT& runner() { return runner_; }
    const Validator& validator() const { return validator_; }
    const Config& config() const { return config_; }
    IJobQueue* queue() { return queue_.get(); }
    WorkerPool<RunnerT>* workers() { return workers_.get(); }

private:
    std::string handle_async(Request request);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    std::shared_ptr<const SecurityPolicy> policy_;
    ExecutionLimits limits_;
    Validator validator_;
    RunnerT runner_;
    INotificationChannel& channel_;

    std::unique_ptr<IJobQueue> queue_;
    std::unique_ptr<Dispatcher<RunnerT>> dispatcher_;
    std::unique_ptr<WorkerPool<RunnerT>> workers_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <RunnerLike RunnerT>
SandboxService<RunnerT>::SandboxService(Options opts, INotificationChannel& channel)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , metrics_(opts.metrics_sink ? std::move(opts.metrics_sink) : std::make_unique<NullSink>())
    , policy_(SecurityPolicy::from_config(config_.security))
    , limits_(ExecutionLimits::from_config(config_.execution))
    , validator_(policy_)
    , runner_(limits_, policy_, logger_)
    , channel_(channel) {
}

template <RunnerLike RunnerT>
SandboxService<RunnerT>::~SandboxService() {
    stop();
}

template <RunnerLike RunnerT>
Result<void> SandboxService<RunnerT>::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load()) {
        return Error{"Already running"};
    }

    logger_.info("CodeSandbox starting: interpreter=" + config_.execution.interpreter.string()
                 + " concurrency=" + std::to_string(limits_.concurrency_limit)
                 + " isolation=" + std::string(to_string(limits_.network_isolation)));

    auto queue = make_job_queue(config_.queue);
    if (!queue) {
        logger_.error("Could not open job queue: " + queue.error().message);
        return queue.error();
    }
    queue_ = std::move(*queue);
    logger_.info("Job queue ready: backend=" + config_.queue.backend
                 + " ready=" + std::to_string(queue_->ready_count())
                 + " in_flight=" + std::to_string(queue_->in_flight_count()));

    dispatcher_ = std::make_unique<Dispatcher<RunnerT>>(validator_, runner_, *queue_, limits_,
                                                        logger_, metrics_);

    WorkerPoolOptions pool_options{.worker_count = config_.queue.worker_count};
    workers_ = std::make_unique<WorkerPool<RunnerT>>(pool_options, validator_, runner_, *queue_,
                                                     channel_, logger_, metrics_);
    if (pool_options.worker_count > 0) {
        workers_->start();
    }

    running_.store(true);
    metrics_.record_custom("service_started",
                           std::format(R"({{"workers":{},"concurrency":{},"backend":"{}"}})",
                                       pool_options.worker_count, limits_.concurrency_limit,
                                       config_.queue.backend));
    logger_.info("CodeSandbox started successfully");
    return Result<void>{};
}

template <RunnerLike RunnerT>
void SandboxService<RunnerT>::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.exchange(false)) return;

    logger_.info("CodeSandbox shutting down...");
    if (workers_) workers_->stop();
    metrics_.flush();
    logger_.info("CodeSandbox stopped");
    logger_.flush();
}

template <RunnerLike RunnerT>
Result<Outcome> SandboxService<RunnerT>::execute(std::string source,
                                                std::optional<std::chrono::milliseconds> timeout) {
    if (!running_.load()) {
        return Error{ErrorCode::QueueUnavailable, "Service is not running"};
    }
    return dispatcher_->dispatch_sync(Submission{
        .source = std::move(source),
        .timeout = timeout.value_or(std::chrono::milliseconds::zero()),
        .delivery_handle = std::nullopt,
    });
}

template <RunnerLike RunnerT>
std::string SandboxService<RunnerT>::handle_request(std::string_view line) {
    auto request = decode_request(line);
    if (!request) {
        logger_.warn("Rejected request: " + request.error().message);
        return encode_error_response(kInvalidRequestType, request.error().message);
    }

    try {
        switch (request->action) {
            case RequestAction::Validate:
                if (!running_.load()) {
                    return encode_error_response(kDispatchFailureType, "Service is not running");
                }
                return encode_validation_response(dispatcher_->check(request->code));

            case RequestAction::Execute: {
                auto outcome = execute(std::move(request->code), request->timeout);
                if (!outcome) {
                    return encode_error_response(kDispatchFailureType, outcome.error().message);
                }
                return encode_execution_response(*outcome);
            }

            case RequestAction::ExecuteAsync:
                return handle_async(std::move(*request));
        }
    } catch (const std::exception& e) {
        logger_.error(std::string("Request handling failed: ") + e.what());
        return encode_error_response(kDispatchFailureType, std::string("Internal error: ") + e.what());
    }
    return encode_error_response(kInvalidRequestType, "Invalid request: unknown action");
}

template <RunnerLike RunnerT>
std::string SandboxService<RunnerT>::handle_async(Request request) {
    if (!running_.load()) {
        return encode_error_response(kDispatchFailureType, "Service is not running");
    }

    auto receipt = dispatcher_->dispatch_async(
        Submission{
            .source = std::move(request.code),
            .timeout = request.timeout.value_or(std::chrono::milliseconds::zero()),
            .delivery_handle = std::nullopt,
        },
        std::move(*request.delivery_handle));

    if (!receipt) {
        return encode_error_response(kDispatchFailureType, receipt.error().message);
    }
    if (!receipt->queued()) {
        // Rejections are answered inline; nothing was queued
        return encode_execution_response(Outcome::make_rejected(std::move(receipt->violations)));
    }

    workers_->wake();
    return encode_queued_response(*receipt->job_id);
}

}  // namespace code_sandbox
