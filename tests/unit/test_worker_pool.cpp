/**
 * @file test_worker_pool.cpp
 * @brief Tests for WorkerPool job handling and delivery.
 */

#include "dispatch/worker_pool.hpp"
#include "queue/directory_queue.hpp"
#include "queue/memory_queue.hpp"
#include "runner/scripted_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace code_sandbox;
using namespace std::chrono_literals;

namespace {

/// Channel whose publish result is chosen by the test.
class FailingChannel : public INotificationChannel {
public:
    explicit FailingChannel(ErrorCode code) : code_(code) {}
    Result<void> publish(const DeliveryHandle&, std::string_view) override {
        ++attempts;
        return Error{code_, "channel down"};
    }
    int attempts = 0;

private:
    ErrorCode code_;
};

Job make_job(std::string id, std::string source, std::optional<DeliveryHandle> handle = "client-1") {
    return Job{
        .id = std::move(id),
        .submission = Submission{.source = std::move(source), .timeout = 1000ms,
                                 .delivery_handle = std::move(handle)},
        .enqueued_at = std::chrono::system_clock::now(),
        .attempt = 0,
    };
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<const SecurityPolicy> policy_ = SecurityPolicy::from_config(SecurityConfig{});
    ExecutionLimits limits_ = [] {
        ExecutionLimits limits;
        limits.concurrency_limit = 2;
        return limits;
    }();
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    Validator validator_{policy_};
    ScriptedRunner runner_{limits_, policy_, logger_};
    InMemoryJobQueue queue_{QueueOptions{.max_delivery_attempts = 2}};
    InMemoryNotificationChannel channel_;

    std::mutex received_mutex_;
    std::vector<nlohmann::json> received_;

    void listen(const DeliveryHandle& handle) {
        channel_.register_handle(handle, [this](std::string_view payload) {
            std::lock_guard lock(received_mutex_);
            received_.push_back(nlohmann::json::parse(payload));
        });
    }
};

TEST_F(WorkerPoolTest, EmptyQueueHasNothingToProcess) {
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);
    EXPECT_FALSE(pool.process_next());
}

TEST_F(WorkerPoolTest, DeliversResultAndAcks) {
    listen("client-1");
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "print('hi')")));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0]["type"], "execution_result");
    EXPECT_EQ(received_[0]["job_id"], "job-1");
    EXPECT_EQ(received_[0]["success"], true);
    EXPECT_EQ(runner_.call_count(), 1u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
    EXPECT_EQ(queue_.ready_count(), 0u);
    EXPECT_EQ(metrics_.snapshot().delivered, 1u);
}

TEST_F(WorkerPoolTest, RevalidatesQueuedSource) {
    listen("client-1");
    // Enqueued directly, bypassing the dispatcher's validation
    ASSERT_TRUE(queue_.enqueue(make_job("job-evil", "import subprocess")));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(runner_.call_count(), 0u);
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0]["success"], false);
    EXPECT_EQ(received_[0]["error_type"], "SecurityError");
    EXPECT_EQ(received_[0]["security_violations"].size(), 1u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
}

TEST_F(WorkerPoolTest, GoneRecipientDropsResult) {
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "x = 1", "nobody")));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(runner_.call_count(), 1u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
    EXPECT_EQ(queue_.ready_count(), 0u);
    EXPECT_EQ(queue_.dead_count(), 0u);
    EXPECT_EQ(metrics_.snapshot().delivered, 0u);
}

TEST_F(WorkerPoolTest, UnavailableChannelRequeuesUntilExhausted) {
    FailingChannel down(ErrorCode::ChannelUnavailable);
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "x = 1")));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, down,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(queue_.ready_count(), 1u);
    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(queue_.ready_count(), 0u);
    EXPECT_EQ(queue_.dead_count(), 1u);
    EXPECT_EQ(down.attempts, 2);
    EXPECT_EQ(runner_.call_count(), 2u);
}

TEST_F(WorkerPoolTest, MissingHandleIsDropped) {
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "x = 1", std::nullopt)));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(runner_.call_count(), 0u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
    EXPECT_EQ(queue_.ready_count(), 0u);
}

TEST_F(WorkerPoolTest, RunnerErrorIsDeliveredAsDispatchFailure) {
    listen("client-1");
    runner_.push_result(Error{ErrorCode::SandboxSetup, "fork failed"});
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "x = 1")));
    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);

    ASSERT_TRUE(pool.process_next());
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0]["success"], false);
    EXPECT_EQ(received_[0]["error_type"], "DispatchFailure");
    EXPECT_EQ(received_[0]["error"], "Internal execution error: fork failed");
    EXPECT_EQ(queue_.in_flight_count(), 0u);
}

TEST_F(WorkerPoolTest, StopWhileWaitingForSlotLeavesJobReady) {
    listen("client-1");
    ASSERT_TRUE(queue_.enqueue(make_job("job-1", "x = 1")));
    auto a = runner_.slots().try_acquire_for(0ms);
    auto b = runner_.slots().try_acquire_for(0ms);
    ASSERT_TRUE(a && b);

    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);
    std::stop_source stop;
    stop.request_stop();

    EXPECT_FALSE(pool.process_next(stop.get_token()));
    EXPECT_EQ(runner_.call_count(), 0u);
    EXPECT_TRUE(received_.empty());
    EXPECT_EQ(queue_.ready_count(), 1u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
}

TEST_F(WorkerPoolTest, IdleWorkerLeavesSlotsToSyncPath) {
    auto a = runner_.slots().try_acquire_for(0ms);
    auto b = runner_.slots().try_acquire_for(0ms);
    ASSERT_TRUE(a && b);

    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue_, channel_,
                                    logger_, metrics_);
    // Returns at once although every slot is taken
    EXPECT_FALSE(pool.process_next());
    EXPECT_EQ(pool.busy_count(), 0u);
    EXPECT_EQ(runner_.slots().in_use(), 2u);
}

TEST_F(WorkerPoolTest, LeaseDoesNotExpireWhileWaitingForSlot) {
    listen("client-1");
    ExecutionLimits single = limits_;
    single.concurrency_limit = 1;
    ScriptedRunner runner(single, policy_, logger_);
    InMemoryJobQueue queue(QueueOptions{.visibility_timeout = 100ms, .max_delivery_attempts = 3});
    ASSERT_TRUE(queue.enqueue(make_job("job-1", "x = 1")));

    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner, queue, channel_,
                                    logger_, metrics_);
    auto held = runner.slots().try_acquire_for(0ms);
    ASSERT_TRUE(held);

    std::atomic<int> processed{0};
    auto work = [&] { if (pool.process_next()) ++processed; };

    std::thread first(work);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pool.busy_count() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(pool.busy_count(), 1u);

    // Longer than the visibility timeout
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(queue.in_flight_count(), 0u);

    std::thread second(work);
    while (pool.busy_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(pool.busy_count(), 2u);

    held.reset();
    first.join();
    second.join();

    EXPECT_EQ(processed.load(), 1);
    EXPECT_EQ(runner.call_count(), 1u);
    EXPECT_EQ(channel_.delivered_count(), 1u);
    EXPECT_EQ(received_.size(), 1u);
    EXPECT_EQ(queue.ready_count(), 0u);
    EXPECT_EQ(queue.in_flight_count(), 0u);
}

TEST_F(WorkerPoolTest, ExpiredLeaseOfLostWorkerIsRecovered) {
    listen("client-1");
    InMemoryJobQueue queue(QueueOptions{.visibility_timeout = 50ms, .max_delivery_attempts = 3});
    ASSERT_TRUE(queue.enqueue(make_job("job-1", "x = 1")));
    // Claimed by a consumer that never settles it
    auto lost = queue.claim();
    ASSERT_TRUE(lost && lost->has_value());

    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue, channel_,
                                    logger_, metrics_);
    EXPECT_FALSE(pool.process_next());

    std::this_thread::sleep_for(80ms);
    ASSERT_TRUE(pool.process_next());
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0]["job_id"], "job-1");
    EXPECT_EQ(queue.in_flight_count(), 0u);
}

TEST_F(WorkerPoolTest, UndecodableRecordIsDeadLettered) {
    auto root = std::filesystem::temp_directory_path() / "cs_test_worker_pool";
    std::filesystem::remove_all(root);
    auto opened = DirectoryJobQueue::open(root, QueueOptions{});
    ASSERT_TRUE(opened);
    auto& queue = **opened;
    {
        std::ofstream out(root / "ready" / "job-bad.json");
        out << R"({"id":"job-bad"})";
    }

    WorkerPool<ScriptedRunner> pool({.worker_count = 0}, validator_, runner_, queue, channel_,
                                    logger_, metrics_);
    ASSERT_TRUE(pool.process_next());
    EXPECT_EQ(queue.dead_count(), 1u);
    EXPECT_EQ(queue.in_flight_count(), 0u);
    EXPECT_EQ(runner_.call_count(), 0u);
    EXPECT_EQ(metrics_.snapshot().dead_lettered, 1u);

    std::filesystem::remove_all(root);
}

TEST_F(WorkerPoolTest, BackgroundWorkersDrainQueue) {
    listen("client-1");
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(queue_.enqueue(make_job("job-" + std::to_string(i), "x = 1")));
    }

    WorkerPool<ScriptedRunner> pool({.worker_count = 2, .poll_interval = 10ms}, validator_, runner_,
                                    queue_, channel_, logger_, metrics_);
    pool.start();
    EXPECT_TRUE(pool.is_running());
    pool.wake();

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (channel_.delivered_count() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    pool.stop();

    EXPECT_FALSE(pool.is_running());
    EXPECT_EQ(channel_.delivered_count(), 6u);
    EXPECT_EQ(queue_.ready_count(), 0u);
    EXPECT_EQ(queue_.in_flight_count(), 0u);
    EXPECT_LE(runner_.slots().peak(), 2u);
}
