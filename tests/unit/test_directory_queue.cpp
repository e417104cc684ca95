/**
 * @file test_directory_queue.cpp
 * @brief Unit tests for the file-backed DirectoryJobQueue.
 */

#include "queue/directory_queue.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>

using namespace code_sandbox;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class DirectoryQueueTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() / "cs_test_directory_queue";
        fs::remove_all(root_);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::unique_ptr<DirectoryJobQueue> open_queue(QueueOptions options = {}) {
        auto queue = DirectoryJobQueue::open(root_, options);
        EXPECT_TRUE(queue) << (queue ? "" : queue.error().message);
        return queue ? std::move(*queue) : nullptr;
    }

    static Job make_job(std::string id) {
        return Job{
            .id = std::move(id),
            .submission = Submission{.source = "print(2)", .timeout = 500ms, .delivery_handle = "h1"},
            .enqueued_at = std::chrono::system_clock::now(),
            .attempt = 0,
        };
    }
};

TEST_F(DirectoryQueueTest, OpenCreatesLayout) {
    auto queue = open_queue();
    ASSERT_NE(queue, nullptr);
    for (const char* state : {"tmp", "ready", "claimed", "dead"}) {
        EXPECT_TRUE(fs::is_directory(root_ / state)) << state;
    }
    EXPECT_EQ(queue->ready_count(), 0u);
}

TEST_F(DirectoryQueueTest, EnqueueClaimAck) {
    auto queue = open_queue();
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));
    EXPECT_TRUE(fs::exists(root_ / "ready" / "job-a.json"));
    EXPECT_EQ(queue->ready_count(), 1u);

    auto claimed = queue->claim();
    ASSERT_TRUE(claimed && claimed->has_value());
    EXPECT_EQ((*claimed)->id, "job-a");
    EXPECT_EQ((*claimed)->attempt, 1u);
    ASSERT_TRUE((*claimed)->job);
    EXPECT_EQ((*claimed)->job->submission.source, "print(2)");
    EXPECT_EQ((*claimed)->job->submission.delivery_handle, std::optional<DeliveryHandle>("h1"));
    EXPECT_EQ(queue->in_flight_count(), 1u);

    ASSERT_TRUE(queue->ack("job-a"));
    EXPECT_EQ(queue->in_flight_count(), 0u);
    EXPECT_FALSE(fs::exists(root_ / "claimed" / "job-a.json"));
    EXPECT_FALSE(queue->ack("job-a"));
}

TEST_F(DirectoryQueueTest, RejectsUnsafeIds) {
    auto queue = open_queue();
    auto bad = queue->enqueue(make_job("../escape"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidRequest);
}

TEST_F(DirectoryQueueTest, CapacityIncludesClaimed) {
    auto queue = open_queue(QueueOptions{.capacity = 1});
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));
    auto claimed = queue->claim();
    ASSERT_TRUE(claimed && claimed->has_value());

    auto full = queue->enqueue(make_job("job-b"));
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, ErrorCode::QueueUnavailable);
    EXPECT_EQ(full.error().message, "Queue is full (capacity 1)");
}

TEST_F(DirectoryQueueTest, EachJobClaimedOnce) {
    auto queue = open_queue();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue->enqueue(make_job("job-" + std::to_string(i))));
    }
    std::set<JobId> seen;
    while (true) {
        auto claimed = queue->claim();
        ASSERT_TRUE(claimed);
        if (!claimed->has_value()) break;
        EXPECT_TRUE(seen.insert((*claimed)->id).second);
    }
    EXPECT_EQ(seen.size(), 5u);
}

TEST_F(DirectoryQueueTest, NackThenDeadLetterAfterMaxAttempts) {
    auto queue = open_queue(QueueOptions{.max_delivery_attempts = 2});
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));

    ASSERT_TRUE(queue->claim());
    ASSERT_TRUE(queue->nack("job-a"));
    EXPECT_EQ(queue->ready_count(), 1u);

    auto second = queue->claim();
    ASSERT_TRUE(second && second->has_value());
    EXPECT_EQ((*second)->attempt, 2u);
    ASSERT_TRUE(queue->nack("job-a"));

    EXPECT_EQ(queue->ready_count(), 0u);
    EXPECT_EQ(queue->dead_count(), 1u);
    EXPECT_TRUE(fs::exists(root_ / "dead" / "job-a.json"));
    EXPECT_TRUE(fs::exists(root_ / "dead" / "job-a.reason"));
}

TEST_F(DirectoryQueueTest, DeadLetterWritesReason) {
    auto queue = open_queue();
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));
    ASSERT_TRUE(queue->claim());
    ASSERT_TRUE(queue->dead_letter("job-a", "poison message"));

    std::ifstream reason(root_ / "dead" / "job-a.reason");
    std::string line;
    std::getline(reason, line);
    EXPECT_EQ(line, "poison message");
    EXPECT_FALSE(queue->dead_letter("job-missing", "x"));
}

TEST_F(DirectoryQueueTest, JobsSurviveReopen) {
    {
        auto queue = open_queue();
        ASSERT_TRUE(queue->enqueue(make_job("job-a")));
        ASSERT_TRUE(queue->enqueue(make_job("job-b")));
        auto claimed = queue->claim();
        ASSERT_TRUE(claimed && claimed->has_value());
    }

    auto reopened = open_queue();
    EXPECT_EQ(reopened->ready_count(), 1u);
    EXPECT_EQ(reopened->in_flight_count(), 1u);
}

TEST_F(DirectoryQueueTest, ExpiredLeaseReturnsToReady) {
    auto queue = open_queue(QueueOptions{.visibility_timeout = 0ms, .max_delivery_attempts = 3});
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));
    ASSERT_TRUE(queue->claim());

    auto again = queue->claim();
    ASSERT_TRUE(again && again->has_value());
    EXPECT_EQ((*again)->id, "job-a");
    EXPECT_EQ((*again)->attempt, 2u);
}

TEST_F(DirectoryQueueTest, ClaimableSeesExpiredLeases) {
    auto queue = open_queue(QueueOptions{.visibility_timeout = 0ms, .max_delivery_attempts = 3});
    EXPECT_FALSE(queue->has_claimable());
    ASSERT_TRUE(queue->enqueue(make_job("job-a")));
    ASSERT_TRUE(queue->claim());

    EXPECT_EQ(queue->ready_count(), 0u);
    EXPECT_TRUE(queue->has_claimable());
}

TEST_F(DirectoryQueueTest, UndecodableRecordIsSurfaced) {
    auto queue = open_queue();
    {
        std::ofstream out(root_ / "ready" / "job-bad.json");
        out << "{not json";
    }

    auto claimed = queue->claim();
    ASSERT_TRUE(claimed && claimed->has_value());
    EXPECT_EQ((*claimed)->id, "job-bad");
    EXPECT_FALSE((*claimed)->job);

    ASSERT_TRUE(queue->dead_letter("job-bad", (*claimed)->job.error().message));
    EXPECT_EQ(queue->dead_count(), 1u);
}

TEST_F(DirectoryQueueTest, NonRecordFilesAreIgnored) {
    auto queue = open_queue();
    {
        std::ofstream out(root_ / "ready" / "notes.txt");
        out << "hello";
    }
    EXPECT_EQ(queue->ready_count(), 0u);
    auto claimed = queue->claim();
    ASSERT_TRUE(claimed);
    EXPECT_FALSE(claimed->has_value());
}
