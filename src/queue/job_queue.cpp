/**
 * @file job_queue.cpp
 * @brief QueueOptions derivation and backend selection.
 * @author Dimitris Kafetzis
 */

#include "queue/job_queue.hpp"

#include "queue/directory_queue.hpp"
#include "queue/memory_queue.hpp"

namespace code_sandbox {

QueueOptions QueueOptions::from_config(const QueueConfig& config) {
    return QueueOptions{
        .capacity = config.capacity,
        .visibility_timeout = std::chrono::seconds(config.visibility_timeout_seconds),
        .max_delivery_attempts = config.max_delivery_attempts,
    };
}

Result<std::unique_ptr<IJobQueue>> make_job_queue(const QueueConfig& config) {
    auto options = QueueOptions::from_config(config);

    if (config.backend == "memory") {
        return std::unique_ptr<IJobQueue>(std::make_unique<InMemoryJobQueue>(options));
    }
    if (config.backend == "directory") {
        auto queue = DirectoryJobQueue::open(config.directory, options);
        if (!queue) return queue.error();
        return std::unique_ptr<IJobQueue>(std::move(*queue));
    }
    return Error{ErrorCode::InvalidRequest, "Unknown queue backend: " + config.backend};
}

}  // namespace code_sandbox
