/**
 * @file job_record.cpp
 * @brief Job <-> JSON record conversion using nlohmann/json.
 * @author Dimitris Kafetzis
 */

#include "queue/job_record.hpp"

#include <nlohmann/json.hpp>

namespace code_sandbox {

using nlohmann::json;

std::string encode_job_record(const Job& job) {
    json record = {
        {"id", job.id},
        {"source", job.submission.source},
        {"timeout_ms", job.submission.timeout.count()},
        {"delivery_handle", nullptr},
        {"enqueued_at_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                               job.enqueued_at.time_since_epoch()).count()},
        {"attempt", job.attempt},
    };
    if (job.submission.delivery_handle) {
        record["delivery_handle"] = *job.submission.delivery_handle;
    }
    return record.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<Job> decode_job_record(std::string_view text) {
    auto record = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (record.is_discarded() || !record.is_object()) {
        return Error{ErrorCode::InvalidRequest, "Job record is not a JSON object"};
    }

    try {
        Job job;
        job.id = record.at("id").get<std::string>();
        job.submission.source = record.at("source").get<std::string>();
        job.submission.timeout = std::chrono::milliseconds(record.at("timeout_ms").get<int64_t>());
        if (const auto& handle = record.at("delivery_handle"); !handle.is_null()) {
            job.submission.delivery_handle = handle.get<std::string>();
        }
        job.enqueued_at = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::milliseconds(record.at("enqueued_at_ms").get<int64_t>())));
        job.attempt = record.at("attempt").get<uint32_t>();
        return job;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidRequest, std::string("Malformed job record: ") + e.what()};
    }
}

}  // namespace code_sandbox
