/**
 * @file directory_queue.cpp
 * @brief DirectoryJobQueue implementation (tmp -> ready -> claimed -> dead renames).
 * @author Dimitris Kafetzis
 */

#include "queue/directory_queue.hpp"

#include "queue/job_id.hpp"
#include "queue/job_record.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <utility>
#include <vector>

namespace code_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTmp = "tmp";
constexpr std::string_view kReady = "ready";
constexpr std::string_view kClaimed = "claimed";
constexpr std::string_view kDead = "dead";
constexpr std::string_view kRecordExtension = ".json";

Error queue_error(std::string_view what, const fs::path& path, const std::error_code& ec) {
    return Error{ErrorCode::QueueUnavailable,
                 std::format("{} {}: {}", what, path.string(), ec.message())};
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::Io, "Cannot open " + path.string()};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return Error{ErrorCode::Io, "Read failed: " + path.string()};
    return buffer.str();
}

bool is_record(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == kRecordExtension;
}

}  // namespace

Result<std::unique_ptr<DirectoryJobQueue>> DirectoryJobQueue::open(const fs::path& root,
                                                                  QueueOptions options) {
    for (auto state : {kTmp, kReady, kClaimed, kDead}) {
        std::error_code ec;
        auto dir = root / state;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::Io,
                         std::format("Cannot create queue directory {}: {}", dir.string(), ec.message())};
        }
    }
    return std::unique_ptr<DirectoryJobQueue>(new DirectoryJobQueue(root, options));
}

DirectoryJobQueue::DirectoryJobQueue(fs::path root, QueueOptions options)
    : root_(std::move(root)), options_(options) {}

fs::path DirectoryJobQueue::record_path(std::string_view state, const JobId& id) const {
    return root_ / state / (id + std::string(kRecordExtension));
}

size_t DirectoryJobQueue::count_records(std::string_view state) const {
    std::error_code ec;
    size_t count = 0;
    for (auto it = fs::directory_iterator(root_ / state, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (is_record(*it)) ++count;
    }
    return count;
}

Result<void> DirectoryJobQueue::write_record(const fs::path& target, std::string_view contents) const {
    auto staging = root_ / kTmp / std::format("{}.{}", target.filename().string(), ::getpid());
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) return Error{ErrorCode::QueueUnavailable, "Cannot write " + staging.string()};
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(staging, ignored);
            return Error{ErrorCode::QueueUnavailable, "Write failed: " + staging.string()};
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return queue_error("Cannot publish", target, ec);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// IJobQueue
// ─────────────────────────────────────────────

Result<void> DirectoryJobQueue::enqueue(const Job& job) {
    if (!is_valid_job_id(job.id)) {
        return Error{ErrorCode::InvalidRequest, "Invalid job id: " + job.id};
    }

    std::lock_guard lock(mutex_);
    if (count_records(kReady) + count_records(kClaimed) >= options_.capacity) {
        return Error{ErrorCode::QueueUnavailable,
                     std::format("Queue is full (capacity {})", options_.capacity)};
    }
    return write_record(record_path(kReady, job.id), encode_job_record(job));
}

Result<std::optional<ClaimedJob>> DirectoryJobQueue::claim() {
    std::lock_guard lock(mutex_);
    reclaim_expired();

    std::vector<std::pair<fs::file_time_type, fs::path>> ready;
    std::error_code ec;
    for (auto it = fs::directory_iterator(root_ / kReady, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (!is_record(*it)) continue;
        std::error_code time_ec;
        auto mtime = it->last_write_time(time_ec);
        if (!time_ec) ready.emplace_back(mtime, it->path());
    }
    if (ec) return queue_error("Cannot list", root_ / kReady, ec);

    std::sort(ready.begin(), ready.end());

    for (const auto& [mtime, path] : ready) {
        const JobId id = path.stem().string();
        const auto leased = record_path(kClaimed, id);

        std::error_code rename_ec;
        fs::rename(path, leased, rename_ec);
        if (rename_ec) continue;  // claimed by another consumer

        auto text = read_file(leased);
        if (!text) {
            return std::optional<ClaimedJob>(ClaimedJob{.id = id, .attempt = 0, .job = text.error()});
        }
        auto job = decode_job_record(*text);
        if (!job) {
            return std::optional<ClaimedJob>(ClaimedJob{.id = id, .attempt = 0, .job = job.error()});
        }

        job->id = id;
        ++job->attempt;
        if (job->attempt > options_.max_delivery_attempts) {
            if (auto retired = retire(id, "delivery attempts exhausted"); !retired) return retired.error();
            continue;
        }

        // Rewriting refreshes the mtime, which starts the lease
        if (auto written = write_record(leased, encode_job_record(*job)); !written) {
            return written.error();
        }
        const uint32_t attempt = job->attempt;
        return std::optional<ClaimedJob>(ClaimedJob{.id = id, .attempt = attempt, .job = std::move(job)});
    }
    return std::optional<ClaimedJob>{};
}

Result<void> DirectoryJobQueue::ack(const JobId& id) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!fs::remove(record_path(kClaimed, id), ec)) {
        if (ec) return queue_error("Cannot remove", record_path(kClaimed, id), ec);
        return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};
    }
    return Result<void>{};
}

Result<void> DirectoryJobQueue::nack(const JobId& id) {
    std::lock_guard lock(mutex_);
    auto text = read_file(record_path(kClaimed, id));
    if (!text) return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};

    auto job = decode_job_record(*text);
    if (!job) return retire(id, "undecodable record");
    return release(id, job->attempt);
}

Result<void> DirectoryJobQueue::dead_letter(const JobId& id, std::string_view reason) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!fs::exists(record_path(kClaimed, id), ec)) {
        return Error{ErrorCode::InvalidRequest, "No claimed job with id " + id};
    }
    return retire(id, reason);
}

bool DirectoryJobQueue::has_claimable() const {
    std::lock_guard lock(mutex_);
    return count_records(kReady) > 0 || !expired_leases().empty();
}

size_t DirectoryJobQueue::ready_count() const {
    std::lock_guard lock(mutex_);
    return count_records(kReady);
}

size_t DirectoryJobQueue::in_flight_count() const {
    std::lock_guard lock(mutex_);
    return count_records(kClaimed);
}

size_t DirectoryJobQueue::dead_count() const {
    std::lock_guard lock(mutex_);
    return count_records(kDead);
}

// ─────────────────────────────────────────────
// Internal transitions (mutex held)
// ─────────────────────────────────────────────

Result<void> DirectoryJobQueue::retire(const JobId& id, std::string_view reason) {
    const auto target = record_path(kDead, id);
    std::error_code ec;
    fs::rename(record_path(kClaimed, id), target, ec);
    if (ec) return queue_error("Cannot dead-letter", record_path(kClaimed, id), ec);

    std::ofstream sidecar(root_ / kDead / (id + ".reason"), std::ios::trunc);
    sidecar << reason << '\n';
    if (!sidecar) return Error{ErrorCode::Io, "Cannot write dead-letter reason for " + id};
    return Result<void>{};
}

Result<void> DirectoryJobQueue::release(const JobId& id, uint32_t attempt) {
    if (attempt >= options_.max_delivery_attempts) {
        return retire(id, "delivery attempts exhausted");
    }

    const auto target = record_path(kReady, id);
    std::error_code ec;
    fs::rename(record_path(kClaimed, id), target, ec);
    if (ec) return queue_error("Cannot release", record_path(kClaimed, id), ec);

    // Back of the line
    fs::last_write_time(target, fs::file_time_type::clock::now(), ec);
    return Result<void>{};
}

std::vector<fs::path> DirectoryJobQueue::expired_leases() const {
    const auto now = fs::file_time_type::clock::now();
    std::vector<fs::path> expired;

    std::error_code ec;
    for (auto it = fs::directory_iterator(root_ / kClaimed, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (!is_record(*it)) continue;
        std::error_code time_ec;
        auto mtime = it->last_write_time(time_ec);
        if (!time_ec && now - mtime >= options_.visibility_timeout) expired.push_back(it->path());
    }
    return expired;
}

void DirectoryJobQueue::reclaim_expired() {
    for (const auto& path : expired_leases()) {
        const JobId id = path.stem().string();
        auto text = read_file(path);
        if (!text) continue;
        auto job = decode_job_record(*text);
        auto moved = job ? release(id, job->attempt) : retire(id, "undecodable record");
        static_cast<void>(moved);  // lost a race with another consumer; nothing to undo
    }
}

}  // namespace code_sandbox
