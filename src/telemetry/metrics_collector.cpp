/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

namespace code_sandbox {

namespace {

/// JSON string literal, quotes included.
std::string json_quoted(std::string_view text) {
    return nlohmann::json(std::string(text)).dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace);
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution(DispatchPath path, const Outcome& outcome) {
    ++executions_;
    std::ostringstream oss;
    oss << R"({"event":"execution_finished")"
        << R"(,"path":")" << to_string(path) << "\""
        << R"(,"status":")" << to_string(outcome.status()) << "\""
        << R"(,"error_type":)" << (outcome.error_type() ? json_quoted(*outcome.error_type()) : "null")
        << R"(,"duration_us":)" << outcome.elapsed().count()
        << R"(,"stdout_bytes":)" << outcome.stdout_text().size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_rejection(DispatchPath path, size_t violation_count) {
    ++rejections_;
    std::ostringstream oss;
    oss << R"({"event":"dispatch_rejected")"
        << R"(,"path":")" << to_string(path) << "\""
        << R"(,"violations":)" << violation_count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_enqueued(const JobId& id) {
    ++enqueued_;
    std::ostringstream oss;
    oss << R"({"event":"job_enqueued")"
        << R"(,"job":)" << json_quoted(id)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_delivered(const JobId& id, uint32_t attempt, bool recipient_gone) {
    if (!recipient_gone) ++delivered_;
    std::ostringstream oss;
    oss << R"({"event":"job_delivered")"
        << R"(,"job":)" << json_quoted(id)
        << R"(,"attempt":)" << attempt
        << R"(,"recipient_gone":)" << (recipient_gone ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_dead_lettered(const JobId& id, std::string_view reason) {
    ++dead_lettered_;
    std::ostringstream oss;
    oss << R"({"event":"job_dead_lettered")"
        << R"(,"job":)" << json_quoted(id)
        << R"(,"reason":)" << json_quoted(reason)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":)" << json_quoted(event)
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

MetricsSnapshot MetricsCollector::snapshot() const noexcept {
    return MetricsSnapshot{
        .executions = executions_.load(),
        .rejections = rejections_.load(),
        .enqueued = enqueued_.load(),
        .delivered = delivered_.load(),
        .dead_lettered = dead_lettered_.load(),
    };
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace code_sandbox
