/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace code_sandbox {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn")  return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    emit(level, std::nullopt, message);
}

void Logger::log(LogLevel level, std::string_view job_id, std::string_view message) {
    emit(level, job_id, message);
}

JobLogger Logger::for_job(std::string job_id) {
    return JobLogger(*this, std::move(job_id));
}

namespace {

// Messages may carry user output; replace invalid UTF-8 instead of throwing
std::string json_string(std::string_view text) {
    return nlohmann::json(std::string(text))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

void Logger::emit(LogLevel level, std::optional<std::string_view> job_id, std::string_view message) {
    if (level < min_level_) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)";
    if (job_id) {
        oss << R"("job":)" << json_string(*job_id) << ',';
    }
    oss << R"("msg":)" << json_string(message) << "}";

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace code_sandbox
