/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations),
 * a thread-safe Logger front-end, and JobLogger, which tags every line with
 * the queue job it concerns so one job can be followed across workers and
 * redeliveries.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "error"; nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

class JobLogger;

/**
 * @brief Thread-safe logger front-end.
 *
 * Emits one NDJSON object per call: {"level","ts","msg"}, or
 * {"level","ts","job","msg"} through a JobLogger.
 * The message is JSON-escaped, so captured user output can be logged
 * verbatim.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void log(LogLevel level, std::string_view job_id, std::string_view message);
    void flush();

    [[nodiscard]] JobLogger for_job(std::string job_id);

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    void emit(LogLevel level, std::optional<std::string_view> job_id, std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/**
 * @brief Logger view bound to one job id.
 *
 * Holds a reference to its Logger; it must not outlive it.
 */
class JobLogger {
public:
    JobLogger(Logger& logger, std::string job_id)
        : logger_(logger), job_id_(std::move(job_id)) {}

    void debug(std::string_view message) { logger_.log(LogLevel::Debug, job_id_, message); }
    void info(std::string_view message)  { logger_.log(LogLevel::Info, job_id_, message); }
    void warn(std::string_view message)  { logger_.log(LogLevel::Warn, job_id_, message); }
    void error(std::string_view message) { logger_.log(LogLevel::Error, job_id_, message); }

    [[nodiscard]] const std::string& job_id() const noexcept { return job_id_; }

private:
    Logger& logger_;
    std::string job_id_;
};

}  // namespace code_sandbox
