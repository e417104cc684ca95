/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace code_sandbox {

namespace {

/// Replace `target` with the array's string elements when the key is present.
Result<void> read_string_list(const toml::node_view<toml::node>& node,
                              std::string_view key,
                              std::vector<std::string>& target) {
    if (!node) return Result<void>{};
    auto* arr = node.as_array();
    if (!arr) {
        return Error{ErrorCode::InvalidRequest,
                     "Configuration key '" + std::string(key) + "' must be an array of strings"};
    }
    std::vector<std::string> values;
    values.reserve(arr->size());
    for (const auto& element : *arr) {
        auto value = element.value<std::string>();
        if (!value) {
            return Error{ErrorCode::InvalidRequest,
                         "Configuration key '" + std::string(key) + "' must contain only strings"};
        }
        values.push_back(std::move(*value));
    }
    target = std::move(values);
    return Result<void>{};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [security]
        if (auto security = tbl["security"]; security.is_table()) {
            auto& sec = config.security;
            const std::pair<std::string_view, std::vector<std::string>*> lists[] = {
                {"allowed_modules", &sec.allowed_modules},
                {"blocked_builtins", &sec.blocked_builtins},
                {"blocked_attributes", &sec.blocked_attributes},
                {"restricted_attribute_calls", &sec.restricted_attribute_calls}};
            for (const auto& [key, target] : lists) {
                auto list = read_string_list(security[key], key, *target);
                if (!list) return list.error();
            }
            sec.max_source_bytes = static_cast<uint64_t>(
                security["max_source_bytes"].value_or(int64_t{10240}));
        }

        // [execution]
        if (auto execution = tbl["execution"]; execution.is_table()) {
            auto& exe = config.execution;
            exe.interpreter = execution["interpreter"].value_or(std::string{"/usr/bin/python3"});
            exe.default_timeout_seconds = static_cast<uint32_t>(
                execution["default_timeout_seconds"].value_or(int64_t{30}));
            exe.max_timeout_seconds = static_cast<uint32_t>(
                execution["max_timeout_seconds"].value_or(int64_t{30}));
            exe.memory_limit_mb = static_cast<uint64_t>(
                execution["memory_limit_mb"].value_or(int64_t{256}));
            exe.max_output_bytes = static_cast<uint64_t>(
                execution["max_output_bytes"].value_or(int64_t{65536}));
            exe.max_processes = static_cast<uint32_t>(
                execution["max_processes"].value_or(int64_t{1}));
            exe.concurrency_limit = static_cast<uint32_t>(
                execution["concurrency_limit"].value_or(int64_t{4}));
            exe.slot_wait_ms = static_cast<uint32_t>(
                execution["slot_wait_ms"].value_or(int64_t{0}));
            exe.network_isolation = execution["network_isolation"].value_or(std::string{"required"});
            exe.work_dir = execution["work_dir"].value_or(std::string{});
            auto visible = read_string_list(execution["visible_paths"], "visible_paths", exe.visible_paths);
            if (!visible) return visible.error();
        }

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            auto& q = config.queue;
            q.backend = queue["backend"].value_or(std::string{"directory"});
            q.directory = queue["directory"].value_or(std::string{"./var/queue"});
            q.capacity = static_cast<uint32_t>(queue["capacity"].value_or(int64_t{1024}));
            q.visibility_timeout_seconds = static_cast<uint32_t>(
                queue["visibility_timeout_seconds"].value_or(int64_t{60}));
            q.max_delivery_attempts = static_cast<uint32_t>(
                queue["max_delivery_attempts"].value_or(int64_t{3}));
            q.worker_count = static_cast<uint32_t>(queue["worker_count"].value_or(int64_t{2}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        auto valid = validate_config(config);
        if (!valid) return valid.error();
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidRequest,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    const auto& exe = config.execution;
    if (exe.max_timeout_seconds == 0) {
        return Error{ErrorCode::InvalidRequest, "execution.max_timeout_seconds must be > 0"};
    }
    if (exe.default_timeout_seconds == 0
        || exe.default_timeout_seconds > exe.max_timeout_seconds) {
        return Error{ErrorCode::InvalidRequest,
                     "execution.default_timeout_seconds must be in (0, max_timeout_seconds]"};
    }
    if (exe.concurrency_limit == 0) {
        return Error{ErrorCode::InvalidRequest, "execution.concurrency_limit must be >= 1"};
    }
    if (exe.memory_limit_mb == 0 || exe.max_output_bytes == 0) {
        return Error{ErrorCode::InvalidRequest,
                     "execution.memory_limit_mb and max_output_bytes must be > 0"};
    }
    if (exe.network_isolation != "required" && exe.network_isolation != "best_effort") {
        return Error{ErrorCode::InvalidRequest,
                     "execution.network_isolation must be \"required\" or \"best_effort\""};
    }
    for (const auto& path : exe.visible_paths) {
        if (!std::filesystem::path(path).is_absolute()) {
            return Error{ErrorCode::InvalidRequest,
                         "execution.visible_paths entries must be absolute paths: " + path};
        }
    }
    if (config.queue.worker_count > exe.concurrency_limit) {
        return Error{ErrorCode::InvalidRequest,
                     "queue.worker_count must not exceed execution.concurrency_limit"};
    }
    if (config.queue.backend != "directory" && config.queue.backend != "memory") {
        return Error{ErrorCode::InvalidRequest,
                     "queue.backend must be \"directory\" or \"memory\""};
    }
    if (config.queue.capacity == 0 || config.queue.max_delivery_attempts == 0) {
        return Error{ErrorCode::InvalidRequest,
                     "queue.capacity and queue.max_delivery_attempts must be >= 1"};
    }
    // A lease shorter than an execution would redeliver jobs that are still running
    if (config.queue.visibility_timeout_seconds <= exe.max_timeout_seconds) {
        return Error{ErrorCode::InvalidRequest,
                     "queue.visibility_timeout_seconds must exceed execution.max_timeout_seconds"};
    }
    if (config.security.max_source_bytes == 0) {
        return Error{ErrorCode::InvalidRequest, "security.max_source_bytes must be > 0"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::InvalidRequest,
                     "telemetry.log_level must be one of debug, info, warn, error"};
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace code_sandbox
