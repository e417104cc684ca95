/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * The Config value is built once at startup and never mutated. Components
 * receive the sections they need through their constructors.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace code_sandbox {

struct SecurityConfig {
    std::vector<std::string> allowed_modules = {
        "math", "cmath", "decimal", "fractions", "random", "statistics",
        "collections", "heapq", "bisect", "array",
        "itertools", "functools", "operator",
        "string", "re", "textwrap",
        "json", "csv",
        "datetime", "calendar", "time",
        "typing", "dataclasses",
        "copy", "pprint", "enum", "abc"
    };
    std::vector<std::string> blocked_builtins = {
        "eval", "exec", "compile", "open", "input", "__import__",
        "globals", "locals", "vars", "dir",
        "getattr", "setattr", "delattr", "hasattr",
        "breakpoint", "help", "memoryview"
    };
    std::vector<std::string> blocked_attributes = {
        "__class__", "__bases__", "__subclasses__", "__mro__", "__globals__",
        "__code__", "__builtins__", "__import__", "__dict__", "__getattribute__",
        "__reduce__", "__reduce_ex__", "__loader__", "__spec__",
        "f_globals", "f_locals", "f_back", "f_builtins",
        "gi_frame", "cr_frame", "tb_frame"
    };
    /// Attribute names that are flagged when referenced on any object
    std::vector<std::string> restricted_attribute_calls = {
        "eval", "exec", "__import__", "system", "popen", "breakpoint"
    };
    uint64_t max_source_bytes = 10240;
};

struct ExecutionConfig {
    std::filesystem::path interpreter = "/usr/bin/python3";
    uint32_t default_timeout_seconds = 30;
    uint32_t max_timeout_seconds = 30;
    uint64_t memory_limit_mb = 256;
    uint64_t max_output_bytes = 65536;      ///< Per stream
    uint32_t max_processes = 1;
    uint32_t concurrency_limit = 4;
    uint32_t slot_wait_ms = 0;              ///< Sync path wait for a free slot
    std::string network_isolation = "required";   ///< "required" or "best_effort"; covers every namespace
    std::filesystem::path work_dir;         ///< Empty = system temp directory
    /// Host paths bound read-only into the child's private root; nothing else is visible
    std::vector<std::string> visible_paths = {
        "/usr", "/bin", "/lib", "/lib64", "/etc/ld.so.cache"
    };
};

struct QueueConfig {
    std::string backend = "directory";      ///< "directory" or "memory"
    std::filesystem::path directory = "./var/queue";
    uint32_t capacity = 1024;
    uint32_t visibility_timeout_seconds = 60;
    uint32_t max_delivery_attempts = 3;
    uint32_t worker_count = 2;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SecurityConfig security;
    ExecutionConfig execution;
    QueueConfig queue;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. The loaded value is checked with
 * validate_config() before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field constraints (ceilings, pool sizes, enum strings).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace code_sandbox
