/**
 * @file sandbox_process.hpp
 * @brief Isolated child process launch with output capture.
 * @author Dimitris Kafetzis
 *
 * One call spawns one fresh process:
 *   - own session (the whole group is killed on timeout or overflow)
 *   - private user, mount and network namespaces (no network egress)
 *   - private root: a read-only tmpfs holding only `visible_paths` (bound
 *     read-only) and the working directory (bound writable, same path)
 *   - rlimits: address space, CPU, file size 0, process count, open files, core 0
 *   - no_new_privs, parent-death SIGKILL
 *   - minimal environment, private scratch directory as cwd
 *
 * Standard output and error are read concurrently with a per-stream byte
 * cap; stdin is fed from memory.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace code_sandbox {

struct ProcessLimits {
    uint64_t memory_bytes = 256ULL * 1024 * 1024;
    uint64_t cpu_seconds = 31;
    uint32_t max_processes = 1;
    uint32_t max_open_files = 32;
    uint64_t max_output_bytes = 65536;   ///< Per captured stream
};

struct SandboxSpec {
    std::filesystem::path executable;
    std::vector<std::string> arguments;     ///< argv after argv[0]
    std::vector<std::string> environment;   ///< Complete envp, "KEY=value"
    std::string stdin_data;
    std::filesystem::path working_dir;
    std::filesystem::path root_dir;                      ///< Empty mount point for the private root; empty keeps the host root
    std::vector<std::filesystem::path> visible_paths;    ///< Absolute host paths bound read-only into the root
    std::chrono::milliseconds wall_timeout{30000};
    ProcessLimits limits;
    bool require_isolation = true;
};

struct ProcessReport {
    bool exited = false;          ///< Normal exit; exit_code is valid
    int exit_code = -1;
    int term_signal = 0;          ///< Set when killed by a signal
    bool timed_out = false;       ///< Killed at the wall-clock ceiling
    bool output_overflow = false; ///< Killed for exceeding max_output_bytes
    std::string stdout_text;
    std::string stderr_text;
    std::string status_text;      ///< Contents of the status descriptor
    Duration elapsed{0};
    long peak_rss_kb = 0;
};

/**
 * @brief Private temporary directory, removed with its contents on destruction.
 */
class ScratchDirectory {
public:
    static Result<ScratchDirectory> create(const std::filesystem::path& parent);

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    void remove() noexcept;

    std::filesystem::path path_;
};

/**
 * @brief Run one sandboxed process to completion.
 *
 * Faults of the child (non-zero exit, signals, timeout, overflow) are
 * reported in ProcessReport. An Error means the sandbox itself could not
 * be set up (SandboxSetup) or the supervisor hit an I/O failure (Io).
 */
[[nodiscard]] Result<ProcessReport> run_sandboxed(const SandboxSpec& spec);

}  // namespace code_sandbox
