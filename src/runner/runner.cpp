/**
 * @file runner.cpp
 * @brief Runner implementation: slot acquisition, sandbox launch, outcome mapping.
 * @author Dimitris Kafetzis
 */

#include "runner/runner.hpp"

#include "runner/bootstrap.hpp"
#include "runner/error_classifier.hpp"

#include <csignal>
#include <format>

namespace code_sandbox {

namespace {

constexpr uint32_t kMaxOpenFiles = 32;

}  // namespace

Runner::Runner(ExecutionLimits limits, std::shared_ptr<const SecurityPolicy> policy, Logger& logger)
    : limits_(std::move(limits))
    , policy_(std::move(policy))
    , logger_(logger)
    , slots_(limits_.concurrency_limit)
    , arguments_(bootstrap_arguments(*policy_)) {}

Result<Outcome> Runner::run(const Submission& submission) {
    auto slot = slots_.try_acquire_for(limits_.slot_wait);
    if (!slot) {
        return Error{ErrorCode::CapacityExhausted,
                     std::format("All {} execution slots are busy", slots_.capacity())};
    }
    return execute(submission);
}

Result<Outcome> Runner::run_in_slot(const Submission& submission, ExecutionSlots::Slot slot) {
    auto held = std::move(slot);
    return execute(submission);
}

Result<Outcome> Runner::execute(const Submission& submission) {
    const auto timeout = limits_.clamp_timeout(submission.timeout);

    auto scratch = ScratchDirectory::create(limits_.work_dir);
    if (!scratch) {
        logger_.error("Sandbox scratch directory: " + scratch.error().message);
        return scratch.error();
    }
    // work/ is the child's cwd; root/ is the mount point of its private root
    const auto work = scratch->path() / "work";
    const auto root = scratch->path() / "root";
    std::error_code ec;
    if (!std::filesystem::create_directory(work, ec) || !std::filesystem::create_directory(root, ec)) {
        Error error{ErrorCode::Io, "Sandbox scratch layout: " + (ec ? ec.message() : "already exists")};
        logger_.error(error.message);
        return error;
    }

    SandboxSpec spec{
        .executable = limits_.interpreter,
        .arguments = arguments_,
        .environment = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + work.string(),
            "LC_ALL=C.UTF-8",
            "PYTHONIOENCODING=utf-8",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONHASHSEED=0",
        },
        .stdin_data = submission.source,
        .working_dir = work,
        .root_dir = limits_.visible_paths.empty() ? std::filesystem::path{} : root,
        .visible_paths = limits_.visible_paths,
        .wall_timeout = timeout,
        .limits = ProcessLimits{
            .memory_bytes = limits_.memory_bytes,
            .cpu_seconds = static_cast<uint64_t>(
                std::chrono::ceil<std::chrono::seconds>(timeout).count()) + 1,
            .max_processes = limits_.max_processes,
            .max_open_files = kMaxOpenFiles,
            .max_output_bytes = limits_.max_output_bytes,
        },
        .require_isolation = limits_.network_isolation == NetworkIsolation::Required,
    };

    auto report = run_sandboxed(spec);
    if (!report) {
        logger_.error("Sandbox launch failed: " + report.error().message);
        return report.error();
    }

    logger_.debug(std::format("Sandbox finished: exit={} signal={} timed_out={} elapsed_us={} rss_kb={}",
                              report->exit_code, report->term_signal, report->timed_out,
                              report->elapsed.count(), report->peak_rss_kb));
    return interpret(std::move(report.value()), timeout);
}

Outcome Runner::interpret(ProcessReport report, std::chrono::milliseconds timeout) const {
    CapturedOutput output{
        .stdout_text = std::move(report.stdout_text),
        .stderr_text = std::move(report.stderr_text),
    };

    if (report.timed_out || report.term_signal == SIGXCPU) {
        return Outcome::make_timeout(timeout, std::move(output), report.elapsed);
    }

    if (report.output_overflow) {
        return Outcome::make_resource_exceeded(
            "OutputLimitExceeded",
            std::format("Output exceeded the limit of {} bytes per stream", limits_.max_output_bytes),
            std::move(output), report.elapsed);
    }

    const auto memory_message = [this] {
        return std::format("Memory limit of {} MB exceeded", limits_.memory_bytes / (1024 * 1024));
    };

    if (auto status = parse_status_report(report.status_text)) {
        if (status->type_name == "MemoryError") {
            return Outcome::make_resource_exceeded(
                "MemoryError", status->message.empty() ? memory_message() : status->message,
                std::move(output), report.elapsed);
        }
        Fault fault{
            .kind = classify_error_type(status->type_name),
            .type_name = std::move(status->type_name),
            .message = std::move(status->message),
        };
        return Outcome::make_fault(std::move(fault), std::move(output), report.elapsed);
    }

    if (report.exited && report.exit_code == 0) {
        return Outcome::make_completed(std::move(output), report.elapsed);
    }

    // No report: the interpreter died before the bootstrap could write one
    if (output.stderr_text.find("MemoryError") != std::string::npos) {
        return Outcome::make_resource_exceeded("MemoryError", memory_message(),
                                               std::move(output), report.elapsed);
    }

    Fault fault{.kind = ErrorKind::Uncategorized, .type_name = {}, .message = {}};
    if (report.term_signal != 0) {
        fault.type_name = "ProcessKilled";
        fault.message = std::format("Process terminated by signal {}", report.term_signal);
    } else {
        fault.type_name = "ProcessExit";
        fault.message = std::format("Process exited with status {}", report.exit_code);
    }
    return Outcome::make_fault(std::move(fault), std::move(output), report.elapsed);
}

}  // namespace code_sandbox
