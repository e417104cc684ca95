/**
 * @file main.cpp
 * @brief CodeSandbox daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the execution pipeline:
 *   Config → Logger → SecurityPolicy → Validator → Runner → Queue → Workers → Channel
 *
 * Daemon mode reads one JSON request per line on stdin and writes one JSON
 * response per line on stdout. Async results arrive later on the same
 * stdout as {"handle","payload"} lines. Logs go to the log directory, or to
 * stderr when none is configured.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "notify/notification_channel.hpp"
#include "protocol/wire_codec.hpp"
#include "service/sandbox_service.hpp"
#include "telemetry/json_sink.hpp"
#include "validator/security_policy.hpp"
#include "validator/validator.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace code_sandbox;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr size_t kMaxRequestLineBytes = 1024 * 1024;
constexpr int kPollIntervalMs = 100;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path run_file;
    std::filesystem::path check_file;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: code_sandbox [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --run <file>        Execute one Python file synchronously, print the response\n"
              << "  --check <file>      Validate one Python file, print the verdict\n"
              << "  --log-level <lvl>   debug | info | warn | error (overrides config)\n"
              << "  --help, -h          Show this help message\n"
              << "\n"
              << "Without --run or --check, reads NDJSON requests on stdin:\n"
              << "  {\"action\":\"execute\",\"code\":...,\"timeout_seconds\":...}\n"
              << "  {\"action\":\"execute_async\",\"code\":...,\"delivery_handle\":...}\n"
              << "  {\"action\":\"validate\",\"code\":...}\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--run" && i + 1 < argc) {
            args.run_file = argv[++i];
        } else if (arg == "--check" && i + 1 < argc) {
            args.check_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::optional<std::string> read_source_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/**
 * @brief Validate one file without starting the service.
 * @return 0 when safe, 1 when rejected, 2 when the file is unreadable.
 */
int run_check(const Config& config, const std::filesystem::path& file) {
    auto source = read_source_file(file);
    if (!source) {
        std::cerr << "Cannot read " << file << "\n";
        return 2;
    }
    Validator validator(SecurityPolicy::from_config(config.security));
    auto verdict = validator.validate(*source);
    std::cout << encode_validation_response(verdict ? std::vector<Violation>{} : verdict.error())
              << std::endl;
    return verdict ? 0 : 1;
}

/**
 * @brief Execute one file through the sync dispatch path.
 * @return 0 on success, 1 on any unsuccessful outcome, 2 on infrastructure failure.
 */
int run_file(SandboxService<>& service, const std::filesystem::path& file) {
    auto source = read_source_file(file);
    if (!source) {
        std::cerr << "Cannot read " << file << "\n";
        return 2;
    }
    auto outcome = service.execute(std::move(*source), std::nullopt);
    if (!outcome) {
        std::cout << encode_error_response(kDispatchFailureType, outcome.error().message) << std::endl;
        return 2;
    }
    std::cout << encode_execution_response(*outcome) << std::endl;
    return outcome->succeeded() ? 0 : 1;
}

/**
 * @brief Line-oriented stdin loop; returns on EOF or shutdown request.
 */
void serve_stdin(SandboxService<>& service, std::mutex& stdout_mutex, Logger& logger) {
    std::string pending;
    char chunk[8192];
    bool discarding = false;

    auto respond = [&](const std::string& response) {
        std::lock_guard lock(stdout_mutex);
        std::cout << response << '\n';
        std::cout.flush();
    };

    while (!g_shutdown_requested) {
        pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger.error(std::string("poll(stdin) failed: ") + std::strerror(errno));
            return;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logger.error(std::string("read(stdin) failed: ") + std::strerror(errno));
            return;
        }
        if (n == 0) {
            if (!pending.empty() && !discarding) respond(service.handle_request(pending));
            logger.info("stdin closed");
            return;
        }

        pending.append(chunk, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (discarding) {
                discarding = false;
                continue;
            }
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            respond(service.handle_request(line));
        }

        if (pending.size() > kMaxRequestLineBytes) {
            pending.clear();
            if (!discarding) {
                respond(encode_error_response(kInvalidRequestType, "Invalid request: line too long"));
            }
            discarding = true;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // ── Validate-only shortcut ───────────────
    if (!args.check_file.empty()) {
        return run_check(config, args.check_file);
    }

    auto log_level = parse_log_level(args.log_level.empty() ? config.telemetry.log_level
                                                            : args.log_level)
                         .value_or(LogLevel::Info);

    // One-shot runs need neither a durable queue nor workers
    if (!args.run_file.empty()) {
        config.queue.backend = "memory";
        config.queue.worker_count = 0;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "code_sandbox",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
        metrics_sink = std::make_unique<NullSink>();
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Initialize Service ───────────────────
    std::mutex stdout_mutex;
    StreamNotificationChannel channel(std::cout, stdout_mutex);

    SandboxService<> service(
        SandboxService<>::Options{
            .config = config,
            .log_sink = std::move(log_sink),
            .metrics_sink = std::move(metrics_sink),
            .log_level = log_level,
        },
        channel);

    if (auto started = service.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 2;
    }

    if (!args.run_file.empty()) {
        int rc = run_file(service, args.run_file);
        service.stop();
        return rc;
    }

    // ── Main Request Loop ────────────────────
    service.logger().info("Reading requests from stdin. Press Ctrl+C to shutdown.");
    serve_stdin(service, stdout_mutex, service.logger());

    // Input ended normally: let queued async jobs deliver before exiting
    if (!g_shutdown_requested && service.queue() != nullptr) {
        while (!g_shutdown_requested
               && service.queue()->ready_count() + service.queue()->in_flight_count() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }
    }

    // ── Graceful Shutdown ────────────────────
    service.logger().info("Shutdown requested. Waiting for in-flight jobs...");
    service.stop();
    return 0;
}
