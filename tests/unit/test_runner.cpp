/**
 * @file test_runner.cpp
 * @brief Tests for the process-per-execution Runner (needs a python3 interpreter).
 */

#include "runner/bootstrap.hpp"
#include "runner/runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>

using namespace code_sandbox;
using namespace std::chrono_literals;

namespace {

std::filesystem::path find_interpreter() {
    for (const char* candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
        if (std::filesystem::exists(candidate)) return candidate;
    }
    return {};
}

}  // namespace

class RunnerTest : public ::testing::Test {
protected:
    std::shared_ptr<const SecurityPolicy> policy_ = SecurityPolicy::from_config(SecurityConfig{});
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    ExecutionLimits limits_;

    void SetUp() override {
        limits_.interpreter = find_interpreter();
        if (limits_.interpreter.empty()) {
            GTEST_SKIP() << "python3 interpreter not available";
        }
        limits_.default_timeout = 10s;
        limits_.max_timeout = 10s;
        limits_.memory_bytes = 256ULL * 1024 * 1024;
        limits_.concurrency_limit = 2;
        // Containers often forbid network namespaces
        limits_.network_isolation = NetworkIsolation::BestEffort;
    }

    Result<Outcome> run(std::string source, std::chrono::milliseconds timeout = 0ms) {
        Runner runner(limits_, policy_, logger_);
        return runner.run(Submission{.source = std::move(source), .timeout = timeout,
                                     .delivery_handle = std::nullopt});
    }

    /// Namespaces become mandatory; the private root is built from the shipped defaults.
    void require_isolation(const SecurityConfig& security) {
        policy_ = SecurityPolicy::from_config(security);
        limits_.network_isolation = NetworkIsolation::Required;
        const auto defaults = ExecutionConfig{}.visible_paths;
        limits_.visible_paths.assign(defaults.begin(), defaults.end());
    }
};

#define SKIP_WITHOUT_NAMESPACES(outcome)                                              \
    if (!(outcome) && (outcome).error().code == ErrorCode::SandboxSetup) {            \
        GTEST_SKIP() << "namespaces unavailable: " << (outcome).error().message;      \
    }

TEST_F(RunnerTest, PrintsToStdout) {
    auto outcome = run("print(1 + 1)");
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_TRUE(outcome->succeeded());
    EXPECT_EQ(outcome->stdout_text(), "2\n");
    EXPECT_EQ(outcome->stderr_text(), "");
    EXPECT_FALSE(outcome->error().has_value());
    EXPECT_GT(outcome->elapsed().count(), 0);
}

TEST_F(RunnerTest, AllowedModulesImport) {
    auto outcome = run("import math, json\nprint(json.dumps({'r': math.isqrt(49)}))");
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_TRUE(outcome->succeeded()) << outcome->stderr_text();
    EXPECT_EQ(outcome->stdout_text(), "{\"r\": 7}\n");
}

TEST_F(RunnerTest, RuntimeErrorIsClassified) {
    auto outcome = run("print('before')\nx = 1 / 0");
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome->status(), OutcomeStatus::RuntimeFault);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("ZeroDivisionError"));
    EXPECT_EQ(outcome->error_kind(), std::optional<ErrorKind>(ErrorKind::DivisionByZero));
    EXPECT_EQ(outcome->error(), std::optional<std::string>("division by zero"));
    EXPECT_EQ(outcome->stdout_text(), "before\n");
    EXPECT_NE(outcome->stderr_text().find("ZeroDivisionError"), std::string::npos);
}

TEST_F(RunnerTest, InfiniteLoopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = run("while True:\n    pass\n", 1000ms);
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_TRUE(outcome->timed_out());
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("TimeoutError"));
    EXPECT_EQ(outcome->error(), std::optional<std::string>("Execution timed out after 1 seconds"));
    EXPECT_LT(waited, 5s);
}

TEST_F(RunnerTest, TimeoutIsClampedToCeiling) {
    limits_.max_timeout = 1s;
    auto outcome = run("while True:\n    pass\n", 60s);
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome->timed_out());
    EXPECT_EQ(outcome->error(), std::optional<std::string>("Execution timed out after 1 seconds"));
}

TEST_F(RunnerTest, OutputLimitStopsExecution) {
    limits_.max_output_bytes = 1024;
    auto outcome = run("while True:\n    print('x' * 100)\n");
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome->status(), OutcomeStatus::ResourceExceeded);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("OutputLimitExceeded"));
    EXPECT_LE(outcome->stdout_text().size(), 1024u);
}

TEST_F(RunnerTest, MemoryLimitIsEnforced) {
    limits_.memory_bytes = 128ULL * 1024 * 1024;
    auto outcome = run("data = bytearray(1024 * 1024 * 1024)\nprint(len(data))");
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome->status(), OutcomeStatus::ResourceExceeded);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("MemoryError"));
    EXPECT_EQ(outcome->stdout_text(), "");
}

TEST_F(RunnerTest, RuntimeGuardBlocksDisallowedImport) {
    // The runner does not validate; the in-process guard still refuses
    auto outcome = run("import os\nprint(os.getcwd())");
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->status(), OutcomeStatus::RuntimeFault);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("ImportError"));
    EXPECT_EQ(outcome->error(), std::optional<std::string>("Import of 'os' is not allowed"));
}

TEST_F(RunnerTest, RuntimeGuardHidesBlockedBuiltins) {
    auto outcome = run("open('/etc/passwd')");
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("NameError"));
}

TEST_F(RunnerTest, ExplicitSuccessfulExitCompletes) {
    auto outcome = run("print('bye')\nraise SystemExit(0)");
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome->succeeded());
    EXPECT_EQ(outcome->stdout_text(), "bye\n");
}

TEST_F(RunnerTest, UnicodeOutputSurvives) {
    auto outcome = run("print('h\\u00e9llo \\u2603')");
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->stdout_text(), "h\xc3\xa9llo \xe2\x98\x83\n");
}

TEST_F(RunnerTest, SlotsBoundConcurrentRuns) {
    Runner runner(limits_, policy_, logger_);
    auto a = runner.slots().try_acquire_for(0ms);
    auto b = runner.slots().try_acquire_for(0ms);
    ASSERT_TRUE(a && b);

    auto outcome = runner.run(Submission{.source = "print(1)", .timeout = 0ms, .delivery_handle = std::nullopt});
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::CapacityExhausted);

    a.reset();
    auto freed = runner.run(Submission{.source = "print(1)", .timeout = 0ms, .delivery_handle = std::nullopt});
    ASSERT_TRUE(freed) << freed.error().message;
    EXPECT_TRUE(freed->succeeded());
}

// ═══════════════════════════════════════════════
// Isolation
// ═══════════════════════════════════════════════

TEST_F(RunnerTest, HostFilesOutsideScratchAreInvisible) {
    const auto secret = std::filesystem::temp_directory_path() / "cs_test_host_secret.txt";
    { std::ofstream(secret) << "host-only"; }

    SecurityConfig security;
    std::erase(security.blocked_builtins, "open");
    require_isolation(security);

    auto outcome = run(std::format("print(open('{}').read())\nprint(open('/etc/passwd').read())",
                                   secret.string()));
    std::filesystem::remove(secret);
    SKIP_WITHOUT_NAMESPACES(outcome);
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome->status(), OutcomeStatus::RuntimeFault);
    EXPECT_EQ(outcome->error_type(), std::optional<std::string>("FileNotFoundError"));
    EXPECT_EQ(outcome->stdout_text(), "");
}

TEST_F(RunnerTest, InterpreterStillRunsInsidePrivateRoot) {
    require_isolation(SecurityConfig{});
    auto outcome = run("import json\nprint(json.dumps([1, 2]))");
    SKIP_WITHOUT_NAMESPACES(outcome);
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_TRUE(outcome->succeeded()) << outcome->stderr_text();
    EXPECT_EQ(outcome->stdout_text(), "[1, 2]\n");
}

TEST_F(RunnerTest, NetworkEgressIsBlocked) {
    // A listener on the host loopback the child must not be able to reach
    int listener = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener, 1), 0);
    ASSERT_EQ(::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    SecurityConfig security;
    security.allowed_modules.push_back("socket");
    require_isolation(security);

    auto outcome = run(std::format(
        "import socket\n"
        "socket.create_connection(('127.0.0.1', {}), timeout=2)\n"
        "print('connected')",
        ntohs(addr.sin_port)));
    ::close(listener);
    SKIP_WITHOUT_NAMESPACES(outcome);
    ASSERT_TRUE(outcome) << outcome.error().message;
    EXPECT_EQ(outcome->status(), OutcomeStatus::RuntimeFault);
    EXPECT_EQ(outcome->stdout_text(), "");
    EXPECT_TRUE(outcome->error_type().has_value());
}

TEST(BootstrapTest, ArgumentsCarryGuardAndPolicy) {
    SecurityConfig security;
    security.allowed_modules = {"math", "json"};
    security.blocked_builtins = {"eval", "open"};
    auto args = bootstrap_arguments(*SecurityPolicy::from_config(security));

    auto script = std::find(args.begin(), args.end(), "-c");
    ASSERT_NE(script, args.end());
    ASSERT_EQ(std::distance(script, args.end()), 4);
    EXPECT_EQ(*(script + 1), guard_bootstrap());
    EXPECT_NE(guard_bootstrap().find("_guarded_import"), std::string_view::npos);
    EXPECT_EQ(*(script + 2), "json,math");
    EXPECT_EQ(*(script + 3), "eval,open");
}
