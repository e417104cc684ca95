/**
 * @file bench_validator.cpp
 * @brief Performance benchmarks for validation and the request hot path.
 * @author Dimitris Kafetzis
 *
 * Measures lexing, static validation, wire decoding and in-memory queue
 * operations, i.e. everything a request touches before a child process
 * is forked.
 *
 * Usage: ./bench_validator [--csv]
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "protocol/wire_codec.hpp"
#include "queue/job_id.hpp"
#include "queue/job_record.hpp"
#include "queue/memory_queue.hpp"
#include "validator/lexer.hpp"
#include "validator/security_policy.hpp"
#include "validator/validator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace code_sandbox;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// A program of `functions` small functions plus a driver loop; all of it passes.
std::string make_source(size_t functions) {
    std::string src = "import math\nfrom collections import Counter\n\n";
    for (size_t i = 0; i < functions; ++i) {
        auto n = std::to_string(i);
        src += "def step_" + n + "(values, scale=" + n + "):\n"
               "    total = 0\n"
               "    for v in values:\n"
               "        if v % 2 == 0:\n"
               "            total += math.sqrt(v) * scale\n"
               "        else:\n"
               "            total -= v // 3\n"
               "    return f\"step " + n + ": {total:.3f}\"\n\n";
    }
    src += "counts = Counter(range(" + std::to_string(functions) + "))\n"
           "for k in sorted(counts):\n"
           "    print(k, [x * x for x in range(10)])\n";
    return src;
}

/// Same shape, with a forbidden import and a reflection chain appended.
std::string make_hostile_source(size_t functions) {
    return make_source(functions)
         + "import os\n"
           "os.system('id')\n"
           "leak = ().__class__.__bases__[0].__subclasses__()\n";
}

std::string label(const std::string& src) {
    return std::to_string(src.size()) + " bytes";
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_lexer() {
    std::vector<BenchResult> R;

    for (size_t n : {1, 10, 100, 500}) {
        auto src = make_source(n);
        size_t iters = n >= 100 ? 200 : 2000;
        R.push_back(run_bench("tokenize(" + std::to_string(n) + " fn)", "Lexer", iters,
            [&]{ auto t = Lexer(src).tokenize(); (void)t; }, label(src)));
    }

    std::string fstrings;
    for (int i = 0; i < 200; ++i) {
        fstrings += "print(f\"{a!r:>{width}} {b['k']} {{literal}} {c + d}\")\n";
    }
    R.push_back(run_bench("tokenize(f-strings x200)", "Lexer", 500,
        [&]{ auto t = Lexer(fstrings).tokenize(); (void)t; }, label(fstrings)));

    return R;
}

std::vector<BenchResult> bench_validation() {
    std::vector<BenchResult> R;
    // Large enough that every generated source reaches the token checks
    SecurityConfig roomy;
    roomy.max_source_bytes = 1 << 20;
    Validator validator(SecurityPolicy::from_config(roomy));

    for (size_t n : {1, 10, 100, 500}) {
        auto src = make_source(n);
        size_t iters = n >= 100 ? 200 : 2000;
        R.push_back(run_bench("validate_accept(" + std::to_string(n) + " fn)", "Validation", iters,
            [&]{ auto r = validator.validate(src); (void)r; }, label(src)));
    }

    for (size_t n : {1, 100}) {
        auto src = make_hostile_source(n);
        R.push_back(run_bench("validate_reject(" + std::to_string(n) + " fn)", "Validation", 500,
            [&]{ auto r = validator.validate(src); (void)r; }, label(src)));
    }

    std::string broken = make_source(100) + "def oops(:\n";
    R.push_back(run_bench("validate_syntax_error(100 fn)", "Validation", 200,
        [&]{ auto r = validator.validate(broken); (void)r; }, label(broken)));

    Validator strict(SecurityPolicy::from_config(SecurityConfig{}));
    auto oversized = make_source(500);
    R.push_back(run_bench("validate_oversized(500 fn)", "Validation", 5000,
        [&]{ auto r = strict.validate(oversized); (void)r; }, label(oversized)));

    R.push_back(run_bench("policy_from_config", "Validation", 2000,
        [&]{ auto p = SecurityPolicy::from_config(SecurityConfig{}); (void)p; }));

    return R;
}

std::vector<BenchResult> bench_protocol() {
    std::vector<BenchResult> R;

    std::string small = R"json({"action":"execute","code":"print(1)","timeout_seconds":5})json";
    std::string large = R"({"action":"execute_async","delivery_handle":"client-7","code":")";
    for (int i = 0; i < 500; ++i) large += "x = " + std::to_string(i) + "\\n";
    large += R"("})";

    R.push_back(run_bench("decode_request(small)", "Protocol", 5000,
        [&]{ auto r = decode_request(small); (void)r; }, label(small)));
    R.push_back(run_bench("decode_request(large)", "Protocol", 1000,
        [&]{ auto r = decode_request(large); (void)r; }, label(large)));

    auto outcome = Outcome::make_completed(
        CapturedOutput{.stdout_text = std::string(4096, 'o'), .stderr_text = ""},
        Duration{1500});
    R.push_back(run_bench("encode_execution_response(4KB)", "Protocol", 5000,
        [&]{ auto s = encode_execution_response(outcome); (void)s; }));

    return R;
}

std::vector<BenchResult> bench_queue() {
    std::vector<BenchResult> R;

    Job job{
        .id = generate_job_id(),
        .submission = Submission{.source = make_source(10),
                                 .timeout = std::chrono::milliseconds{5000},
                                 .delivery_handle = std::string{"client-1"}},
        .enqueued_at = std::chrono::system_clock::now(),
        .attempt = 0,
    };

    R.push_back(run_bench("generate_job_id", "Queue", 10000,
        [&]{ auto id = generate_job_id(); (void)id; }));

    auto record = encode_job_record(job);
    R.push_back(run_bench("encode_job_record", "Queue", 5000,
        [&]{ auto s = encode_job_record(job); (void)s; }, label(record)));
    R.push_back(run_bench("decode_job_record", "Queue", 5000,
        [&]{ auto j = decode_job_record(record); (void)j; }, label(record)));

    for (size_t batch : {10, 100, 1000}) {
        R.push_back(run_bench("memory_enqueue_claim_ack(" + std::to_string(batch) + ")", "Queue", 100,
            [&]{
                InMemoryJobQueue q(QueueOptions{.capacity = static_cast<uint32_t>(batch)});
                for (size_t i = 0; i < batch; ++i) {
                    Job j = job;
                    j.id = generate_job_id();
                    (void)q.enqueue(j);
                }
                while (true) {
                    auto claimed = q.claim();
                    if (!claimed || !claimed->has_value()) break;
                    (void)q.ack((*claimed)->id);
                }
            }, std::to_string(batch) + " jobs"));
    }

    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  CodeSandbox Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_lexer());
    append(bench_validation());
    append(bench_protocol());
    append(bench_queue());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
