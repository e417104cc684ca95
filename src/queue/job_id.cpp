/**
 * @file job_id.cpp
 * @brief Job id generation.
 * @author Dimitris Kafetzis
 */

#include "queue/job_id.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <random>

namespace code_sandbox {

JobId generate_job_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const uint64_t hi = rng();
    const uint64_t lo = rng();

    // Version 4 / variant 1 bits, so ids read like UUIDs
    const uint64_t a = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    const uint64_t b = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       a >> 32, (a >> 16) & 0xFFFF, a & 0xFFFF,
                       b >> 48, b & 0xFFFFFFFFFFFFULL);
}

bool is_valid_job_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

}  // namespace code_sandbox
