/**
 * @file job_record.hpp
 * @brief JSON persistence format of a queued Job.
 * @author Dimitris Kafetzis
 *
 *   {"id","source","timeout_ms","delivery_handle"|null,"enqueued_at_ms","attempt"}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace code_sandbox {

[[nodiscard]] std::string encode_job_record(const Job& job);

/// InvalidRequest on malformed JSON or missing/mistyped fields.
[[nodiscard]] Result<Job> decode_job_record(std::string_view text);

}  // namespace code_sandbox
