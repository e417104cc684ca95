/**
 * @file job_id.hpp
 * @brief Random job identifiers.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <string_view>

namespace code_sandbox {

/// 128 random bits, formatted as a lowercase 8-4-4-4-12 hex string.
[[nodiscard]] JobId generate_job_id();

/// True for non-empty ids made of [A-Za-z0-9_-] only (safe as a file name).
[[nodiscard]] bool is_valid_job_id(std::string_view id) noexcept;

}  // namespace code_sandbox
