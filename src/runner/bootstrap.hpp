/**
 * @file bootstrap.hpp
 * @brief In-sandbox Python guard run in front of the user source.
 * @author Dimitris Kafetzis
 *
 * The interpreter is started as
 *
 *   python3 -u -s -S -B -X utf8 -c <bootstrap> <allowed,csv> <blocked,csv>
 *
 * with the user source on stdin. The bootstrap compiles it as
 * `<user_code>`, executes it against a stripped builtins table whose
 * `__import__` honours the allow-list, and reports an uncaught exception
 * as one JSON object `{"error_type","error"}` on fd 3.
 */

#pragma once

#include "validator/security_policy.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

/// File descriptor the child writes its exception report to.
inline constexpr int kStatusFd = 3;

[[nodiscard]] std::string_view guard_bootstrap() noexcept;

/// Interpreter argv after argv[0].
[[nodiscard]] std::vector<std::string> bootstrap_arguments(const SecurityPolicy& policy);

}  // namespace code_sandbox
