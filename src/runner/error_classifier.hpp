/**
 * @file error_classifier.hpp
 * @brief Maps interpreter exception reports onto ErrorKind.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace code_sandbox {

/// Exception report written by the bootstrap on the status descriptor.
struct StatusReport {
    std::string type_name;
    std::string message;
};

/// nullopt when the text is empty or not a well-formed report.
[[nodiscard]] std::optional<StatusReport> parse_status_report(std::string_view text);

/// Coarse category for an exception class name; unknown names are Uncategorized.
[[nodiscard]] ErrorKind classify_error_type(std::string_view type_name) noexcept;

}  // namespace code_sandbox
