/**
 * @file wire_codec.hpp
 * @brief JSON request/response codec for the daemon's line protocol.
 * @author Dimitris Kafetzis
 *
 * Request (one JSON object per line):
 *   {"action":"execute",       "code", "timeout_seconds"?}
 *   {"action":"execute_async", "code", "timeout_seconds"?, "delivery_handle"}
 *   {"action":"validate",      "code"}
 *
 * Responses:
 *   execute        {success, stdout, stderr, error, error_type,
 *                   execution_time_ms, timed_out, security_violations}
 *   execute_async  {job_id, status:"queued"}
 *   validate       {safe, security_violations}
 *   failure        {success:false, error, error_type}
 *
 * The async delivery payload is the execute response plus
 * {type:"execution_result", job_id}.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

enum class RequestAction : uint8_t {
    Execute,
    ExecuteAsync,
    Validate
};

[[nodiscard]] constexpr std::string_view to_string(RequestAction action) noexcept {
    switch (action) {
        case RequestAction::Execute:      return "execute";
        case RequestAction::ExecuteAsync: return "execute_async";
        case RequestAction::Validate:     return "validate";
    }
    return "unknown";
}

inline constexpr size_t kMaxDeliveryHandleLength = 256;

struct Request {
    RequestAction action{RequestAction::Execute};
    std::string code;
    std::optional<std::chrono::milliseconds> timeout;   ///< nullopt = configured default
    std::optional<DeliveryHandle> delivery_handle;
};

/// Error type names used on the wire for non-execution failures.
inline constexpr std::string_view kInvalidRequestType = "InvalidRequest";
inline constexpr std::string_view kDispatchFailureType = "DispatchFailure";

/**
 * @brief Decode and field-check one request line.
 *
 * InvalidRequest errors carry the message sent back to the caller:
 * "Invalid JSON: ..." for unparsable input, "Invalid request: ..." for a
 * bad field. An action that is absent defaults to "execute".
 */
Result<Request> decode_request(std::string_view line);

[[nodiscard]] std::string encode_execution_response(const Outcome& outcome);
[[nodiscard]] std::string encode_queued_response(const JobId& job_id);
[[nodiscard]] std::string encode_delivery(const Delivery& delivery);
[[nodiscard]] std::string encode_validation_response(const std::vector<Violation>& violations);
[[nodiscard]] std::string encode_error_response(std::string_view error_type, std::string_view message);

/// Whole milliseconds, rounded to nearest.
[[nodiscard]] int64_t to_wire_milliseconds(Duration elapsed) noexcept;

}  // namespace code_sandbox
