/**
 * @file wire_codec.cpp
 * @brief Wire codec implementation using nlohmann/json.
 * @author Dimitris Kafetzis
 */

#include "protocol/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace code_sandbox {

using nlohmann::json;

namespace {

std::string dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

Error invalid(std::string_view detail) {
    return Error{ErrorCode::InvalidRequest, "Invalid request: " + std::string(detail)};
}

json optional_text(const std::optional<std::string>& text) {
    return text ? json(*text) : json(nullptr);
}

json encode_violations(const std::vector<Violation>& violations) {
    json list = json::array();
    for (const auto& v : violations) {
        list.push_back({
            {"line", v.location.line},
            {"column", v.location.column},
            {"message", v.message},
        });
    }
    return list;
}

json outcome_object(const Outcome& outcome) {
    return {
        {"success", outcome.succeeded()},
        {"stdout", outcome.stdout_text()},
        {"stderr", outcome.stderr_text()},
        {"error", optional_text(outcome.error())},
        {"error_type", optional_text(outcome.error_type())},
        {"execution_time_ms", to_wire_milliseconds(outcome.elapsed())},
        {"timed_out", outcome.timed_out()},
        {"security_violations", encode_violations(outcome.violations())},
    };
}

}  // namespace

int64_t to_wire_milliseconds(Duration elapsed) noexcept {
    return (elapsed.count() + 500) / 1000;
}

Result<Request> decode_request(std::string_view line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidRequest, std::string("Invalid JSON: ") + e.what()};
    }
    if (!message.is_object()) {
        return Error{ErrorCode::InvalidRequest, "Invalid JSON: expected an object"};
    }

    Request request;

    if (auto it = message.find("action"); it != message.end()) {
        if (!it->is_string()) return invalid("'action' must be a string");
        const auto action = it->get<std::string>();
        if (action == "execute") {
            request.action = RequestAction::Execute;
        } else if (action == "execute_async") {
            request.action = RequestAction::ExecuteAsync;
        } else if (action == "validate") {
            request.action = RequestAction::Validate;
        } else {
            return invalid("unknown action '" + action + "'");
        }
    }

    auto code = message.find("code");
    if (code == message.end() || !code->is_string()) {
        return invalid("'code' must be a string");
    }
    request.code = code->get<std::string>();
    if (request.code.empty()) return invalid("'code' must not be empty");

    if (auto it = message.find("timeout_seconds"); it != message.end() && !it->is_null()) {
        if (!it->is_number()) return invalid("'timeout_seconds' must be a number");
        const double seconds = it->get<double>();
        if (!(seconds > 0.0) || !std::isfinite(seconds)) {
            return invalid("'timeout_seconds' must be greater than 0");
        }
        // Huge values only need to survive until the ceiling clamps them
        const double ms = std::min(seconds * 1000.0,
                                   static_cast<double>(std::numeric_limits<int32_t>::max()));
        request.timeout = std::chrono::milliseconds(
            std::max<int64_t>(1, static_cast<int64_t>(std::llround(ms))));
    }

    if (request.action == RequestAction::ExecuteAsync) {
        auto handle = message.find("delivery_handle");
        if (handle == message.end() || !handle->is_string()) {
            return invalid("'delivery_handle' must be a string");
        }
        auto value = handle->get<std::string>();
        if (value.empty() || value.size() > kMaxDeliveryHandleLength) {
            return invalid("'delivery_handle' must be 1 to 256 characters");
        }
        request.delivery_handle = std::move(value);
    }

    return request;
}

std::string encode_execution_response(const Outcome& outcome) {
    return dump(outcome_object(outcome));
}

std::string encode_queued_response(const JobId& job_id) {
    return dump({{"job_id", job_id}, {"status", "queued"}});
}

std::string encode_delivery(const Delivery& delivery) {
    json payload = outcome_object(delivery.outcome);
    payload["type"] = "execution_result";
    payload["job_id"] = delivery.job_id;
    return dump(payload);
}

std::string encode_validation_response(const std::vector<Violation>& violations) {
    return dump({{"safe", violations.empty()}, {"security_violations", encode_violations(violations)}});
}

std::string encode_error_response(std::string_view error_type, std::string_view message) {
    return dump({
        {"success", false},
        {"error", std::string(message)},
        {"error_type", std::string(error_type)},
    });
}

}  // namespace code_sandbox
