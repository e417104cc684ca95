/**
 * @file error_classifier.cpp
 * @brief Status report parsing and exception name classification.
 * @author Dimitris Kafetzis
 */

#include "runner/error_classifier.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace code_sandbox {

namespace {

// Subclasses are listed explicitly; the report carries only the leaf name
constexpr std::array<std::pair<std::string_view, ErrorKind>, 18> kKinds = {{
    {"ZeroDivisionError", ErrorKind::DivisionByZero},
    {"TypeError", ErrorKind::TypeError},
    {"ValueError", ErrorKind::ValueError},
    {"UnicodeError", ErrorKind::ValueError},
    {"UnicodeDecodeError", ErrorKind::ValueError},
    {"UnicodeEncodeError", ErrorKind::ValueError},
    {"NameError", ErrorKind::NameError},
    {"UnboundLocalError", ErrorKind::NameError},
    {"IndexError", ErrorKind::IndexError},
    {"KeyError", ErrorKind::KeyError},
    {"AttributeError", ErrorKind::AttributeError},
    {"ImportError", ErrorKind::ImportError},
    {"ModuleNotFoundError", ErrorKind::ImportError},
    {"RecursionError", ErrorKind::RecursionError},
    {"SyntaxError", ErrorKind::SyntaxError},
    {"IndentationError", ErrorKind::SyntaxError},
    {"TabError", ErrorKind::SyntaxError},
    {"AssertionError", ErrorKind::AssertionError},
}};

}  // namespace

std::optional<StatusReport> parse_status_report(std::string_view text) {
    if (text.empty()) return std::nullopt;

    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto type = doc.find("error_type");
    if (type == doc.end() || !type->is_string()) return std::nullopt;

    StatusReport report;
    report.type_name = type->get<std::string>();
    if (auto msg = doc.find("error"); msg != doc.end() && msg->is_string()) {
        report.message = msg->get<std::string>();
    }
    return report;
}

ErrorKind classify_error_type(std::string_view type_name) noexcept {
    for (const auto& [name, kind] : kKinds) {
        if (name == type_name) return kind;
    }
    return ErrorKind::Uncategorized;
}

}  // namespace code_sandbox
