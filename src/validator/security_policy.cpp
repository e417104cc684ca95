/**
 * @file security_policy.cpp
 * @brief SecurityPolicy construction and lookups.
 */

#include "validator/security_policy.hpp"

#include <algorithm>

namespace code_sandbox {

namespace {

std::vector<std::string> sorted_unique(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

}  // namespace

SecurityPolicy::SecurityPolicy(const SecurityConfig& config)
    : allowed_modules_(config.allowed_modules.begin(), config.allowed_modules.end())
    , blocked_builtins_(config.blocked_builtins.begin(), config.blocked_builtins.end())
    , blocked_attributes_(config.blocked_attributes.begin(), config.blocked_attributes.end())
    , restricted_attribute_calls_(config.restricted_attribute_calls.begin(),
                                  config.restricted_attribute_calls.end())
    , allowed_sorted_(sorted_unique(config.allowed_modules))
    , blocked_builtins_sorted_(sorted_unique(config.blocked_builtins))
    , max_source_bytes_(config.max_source_bytes) {}

std::shared_ptr<const SecurityPolicy> SecurityPolicy::from_config(const SecurityConfig& config) {
    return std::make_shared<const SecurityPolicy>(config);
}

bool SecurityPolicy::contains(const std::unordered_set<std::string>& set, std::string_view key) {
    return set.find(std::string(key)) != set.end();
}

bool SecurityPolicy::is_module_allowed(std::string_view module) const {
    auto top = module.substr(0, module.find('.'));
    if (top.empty()) return false;
    return contains(allowed_modules_, top);
}

bool SecurityPolicy::is_blocked_builtin(std::string_view name) const {
    return contains(blocked_builtins_, name);
}

bool SecurityPolicy::is_blocked_attribute(std::string_view name) const {
    return contains(blocked_attributes_, name);
}

bool SecurityPolicy::is_restricted_attribute_call(std::string_view name) const {
    return contains(restricted_attribute_calls_, name);
}

}  // namespace code_sandbox
