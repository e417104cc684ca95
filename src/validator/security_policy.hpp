/**
 * @file security_policy.hpp
 * @brief Immutable allow-list / block-list sets used by the validator and
 *        the in-sandbox runtime guard.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace code_sandbox {

/**
 * @brief Enumerated security rules, built once from SecurityConfig.
 *
 * All lookups are const; a single instance is shared between threads.
 */
class SecurityPolicy {
public:
    explicit SecurityPolicy(const SecurityConfig& config);

    static std::shared_ptr<const SecurityPolicy> from_config(const SecurityConfig& config);

    /// `module` may be dotted; only its top-level package is checked.
    [[nodiscard]] bool is_module_allowed(std::string_view module) const;
    [[nodiscard]] bool is_blocked_builtin(std::string_view name) const;
    [[nodiscard]] bool is_blocked_attribute(std::string_view name) const;
    [[nodiscard]] bool is_restricted_attribute_call(std::string_view name) const;

    [[nodiscard]] uint64_t max_source_bytes() const noexcept { return max_source_bytes_; }

    /// Sorted copies, used to parameterize the runtime guard.
    [[nodiscard]] const std::vector<std::string>& allowed_modules() const noexcept {
        return allowed_sorted_;
    }
    [[nodiscard]] const std::vector<std::string>& blocked_builtins() const noexcept {
        return blocked_builtins_sorted_;
    }

private:
    static bool contains(const std::unordered_set<std::string>& set, std::string_view key);

    std::unordered_set<std::string> allowed_modules_;
    std::unordered_set<std::string> blocked_builtins_;
    std::unordered_set<std::string> blocked_attributes_;
    std::unordered_set<std::string> restricted_attribute_calls_;
    std::vector<std::string> allowed_sorted_;
    std::vector<std::string> blocked_builtins_sorted_;
    uint64_t max_source_bytes_;
};

}  // namespace code_sandbox
