/**
 * @file test_security_policy.cpp
 * @brief Unit tests for SecurityPolicy lookups.
 */

#include "validator/security_policy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace code_sandbox;

TEST(SecurityPolicyTest, DefaultAllowList) {
    SecurityPolicy policy(SecurityConfig{});
    EXPECT_TRUE(policy.is_module_allowed("math"));
    EXPECT_TRUE(policy.is_module_allowed("collections"));
    EXPECT_FALSE(policy.is_module_allowed("os"));
    EXPECT_FALSE(policy.is_module_allowed("subprocess"));
    EXPECT_FALSE(policy.is_module_allowed("socket"));
}

TEST(SecurityPolicyTest, DottedModuleUsesTopLevelPackage) {
    SecurityPolicy policy(SecurityConfig{});
    EXPECT_TRUE(policy.is_module_allowed("collections.abc"));
    EXPECT_FALSE(policy.is_module_allowed("os.path"));
    EXPECT_FALSE(policy.is_module_allowed("mathx"));
    EXPECT_FALSE(policy.is_module_allowed(""));
    EXPECT_FALSE(policy.is_module_allowed(".math"));
}

TEST(SecurityPolicyTest, BlockedNames) {
    SecurityPolicy policy(SecurityConfig{});
    EXPECT_TRUE(policy.is_blocked_builtin("eval"));
    EXPECT_TRUE(policy.is_blocked_builtin("open"));
    EXPECT_FALSE(policy.is_blocked_builtin("print"));

    EXPECT_TRUE(policy.is_blocked_attribute("__subclasses__"));
    EXPECT_TRUE(policy.is_blocked_attribute("f_globals"));
    EXPECT_FALSE(policy.is_blocked_attribute("__init__"));

    EXPECT_TRUE(policy.is_restricted_attribute_call("system"));
    EXPECT_FALSE(policy.is_restricted_attribute_call("append"));
}

TEST(SecurityPolicyTest, CustomConfig) {
    SecurityConfig config;
    config.allowed_modules = {"numpy"};
    config.blocked_builtins = {"print"};
    config.max_source_bytes = 64;

    auto policy = SecurityPolicy::from_config(config);
    EXPECT_TRUE(policy->is_module_allowed("numpy.linalg"));
    EXPECT_FALSE(policy->is_module_allowed("math"));
    EXPECT_TRUE(policy->is_blocked_builtin("print"));
    EXPECT_FALSE(policy->is_blocked_builtin("eval"));
    EXPECT_EQ(policy->max_source_bytes(), 64u);
}

TEST(SecurityPolicyTest, SortedListsAreDeduplicated) {
    SecurityConfig config;
    config.allowed_modules = {"re", "math", "re", "json"};
    SecurityPolicy policy(config);
    EXPECT_EQ(policy.allowed_modules(), (std::vector<std::string>{"json", "math", "re"}));
    EXPECT_TRUE(std::is_sorted(policy.blocked_builtins().begin(), policy.blocked_builtins().end()));
}
