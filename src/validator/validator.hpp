/**
 * @file validator.hpp
 * @brief Static security validator for submitted Python source.
 * @author Dimitris Kafetzis
 *
 * validate() is pure: no I/O, no shared mutable state. One Validator is
 * shared by the Dispatcher and every Worker thread.
 *
 * Pipeline:
 *   1. Size ceiling (SourceTooLarge, before any parsing)
 *   2. Tokenize + grammar check (fails closed with one SyntaxError)
 *   3. Security walk over the token stream, f-string fields included
 *
 * All violations of step 3 are collected and returned sorted by location.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "validator/security_policy.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace code_sandbox {

/// Marker for a source that passed validation.
struct Accepted {};

class Validator {
public:
    explicit Validator(std::shared_ptr<const SecurityPolicy> policy);

    [[nodiscard]] Result<Accepted, std::vector<Violation>> validate(std::string_view source) const;

    [[nodiscard]] const SecurityPolicy& policy() const noexcept { return *policy_; }

private:
    std::shared_ptr<const SecurityPolicy> policy_;
};

}  // namespace code_sandbox
