/**
 * @file validator.cpp
 * @brief Validator implementation: grammar check and security walk.
 * @author Dimitris Kafetzis
 */

#include "validator/validator.hpp"

#include "validator/lexer.hpp"
#include "validator/parser.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <string>

namespace code_sandbox {

namespace {

bool is_dunder(std::string_view name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

bool is_ascii(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool is_open_bracket(const Token& tok) {
    return tok.is_op("(") || tok.is_op("[") || tok.is_op("{");
}

bool is_close_bracket(const Token& tok) {
    return tok.is_op(")") || tok.is_op("]") || tok.is_op("}");
}

// ─────────────────────────────────────────────
// Security walk
// ─────────────────────────────────────────────

/**
 * @brief Single pass over one token stream.
 *
 * A LexError return means an embedded f-string field or an import
 * statement failed to parse; the caller discards collected violations
 * and fails closed.
 */
class SecurityWalker {
public:
    SecurityWalker(const SecurityPolicy& policy,
                   const std::vector<Token>& tokens,
                   std::vector<Violation>& out)
        : policy_(policy), tokens_(tokens), out_(out) {}

    std::optional<LexError> walk() {
        for (pos_ = 0; pos_ < tokens_.size(); ++pos_) {
            const Token& tok = tokens_[pos_];
            switch (tok.kind) {
                case TokenKind::Newline:
                    raise_on_line_ = false;
                    prev_ = nullptr;
                    continue;
                case TokenKind::Indent:
                case TokenKind::Dedent:
                case TokenKind::EndOfInput:
                    continue;
                case TokenKind::String:
                    if (auto err = walk_embedded(tok)) return err;
                    break;
                case TokenKind::Operator:
                    if (is_open_bracket(tok)) ++depth_;
                    else if (is_close_bracket(tok) && depth_ > 0) --depth_;
                    if (tok.is_op(";")) {
                        raise_on_line_ = false;
                        prev_ = nullptr;
                        continue;
                    }
                    break;
                case TokenKind::Number:
                    break;
                case TokenKind::Name:
                    if (auto err = visit_name()) return err;
                    break;
            }
            prev_ = &tokens_[pos_];
        }
        return std::nullopt;
    }

private:
    [[nodiscard]] const Token& at(size_t index) const {
        return tokens_[std::min(index, tokens_.size() - 1)];
    }

    [[nodiscard]] bool prev_is(std::string_view text) const {
        return prev_ && prev_->text == text
            && (prev_->kind == TokenKind::Operator || prev_->kind == TokenKind::Name);
    }

    void report(ViolationKind kind, SourceLocation loc, std::string message) {
        out_.push_back(Violation{.kind = kind, .location = loc, .message = std::move(message)});
    }

    std::optional<LexError> walk_embedded(const Token& tok) {
        for (const auto& field : tok.embedded) {
            Lexer lexer(field.text, field.origin, Lexer::Mode::Expression);
            auto sub = lexer.tokenize();
            if (!sub) return sub.error();
            SecurityWalker nested(policy_, sub.value(), out_);
            if (auto err = nested.walk()) return err;
        }
        return std::nullopt;
    }

    std::optional<LexError> visit_name() {
        const Token& tok = tokens_[pos_];

        if (tok.text == "raise") raise_on_line_ = true;

        if (tok.text == "import" && !prev_is(".")) return scan_import();
        if (tok.text == "from" && !prev_is(".") && !prev_is("yield") && !raise_on_line_) {
            return scan_from_import();
        }

        if (!is_ascii(tok.text)) {
            report(ViolationKind::DisallowedConstruct, tok.location,
                   std::format("Non-ASCII identifier '{}' is not allowed.", tok.text));
            return std::nullopt;
        }

        const bool called = at(pos_ + 1).is_op("(");

        if (prev_is(".")) {
            if (policy_.is_blocked_attribute(tok.text)) {
                report(ViolationKind::DisallowedConstruct, tok.location,
                       std::format("Access to '{}' is not allowed.", tok.text));
            } else if (policy_.is_restricted_attribute_call(tok.text)) {
                report(ViolationKind::RestrictedCall, tok.location,
                       called ? std::format("Use of '.{}()' is not allowed.", tok.text)
                              : std::format("Reference to '.{}' is not allowed.", tok.text));
            }
            return std::nullopt;
        }

        if (prev_is("def") || prev_is("class")) return std::nullopt;

        if (policy_.is_blocked_builtin(tok.text)) {
            const bool keyword_argument = depth_ > 0 && at(pos_ + 1).is_op("=")
                && (prev_is("(") || prev_is(","));
            if (!keyword_argument) {
                report(ViolationKind::RestrictedCall, tok.location,
                       called ? std::format("Use of '{}()' is not allowed.", tok.text)
                              : std::format("Reference to '{}' is not allowed.", tok.text));
            }
            return std::nullopt;
        }

        if (is_dunder(tok.text) && policy_.is_blocked_attribute(tok.text)) {
            report(ViolationKind::DisallowedConstruct, tok.location,
                   std::format("Access to '{}' is not allowed.", tok.text));
        }
        return std::nullopt;
    }

    /// Reads `a.b.c` starting at `index`; empty when no name is there.
    std::string read_dotted(size_t& index) const {
        std::string name;
        if (at(index).kind != TokenKind::Name) return name;
        name = at(index).text;
        ++index;
        while (at(index).is_op(".") && at(index + 1).kind == TokenKind::Name) {
            name += '.';
            name += at(index + 1).text;
            index += 2;
        }
        return name;
    }

    // import a.b [as c], d ...
    std::optional<LexError> scan_import() {
        const auto loc = tokens_[pos_].location;
        size_t i = pos_ + 1;
        while (true) {
            auto module = read_dotted(i);
            if (module.empty()) return LexError{at(i).location, "invalid syntax"};
            if (!policy_.is_module_allowed(module)) {
                report(ViolationKind::DisallowedImport, loc,
                       std::format("Import of '{}' is not allowed.", module));
            }
            if (at(i).is_name("as")) {
                if (at(i + 1).kind != TokenKind::Name) {
                    return LexError{at(i + 1).location, "invalid syntax"};
                }
                i += 2;
            }
            if (!at(i).is_op(",")) break;
            ++i;
        }
        pos_ = i - 1;
        return std::nullopt;
    }

    // from [.]*module import (a [as b], ...) | *
    std::optional<LexError> scan_from_import() {
        const auto loc = tokens_[pos_].location;
        size_t i = pos_ + 1;

        size_t level = 0;
        while (at(i).is_op(".") || at(i).is_op("...")) {
            level += at(i).text.size();
            ++i;
        }
        std::string module;
        if (!at(i).is_name("import")) module = read_dotted(i);
        if (!at(i).is_name("import") || (level == 0 && module.empty())) {
            return LexError{at(i).location, "invalid syntax"};
        }
        ++i;

        if (level > 0) {
            report(ViolationKind::DisallowedImport, loc,
                   std::format("Relative import '{}{}' is not allowed.", std::string(level, '.'), module));
        } else if (!policy_.is_module_allowed(module)) {
            report(ViolationKind::DisallowedImport, loc,
                   std::format("Import from '{}' is not allowed.", module));
        }

        const bool parenthesized = at(i).is_op("(");
        if (parenthesized) ++i;

        if (at(i).is_op("*")) {
            ++i;
        } else {
            while (at(i).kind == TokenKind::Name) {
                const Token& name = at(i);
                if (policy_.is_blocked_attribute(name.text) || policy_.is_blocked_builtin(name.text)) {
                    report(ViolationKind::DisallowedConstruct, name.location,
                           std::format("Import of name '{}' is not allowed.", name.text));
                }
                ++i;
                if (at(i).is_name("as")) {
                    if (at(i + 1).kind != TokenKind::Name) {
                        return LexError{at(i + 1).location, "invalid syntax"};
                    }
                    i += 2;
                }
                if (!at(i).is_op(",")) break;
                ++i;
            }
        }

        if (parenthesized) {
            if (!at(i).is_op(")")) return LexError{at(i).location, "invalid syntax"};
            ++i;
        }
        pos_ = i - 1;
        return std::nullopt;
    }

    const SecurityPolicy& policy_;
    const std::vector<Token>& tokens_;
    std::vector<Violation>& out_;

    size_t pos_{0};
    int depth_{0};
    const Token* prev_{nullptr};
    bool raise_on_line_{false};
};

std::vector<Violation> syntax_violation(const LexError& err) {
    return {Violation{
        .kind = ViolationKind::SyntaxError,
        .location = err.location,
        .message = "Syntax error: " + err.message,
    }};
}

}  // namespace

Validator::Validator(std::shared_ptr<const SecurityPolicy> policy)
    : policy_(std::move(policy)) {}

Result<Accepted, std::vector<Violation>> Validator::validate(std::string_view source) const {
    if (source.size() > policy_->max_source_bytes()) {
        return std::vector<Violation>{Violation{
            .kind = ViolationKind::SourceTooLarge,
            .location = {},
            .message = std::format("Code exceeds maximum size of {} bytes", policy_->max_source_bytes()),
        }};
    }

    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (!tokens) return syntax_violation(tokens.error());

    if (auto err = check_syntax(tokens.value())) return syntax_violation(*err);

    std::vector<Violation> violations;
    SecurityWalker walker(*policy_, tokens.value(), violations);
    if (auto err = walker.walk()) return syntax_violation(*err);

    if (violations.empty()) return Accepted{};

    std::stable_sort(violations.begin(), violations.end(),
                     [](const Violation& a, const Violation& b) {
                         if (a.location.line != b.location.line) {
                             return a.location.line < b.location.line;
                         }
                         return a.location.column < b.location.column;
                     });
    return violations;
}

}  // namespace code_sandbox
