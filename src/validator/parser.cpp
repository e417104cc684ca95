/**
 * @file parser.cpp
 * @brief Recursive-descent grammar check.
 * @author Dimitris Kafetzis
 */

#include "validator/parser.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <deque>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace code_sandbox {

namespace {

constexpr std::array<std::string_view, 35> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"
};

constexpr std::array<std::string_view, 13> kAugmentedOps = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="
};

constexpr std::array<std::string_view, 6> kComparisonOps = {
    "==", "!=", "<", ">", "<=", ">="
};

/// Binary operators from loosest (`|`) to tightest (`*`); empty slots pad the rows.
constexpr std::array<std::array<std::string_view, 5>, 6> kBinaryLevels = {{
    {"|"},
    {"^"},
    {"&"},
    {"<<", ">>"},
    {"+", "-"},
    {"*", "/", "//", "%", "@"},
}};

template <size_t N>
bool contains(const std::array<std::string_view, N>& words, std::string_view word) {
    return !word.empty() && std::find(words.begin(), words.end(), word) != words.end();
}

bool is_keyword(std::string_view word) {
    return contains(kKeywords, word);
}

bool is_identifier(const Token& tok) {
    return tok.kind == TokenKind::Name && !is_keyword(tok.text);
}

bool starts_expression(const Token& tok) {
    switch (tok.kind) {
        case TokenKind::Name:
            return !is_keyword(tok.text) || tok.text == "None" || tok.text == "True"
                || tok.text == "False" || tok.text == "not" || tok.text == "lambda"
                || tok.text == "await";
        case TokenKind::Number:
        case TokenKind::String:
            return true;
        case TokenKind::Operator:
            return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "-"
                || tok.text == "+" || tok.text == "~" || tok.text == "..." || tok.text == "*";
        default:
            return false;
    }
}

std::string describe_block(const Token& header) {
    const auto line = header.location.line;
    if (header.is_name("def")) return std::format("function definition on line {}", line);
    if (header.is_name("class")) return std::format("class definition on line {}", line);
    return std::format("'{}' statement on line {}", header.text, line);
}

// ─────────────────────────────────────────────
// Expression summaries
// ─────────────────────────────────────────────

enum class ExprKind : uint8_t {
    Name,
    Attribute,
    Subscript,
    Starred,
    Tuple,
    List,
    Other
};

/// What the parser remembers about an expression: enough to judge it as a target.
struct Expr {
    ExprKind kind;
    SourceLocation location;
    std::string_view what;              ///< Wording in "cannot assign to ..."
    bool assignable;
    SourceLocation culprit_location;    ///< First part that cannot be assigned
    std::string_view culprit;
};

Expr leaf(ExprKind kind, SourceLocation loc, std::string_view what) {
    const bool assignable = kind == ExprKind::Name || kind == ExprKind::Attribute
                         || kind == ExprKind::Subscript;
    return Expr{.kind = kind, .location = loc, .what = what, .assignable = assignable,
                .culprit_location = loc, .culprit = what};
}

Expr sequence(ExprKind kind, SourceLocation loc) {
    Expr seq = leaf(kind, loc, kind == ExprKind::Tuple ? "tuple" : "list");
    seq.assignable = true;
    return seq;
}

void absorb(Expr& seq, const Expr& element) {
    if (!seq.assignable || element.assignable) return;
    seq.assignable = false;
    seq.culprit = element.culprit;
    seq.culprit_location = element.culprit_location;
}

Expr starred(const Expr& inner, SourceLocation loc) {
    Expr star = leaf(ExprKind::Starred, loc, "starred");
    star.assignable = inner.assignable;
    star.culprit = inner.culprit;
    star.culprit_location = inner.culprit_location;
    return star;
}

// ─────────────────────────────────────────────
// Parser
// ─────────────────────────────────────────────

struct ParseFailure {
    LexError error;
};

struct Scope {
    bool function = false;
    bool async = false;
    uint32_t loops = 0;
};

class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens) : tokens_(&tokens) {
        scopes_.push_back(Scope{});
    }

    /// Throws ParseFailure on the first grammar error.
    void module() {
        while (peek().kind != TokenKind::EndOfInput) statement();
    }

    [[nodiscard]] const std::optional<LexError>& context_error() const noexcept { return context_error_; }

private:
    class ScopeGuard {
    public:
        ScopeGuard(Parser& parser, Scope scope) : parser_(parser) { parser_.scopes_.push_back(scope); }
        ~ScopeGuard() { parser_.scopes_.pop_back(); }
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        Parser& parser_;
    };

    class LoopGuard {
    public:
        explicit LoopGuard(Scope& scope) : scope_(scope) { ++scope_.loops; }
        ~LoopGuard() { --scope_.loops; }
        LoopGuard(const LoopGuard&) = delete;
        LoopGuard& operator=(const LoopGuard&) = delete;

    private:
        Scope& scope_;
    };

    /// Parses an f-string field's tokens in place of the current stream.
    class TokenSwap {
    public:
        TokenSwap(Parser& parser, const std::vector<Token>& tokens)
            : parser_(parser)
            , saved_tokens_(std::exchange(parser.tokens_, &tokens))
            , saved_pos_(std::exchange(parser.pos_, 0)) {}
        ~TokenSwap() {
            parser_.tokens_ = saved_tokens_;
            parser_.pos_ = saved_pos_;
        }
        TokenSwap(const TokenSwap&) = delete;
        TokenSwap& operator=(const TokenSwap&) = delete;

    private:
        Parser& parser_;
        const std::vector<Token>* saved_tokens_;
        size_t saved_pos_;
    };

    // ── Token access ─────────────────────────

    [[nodiscard]] const Token& peek(size_t ahead = 0) const {
        const auto& tokens = *tokens_;
        return tokens[std::min(pos_ + ahead, tokens.size() - 1)];
    }

    const Token& next() {
        const Token& tok = peek();
        if (pos_ + 1 < tokens_->size()) ++pos_;
        return tok;
    }

    [[nodiscard]] bool at_op(std::string_view op) const { return peek().is_op(op); }
    [[nodiscard]] bool at_keyword(std::string_view word) const { return peek().is_name(word); }
    [[nodiscard]] bool at_comprehension() const {
        return at_keyword("for") || (at_keyword("async") && peek(1).is_name("for"));
    }

    bool accept_op(std::string_view op) {
        if (!at_op(op)) return false;
        next();
        return true;
    }

    bool accept_keyword(std::string_view word) {
        if (!at_keyword(word)) return false;
        next();
        return true;
    }

    bool accept_newline() {
        if (peek().kind != TokenKind::Newline) return false;
        next();
        return true;
    }

    void expect_close(std::string_view op) {
        if (!accept_op(op)) invalid(peek());
    }

    void expect_colon() {
        if (!accept_op(":")) fail(peek().location, "expected ':'");
    }

    [[noreturn]] void fail(SourceLocation loc, std::string message) const {
        throw ParseFailure{LexError{.location = loc, .message = std::move(message)}};
    }

    [[noreturn]] void invalid(const Token& at) const { fail(at.location, "invalid syntax"); }

    /// Compiler-stage errors; reported only when the grammar itself holds.
    void context_error(const Token& at, std::string message) {
        if (!context_error_) context_error_ = LexError{.location = at.location, .message = std::move(message)};
    }

    std::string_view name() {
        const Token& tok = peek();
        if (!is_identifier(tok)) invalid(tok);
        next();
        return tok.text;
    }

    Scope& scope() { return scopes_.back(); }

    /// Runs `parse`; on failure rewinds and reports false.
    template <typename Fn>
    bool attempt(Fn&& parse) {
        const size_t saved_pos = pos_;
        auto saved_context = context_error_;
        try {
            parse();
            return true;
        } catch (const ParseFailure&) {
            pos_ = saved_pos;
            context_error_ = std::move(saved_context);
            return false;
        }
    }

    // ── Statements ───────────────────────────

    void statement() {
        const Token& tok = peek();
        if (tok.kind == TokenKind::Indent) fail(tok.location, "unexpected indent");
        if (compound_statement()) return;
        simple_statements();
    }

    bool compound_statement() {
        const Token& tok = peek();
        if (tok.is_op("@")) {
            decorated();
            return true;
        }
        if (tok.kind != TokenKind::Name) return false;
        if (tok.text == "if") {
            if_statement();
        } else if (tok.text == "while") {
            while_statement();
        } else if (tok.text == "for") {
            for_statement();
        } else if (tok.text == "try") {
            try_statement();
        } else if (tok.text == "with") {
            with_statement();
        } else if (tok.text == "def") {
            function_definition(false);
        } else if (tok.text == "class") {
            class_definition();
        } else if (tok.text == "async") {
            async_statement();
        } else if (tok.text == "match") {
            return match_statement();
        } else {
            return false;
        }
        return true;
    }

    void block(const Token& header) {
        expect_colon();
        body(header);
    }

    void body(const Token& header) {
        if (!accept_newline()) {
            simple_statements();
            return;
        }
        if (peek().kind != TokenKind::Indent) {
            fail(peek().location, std::format("expected an indented block after {}", describe_block(header)));
        }
        next();
        while (peek().kind != TokenKind::Dedent && peek().kind != TokenKind::EndOfInput) statement();
        if (peek().kind == TokenKind::Dedent) next();
    }

    void loop_body(const Token& header) {
        expect_colon();
        LoopGuard loop(scope());
        body(header);
    }

    void else_clause() {
        if (!at_keyword("else")) return;
        const Token& other = next();
        block(other);
    }

    void if_statement() {
        const Token& header = next();
        named_expression();
        block(header);
        while (at_keyword("elif")) {
            const Token& elif = next();
            named_expression();
            block(elif);
        }
        else_clause();
    }

    void while_statement() {
        const Token& header = next();
        named_expression();
        loop_body(header);
        else_clause();
    }

    void for_statement() {
        const Token& header = next();
        check_target(target_list());
        if (!accept_keyword("in")) invalid(peek());
        star_expressions();
        loop_body(header);
        else_clause();
    }

    void try_statement() {
        const Token& header = next();
        block(header);

        bool plain = false;
        bool grouped = false;
        bool bare = false;
        while (at_keyword("except")) {
            const Token& clause = next();
            if (bare) fail(clause.location, "default 'except:' must be last");
            const bool star = accept_op("*");
            (star ? grouped : plain) = true;
            if (plain && grouped) {
                fail(clause.location, "cannot have both 'except' and 'except*' on the same 'try'");
            }
            if (at_op(":")) {
                if (star) fail(peek().location, "expected one or more exception types");
                bare = true;
            } else {
                expression();
                while (accept_op(",")) expression();
                if (accept_keyword("as")) name();
            }
            block(clause);
        }

        const bool handled = plain || grouped;
        if (at_keyword("else")) {
            if (!handled) invalid(peek());
            const Token& other = next();
            block(other);
        }
        if (at_keyword("finally")) {
            const Token& last = next();
            block(last);
            return;
        }
        if (!handled) fail(peek().location, "expected 'except' or 'finally' block");
    }

    void with_statement() {
        const Token& header = next();
        const bool grouped = at_op("(") && attempt([&] {
            next();
            with_item();
            while (accept_op(",")) {
                if (at_op(")")) break;
                with_item();
            }
            if (!accept_op(")") || !at_op(":")) invalid(peek());
        });
        if (!grouped) {
            with_item();
            while (accept_op(",")) with_item();
        }
        block(header);
    }

    void with_item() {
        expression();
        if (accept_keyword("as")) check_target(star_target());
    }

    void function_definition(bool async) {
        const Token& header = next();
        name();
        if (at_op("[")) type_parameters();
        if (!accept_op("(")) fail(peek().location, "expected '('");
        parameters(true, ")");
        expect_close(")");
        if (accept_op("->")) expression();
        expect_colon();

        ScopeGuard guard(*this, Scope{.function = true, .async = async, .loops = 0});
        body(header);
    }

    void class_definition() {
        const Token& header = next();
        name();
        if (at_op("[")) type_parameters();
        if (accept_op("(")) arguments();
        expect_colon();

        ScopeGuard guard(*this, Scope{});
        body(header);
    }

    void decorated() {
        while (accept_op("@")) {
            named_expression();
            if (!accept_newline()) invalid(peek());
        }
        if (at_keyword("def")) {
            function_definition(false);
        } else if (at_keyword("class")) {
            class_definition();
        } else if (at_keyword("async") && peek(1).is_name("def")) {
            next();
            function_definition(true);
        } else {
            invalid(peek());
        }
    }

    void async_statement() {
        const Token& async = next();
        if (at_keyword("def")) {
            function_definition(true);
        } else if (at_keyword("for")) {
            if (!scope().async) context_error(async, "'async for' outside async function");
            for_statement();
        } else if (at_keyword("with")) {
            if (!scope().async) context_error(async, "'async with' outside async function");
            with_statement();
        } else {
            invalid(peek());
        }
    }

    /// Parameter list of a def (`annotated`) or a lambda, up to `closer`.
    void parameters(bool annotated, std::string_view closer) {
        std::vector<std::string_view> seen;
        auto declare = [&](const Token& tok) {
            auto id = name();
            if (std::find(seen.begin(), seen.end(), id) != seen.end()) {
                fail(tok.location, std::format("duplicate argument '{}' in function definition", id));
            }
            seen.push_back(id);
        };

        bool any = false;
        bool slash = false;
        bool star = false;
        bool var_keyword = false;
        bool defaulted = false;
        bool bare_star = false;

        while (!at_op(closer)) {
            const Token& tok = peek();
            if (var_keyword) fail(tok.location, "arguments cannot follow var-keyword argument");

            if (accept_op("/")) {
                if (slash) fail(tok.location, "/ may appear only once");
                if (star) fail(tok.location, "/ must be ahead of *");
                if (!any) fail(tok.location, "at least one argument must precede /");
                slash = true;
            } else if (accept_op("**")) {
                if (bare_star) fail(tok.location, "named arguments must follow bare *");
                declare(peek());
                if (annotated && accept_op(":")) expression();
                var_keyword = true;
            } else if (accept_op("*")) {
                if (star) fail(tok.location, "* argument may appear only once");
                star = true;
                if (at_op(",")) {
                    bare_star = true;
                } else if (at_op(closer)) {
                    fail(tok.location, "named arguments must follow bare *");
                } else {
                    declare(peek());
                    if (annotated && accept_op(":")) star_expression();
                }
            } else {
                declare(tok);
                if (annotated && accept_op(":")) expression();
                if (accept_op("=")) {
                    expression();
                    defaulted = true;
                } else if (defaulted && !star) {
                    fail(tok.location, "parameter without a default follows parameter with a default");
                }
                bare_star = false;
            }
            any = true;
            if (!accept_op(",")) break;
        }
        if (bare_star) fail(peek().location, "named arguments must follow bare *");
    }

    void type_parameters() {
        next();
        if (at_op("]")) fail(peek().location, "Type parameter list cannot be empty");
        do {
            if (at_op("]")) break;
            if (!accept_op("**")) accept_op("*");
            name();
            if (accept_op(":")) expression();
            if (accept_op("=")) star_expression();
        } while (accept_op(","));
        expect_close("]");
    }

    // ── match ────────────────────────────────

    /// `match` is a soft keyword: false leaves the tokens for an expression statement.
    bool match_statement() {
        const Token& header = peek();
        const bool is_match = attempt([&] {
            next();
            star_named_expression();
            while (accept_op(",")) {
                if (at_op(":")) break;
                star_named_expression();
            }
            if (!accept_op(":") || peek().kind != TokenKind::Newline) invalid(peek());
        });
        if (!is_match) return false;

        next();
        if (peek().kind != TokenKind::Indent) {
            fail(peek().location, std::format("expected an indented block after {}", describe_block(header)));
        }
        next();
        do {
            case_block();
        } while (peek().kind != TokenKind::Dedent && peek().kind != TokenKind::EndOfInput);
        if (peek().kind == TokenKind::Dedent) next();
        return true;
    }

    void case_block() {
        const Token& header = peek();
        if (!header.is_name("case")) invalid(header);
        next();
        maybe_star_pattern();
        while (accept_op(",")) {
            if (at_op(":") || at_keyword("if")) break;
            maybe_star_pattern();
        }
        if (accept_keyword("if")) named_expression();
        block(header);
    }

    void maybe_star_pattern() {
        if (accept_op("*")) {
            name();
            return;
        }
        as_pattern();
    }

    void as_pattern() {
        closed_pattern();
        while (accept_op("|")) closed_pattern();
        if (accept_keyword("as")) {
            const Token& tok = peek();
            if (name() == "_") fail(tok.location, "cannot use '_' as a target");
        }
    }

    void closed_pattern() {
        const Token& tok = peek();
        if (tok.kind == TokenKind::Number || tok.is_op("-")) {
            signed_number();
            if (at_op("+") || at_op("-")) {
                next();
                if (peek().kind != TokenKind::Number) invalid(peek());
                next();
            }
            return;
        }
        if (tok.kind == TokenKind::String) {
            strings();
            return;
        }
        if (tok.is_name("None") || tok.is_name("True") || tok.is_name("False")) {
            next();
            return;
        }
        if (tok.is_op("(") || tok.is_op("[")) {
            const std::string_view closer = tok.is_op("(") ? ")" : "]";
            next();
            while (!at_op(closer)) {
                maybe_star_pattern();
                if (!accept_op(",")) break;
            }
            expect_close(closer);
            return;
        }
        if (tok.is_op("{")) {
            mapping_pattern();
            return;
        }
        if (is_identifier(tok)) {
            name();
            while (accept_op(".")) name();
            if (accept_op("(")) class_pattern_arguments();
            return;
        }
        invalid(tok);
    }

    void signed_number() {
        accept_op("-");
        if (peek().kind != TokenKind::Number) invalid(peek());
        next();
    }

    void mapping_pattern() {
        next();
        while (!at_op("}")) {
            if (accept_op("**")) {
                name();
                accept_op(",");
                break;
            }
            closed_pattern();
            if (!accept_op(":")) invalid(peek());
            as_pattern();
            if (!accept_op(",")) break;
        }
        expect_close("}");
    }

    void class_pattern_arguments() {
        while (!at_op(")")) {
            if (is_identifier(peek()) && peek(1).is_op("=")) {
                next();
                next();
            }
            as_pattern();
            if (!accept_op(",")) break;
        }
        expect_close(")");
    }

    // ── Simple statements ────────────────────

    void simple_statements() {
        while (true) {
            simple_statement();
            if (accept_newline()) return;
            if (!accept_op(";")) invalid(peek());
            if (accept_newline()) return;
        }
    }

    void simple_statement() {
        const Token& tok = peek();
        if (tok.kind == TokenKind::Name) {
            if (tok.text == "pass") {
                next();
                return;
            }
            if (tok.text == "break" || tok.text == "continue") {
                if (scope().loops == 0) {
                    context_error(tok, tok.text == "break" ? "'break' outside loop"
                                                           : "'continue' not properly in loop");
                }
                next();
                return;
            }
            if (tok.text == "return") {
                if (!scope().function) context_error(tok, "'return' outside function");
                next();
                if (starts_expression(peek())) star_expressions();
                return;
            }
            if (tok.text == "raise") {
                next();
                if (starts_expression(peek())) {
                    expression();
                    if (accept_keyword("from")) expression();
                }
                return;
            }
            if (tok.text == "global" || tok.text == "nonlocal") {
                if (tok.text == "nonlocal" && scopes_.size() == 1) {
                    context_error(tok, "nonlocal declaration not allowed at module level");
                }
                next();
                name();
                while (accept_op(",")) name();
                return;
            }
            if (tok.text == "del") {
                next();
                delete_targets();
                return;
            }
            if (tok.text == "assert") {
                next();
                expression();
                if (accept_op(",")) expression();
                return;
            }
            if (tok.text == "import") {
                import_names();
                return;
            }
            if (tok.text == "from") {
                import_from();
                return;
            }
            if (tok.text == "type" && is_identifier(peek(1)) && (peek(2).is_op("=") || peek(2).is_op("["))) {
                next();
                name();
                if (at_op("[")) type_parameters();
                if (!accept_op("=")) invalid(peek());
                expression();
                return;
            }
        }
        expression_statement();
    }

    void delete_targets() {
        do {
            Expr target = bitwise_or();
            if (!target.assignable) {
                fail(target.culprit_location, std::format("cannot delete {}", target.culprit));
            }
        } while (accept_op(",") && starts_expression(peek()));
    }

    void dotted_name() {
        name();
        while (accept_op(".")) name();
    }

    void import_names() {
        next();
        do {
            dotted_name();
            if (accept_keyword("as")) name();
        } while (accept_op(","));
    }

    void import_from() {
        next();
        bool relative = false;
        while (at_op(".") || at_op("...")) {
            next();
            relative = true;
        }
        if (!at_keyword("import") || !relative) dotted_name();
        if (!accept_keyword("import")) invalid(peek());

        if (at_op("*")) {
            const Token& star = next();
            if (scopes_.size() > 1) context_error(star, "import * only allowed at module level");
            return;
        }

        const bool grouped = accept_op("(");
        name();
        if (accept_keyword("as")) name();
        while (at_op(",")) {
            const Token& comma = next();
            if (grouped && at_op(")")) break;
            if (!grouped && !is_identifier(peek())) {
                fail(comma.location, "trailing comma not allowed without surrounding parentheses");
            }
            name();
            if (accept_keyword("as")) name();
        }
        if (grouped) expect_close(")");
    }

    void expression_statement() {
        if (at_keyword("yield")) {
            yield_expression();
            return;
        }

        Expr first = star_expressions();
        if (at_op(":")) {
            annotated_assignment(first);
        } else if (peek().kind == TokenKind::Operator && contains(kAugmentedOps, peek().text)) {
            if (first.kind != ExprKind::Name && first.kind != ExprKind::Attribute
                && first.kind != ExprKind::Subscript) {
                fail(first.location,
                     std::format("'{}' is an illegal expression for augmented assignment", first.what));
            }
            next();
            assigned_value();
        } else if (at_op("=")) {
            Expr target = first;
            while (accept_op("=")) {
                check_target(target);
                target = assigned_value();
            }
            if (target.kind == ExprKind::Starred) fail(target.location, "can't use starred expression here");
        } else if (first.kind == ExprKind::Starred) {
            fail(first.location, "can't use starred expression here");
        }
    }

    void annotated_assignment(const Expr& target) {
        if (target.kind == ExprKind::Tuple) {
            fail(target.location, "only single target (not tuple) can be annotated");
        }
        if (target.kind == ExprKind::List) {
            fail(target.location, "only single target (not list) can be annotated");
        }
        if (!target.assignable || target.kind == ExprKind::Starred) {
            fail(target.location, "illegal target for annotation");
        }
        next();
        expression();
        if (accept_op("=")) assigned_value();
    }

    Expr assigned_value() {
        if (at_keyword("yield")) return yield_expression();
        return star_expressions();
    }

    void check_target(const Expr& target) {
        if (target.kind == ExprKind::Starred) {
            fail(target.location, "starred assignment target must be in a list or tuple");
        }
        if (!target.assignable) {
            fail(target.culprit_location, std::format("cannot assign to {}", target.culprit));
        }
    }

    /// Comma-separated targets of a for clause; stops before `in`.
    Expr target_list() {
        Expr first = star_target();
        if (!at_op(",")) return first;

        Expr tuple = sequence(ExprKind::Tuple, first.location);
        absorb(tuple, first);
        while (accept_op(",")) {
            if (!starts_expression(peek())) break;
            absorb(tuple, star_target());
        }
        return tuple;
    }

    Expr star_target() {
        if (at_op("*")) {
            const Token& star = next();
            return starred(bitwise_or(), star.location);
        }
        return bitwise_or();
    }

    // ── Expressions ──────────────────────────

    Expr star_expressions() {
        Expr first = star_expression();
        if (!at_op(",")) return first;

        Expr tuple = sequence(ExprKind::Tuple, first.location);
        absorb(tuple, first);
        while (accept_op(",")) {
            if (!starts_expression(peek())) break;
            absorb(tuple, star_expression());
        }
        return tuple;
    }

    Expr star_expression() {
        if (at_op("*")) {
            const Token& star = next();
            return starred(bitwise_or(), star.location);
        }
        return expression();
    }

    Expr star_named_expression() {
        if (at_op("*")) {
            const Token& star = next();
            return starred(bitwise_or(), star.location);
        }
        return named_expression();
    }

    Expr named_expression() {
        const Token& tok = peek();
        if (tok.kind == TokenKind::Name && peek(1).is_op(":=")) {
            if (is_keyword(tok.text)) {
                fail(tok.location, std::format("cannot use assignment expressions with {}", tok.text));
            }
            next();
            next();
            expression();
            return leaf(ExprKind::Other, tok.location, "named expression");
        }
        Expr value = expression();
        if (at_op(":=")) {
            fail(value.location, std::format("cannot use assignment expressions with {}", value.what));
        }
        return value;
    }

    Expr expression() {
        if (at_keyword("lambda")) return lambda_expression();

        Expr body = disjunction();
        if (!accept_keyword("if")) return body;
        disjunction();
        if (!accept_keyword("else")) fail(peek().location, "expected 'else' after 'if' expression");
        expression();
        return leaf(ExprKind::Other, body.location, "conditional expression");
    }

    Expr lambda_expression() {
        const Token& tok = next();
        parameters(false, ":");
        if (!accept_op(":")) invalid(peek());

        ScopeGuard guard(*this, Scope{.function = true, .async = false, .loops = 0});
        expression();
        return leaf(ExprKind::Other, tok.location, "lambda");
    }

    Expr disjunction() {
        Expr left = conjunction();
        if (!at_keyword("or")) return left;
        while (accept_keyword("or")) conjunction();
        return leaf(ExprKind::Other, left.location, "expression");
    }

    Expr conjunction() {
        Expr left = inversion();
        if (!at_keyword("and")) return left;
        while (accept_keyword("and")) inversion();
        return leaf(ExprKind::Other, left.location, "expression");
    }

    Expr inversion() {
        if (!at_keyword("not")) return comparison();
        const Token& tok = next();
        inversion();
        return leaf(ExprKind::Other, tok.location, "expression");
    }

    Expr comparison() {
        Expr left = bitwise_or();
        bool compared = false;
        while (true) {
            const Token& tok = peek();
            if (tok.kind == TokenKind::Operator && contains(kComparisonOps, tok.text)) {
                next();
            } else if (tok.is_name("in")) {
                next();
            } else if (tok.is_name("not") && peek(1).is_name("in")) {
                next();
                next();
            } else if (tok.is_name("is")) {
                next();
                accept_keyword("not");
            } else {
                break;
            }
            bitwise_or();
            compared = true;
        }
        return compared ? leaf(ExprKind::Other, left.location, "comparison") : left;
    }

    Expr bitwise_or() { return binary(0); }

    Expr binary(size_t level) {
        if (level == kBinaryLevels.size()) return factor();

        Expr left = binary(level + 1);
        bool combined = false;
        while (peek().kind == TokenKind::Operator && contains(kBinaryLevels[level], peek().text)) {
            next();
            binary(level + 1);
            combined = true;
        }
        return combined ? leaf(ExprKind::Other, left.location, "expression") : left;
    }

    Expr factor() {
        if (at_op("+") || at_op("-") || at_op("~")) {
            const Token& tok = next();
            factor();
            return leaf(ExprKind::Other, tok.location, "expression");
        }
        return power();
    }

    Expr power() {
        Expr base = await_primary();
        if (!accept_op("**")) return base;
        factor();
        return leaf(ExprKind::Other, base.location, "expression");
    }

    Expr await_primary() {
        if (!at_keyword("await")) return primary();

        const Token& tok = next();
        if (!scope().function) {
            context_error(tok, "'await' outside function");
        } else if (!scope().async) {
            context_error(tok, "'await' outside async function");
        }
        primary();
        return leaf(ExprKind::Other, tok.location, "await expression");
    }

    Expr primary() {
        Expr expr = atom();
        while (true) {
            if (accept_op(".")) {
                name();
                expr = leaf(ExprKind::Attribute, expr.location, "attribute");
            } else if (accept_op("(")) {
                arguments();
                expr = leaf(ExprKind::Other, expr.location, "function call");
            } else if (accept_op("[")) {
                subscript();
                expr = leaf(ExprKind::Subscript, expr.location, "subscript");
            } else {
                return expr;
            }
        }
    }

    Expr atom() {
        const Token& tok = peek();
        switch (tok.kind) {
            case TokenKind::Number:
                next();
                return leaf(ExprKind::Other, tok.location, "literal");
            case TokenKind::String:
                return strings();
            case TokenKind::Name:
                if (tok.text == "True" || tok.text == "False" || tok.text == "None") {
                    next();
                    return leaf(ExprKind::Other, tok.location, tok.text);
                }
                if (is_keyword(tok.text)) break;
                next();
                return leaf(ExprKind::Name, tok.location, "name");
            case TokenKind::Operator:
                if (tok.text == "(") return parenthesized();
                if (tok.text == "[") return list_display();
                if (tok.text == "{") return brace_display();
                if (tok.text == "...") {
                    next();
                    return leaf(ExprKind::Other, tok.location, "ellipsis");
                }
                break;
            default:
                break;
        }
        invalid(tok);
    }

    Expr strings() {
        const Token& first = peek();
        std::optional<bool> bytes;
        bool formatted = false;
        while (peek().kind == TokenKind::String) {
            const Token& tok = next();
            const auto prefix = std::string_view(tok.text).substr(0, tok.text.find_first_of("'\""));
            const bool is_bytes = prefix.find_first_of("bB") != std::string_view::npos;
            if (bytes && *bytes != is_bytes) fail(first.location, "cannot mix bytes and nonbytes literals");
            bytes = is_bytes;
            formatted = formatted || prefix.find_first_of("fFtT") != std::string_view::npos;
            for (const auto& field : tok.embedded) replacement_field(field);
        }
        return leaf(ExprKind::Other, first.location, formatted ? "f-string expression" : "literal");
    }

    void replacement_field(const EmbeddedExpression& field) {
        std::string_view text = field.text;
        // `{value=}` echoes its own source text
        const auto end = text.find_last_not_of(" \t\n");
        if (end != std::string_view::npos && end > 0 && text[end] == '='
            && std::string_view("=!<>").find(text[end - 1]) == std::string_view::npos) {
            text = text.substr(0, end);
        }

        Lexer lexer(text, field.origin, Lexer::Mode::Expression);
        auto tokens = lexer.tokenize();
        if (!tokens) throw ParseFailure{tokens.error()};

        TokenSwap swap(*this, tokens.value());
        if (at_keyword("yield")) {
            yield_expression();
        } else {
            star_expressions();
        }
        if (peek().kind != TokenKind::EndOfInput) invalid(peek());
    }

    Expr parenthesized() {
        const Token& open = next();
        if (accept_op(")")) return sequence(ExprKind::Tuple, open.location);

        if (at_keyword("yield")) {
            yield_expression();
            expect_close(")");
            return leaf(ExprKind::Other, open.location, "yield expression");
        }

        Expr first = star_named_expression();
        if (at_comprehension()) {
            comprehension(first);
            expect_close(")");
            return leaf(ExprKind::Other, open.location, "generator expression");
        }
        if (accept_op(")")) {
            if (first.kind == ExprKind::Starred) fail(first.location, "cannot use starred expression here");
            return first;
        }
        if (!at_op(",")) invalid(peek());

        Expr tuple = sequence(ExprKind::Tuple, open.location);
        absorb(tuple, first);
        while (accept_op(",")) {
            if (at_op(")")) break;
            absorb(tuple, star_named_expression());
        }
        expect_close(")");
        return tuple;
    }

    Expr list_display() {
        const Token& open = next();
        Expr list = sequence(ExprKind::List, open.location);
        if (accept_op("]")) return list;

        Expr first = star_named_expression();
        if (at_comprehension()) {
            comprehension(first);
            expect_close("]");
            return leaf(ExprKind::Other, open.location, "list comprehension");
        }
        absorb(list, first);
        while (accept_op(",")) {
            if (at_op("]")) break;
            absorb(list, star_named_expression());
        }
        expect_close("]");
        return list;
    }

    Expr brace_display() {
        const Token& open = next();
        if (accept_op("}")) return leaf(ExprKind::Other, open.location, "dict literal");

        if (accept_op("**")) {
            bitwise_or();
            return dict_entries(open);
        }

        Expr first = star_named_expression();
        if (accept_op(":")) {
            expression();
            if (at_comprehension()) {
                comprehension(leaf(ExprKind::Other, first.location, "dict entry"));
                expect_close("}");
                return leaf(ExprKind::Other, open.location, "dict comprehension");
            }
            return dict_entries(open);
        }
        if (at_comprehension()) {
            comprehension(first);
            expect_close("}");
            return leaf(ExprKind::Other, open.location, "set comprehension");
        }
        while (accept_op(",")) {
            if (at_op("}")) break;
            star_named_expression();
        }
        expect_close("}");
        return leaf(ExprKind::Other, open.location, "set display");
    }

    /// Remaining `key: value` and `**mapping` entries after the first one.
    Expr dict_entries(const Token& open) {
        while (accept_op(",")) {
            if (at_op("}")) break;
            if (accept_op("**")) {
                bitwise_or();
                continue;
            }
            expression();
            if (!accept_op(":")) fail(peek().location, "':' expected after dictionary key");
            expression();
        }
        expect_close("}");
        return leaf(ExprKind::Other, open.location, "dict literal");
    }

    void comprehension(const Expr& element) {
        if (element.kind == ExprKind::Starred) {
            fail(element.location, "iterable unpacking cannot be used in comprehension");
        }
        while (at_comprehension()) {
            const Token& start = peek();
            if (accept_keyword("async") && !scope().async) {
                context_error(start, "asynchronous comprehension outside of an asynchronous function");
            }
            next();
            check_target(target_list());
            if (!accept_keyword("in")) invalid(peek());
            disjunction();
            while (accept_keyword("if")) disjunction();
        }
    }

    /// Call arguments after '('; consumes the closing ')'.
    void arguments() {
        bool keyword = false;
        bool mapping = false;
        size_t count = 0;
        const Token* generator = nullptr;

        while (!at_op(")")) {
            const Token& tok = peek();
            if (accept_op("**")) {
                expression();
                mapping = true;
            } else if (accept_op("*")) {
                if (mapping) fail(tok.location, "iterable argument unpacking follows keyword argument unpacking");
                expression();
            } else if (tok.kind == TokenKind::Name && peek(1).is_op("=")) {
                if (tok.text == "True" || tok.text == "False" || tok.text == "None") {
                    fail(tok.location, std::format("cannot assign to {}", tok.text));
                }
                if (is_keyword(tok.text)) invalid(tok);
                next();
                next();
                expression();
                keyword = true;
            } else {
                Expr value = named_expression();
                if (at_comprehension()) {
                    comprehension(value);
                    generator = &tok;
                } else if (at_op("=")) {
                    fail(value.location, "expression cannot contain assignment, perhaps you meant \"==\"?");
                }
                if (mapping) fail(tok.location, "positional argument follows keyword argument unpacking");
                if (keyword) fail(tok.location, "positional argument follows keyword argument");
            }
            ++count;
            if (!accept_op(",")) break;
        }
        expect_close(")");
        if (generator && count > 1) fail(generator->location, "Generator expression must be parenthesized");
    }

    /// Subscript after '['; consumes the closing ']'.
    void subscript() {
        if (at_op("]")) invalid(peek());
        do {
            if (at_op("]")) break;
            slice();
        } while (accept_op(","));
        expect_close("]");
    }

    void slice() {
        if (accept_op("*")) {
            bitwise_or();
            return;
        }
        if (!at_op(":")) {
            named_expression();
            if (!at_op(":")) return;
        }
        next();
        if (!at_op(":") && !at_op(",") && !at_op("]")) expression();
        if (accept_op(":") && !at_op(",") && !at_op("]")) expression();
    }

    Expr yield_expression() {
        const Token& tok = next();
        if (!scope().function) context_error(tok, "'yield' outside function");
        if (accept_keyword("from")) {
            expression();
        } else if (starts_expression(peek())) {
            star_expressions();
        }
        return leaf(ExprKind::Other, tok.location, "yield expression");
    }

    const std::vector<Token>* tokens_;
    size_t pos_{0};
    std::deque<Scope> scopes_;
    std::optional<LexError> context_error_;
};

}  // namespace

std::optional<LexError> check_syntax(const std::vector<Token>& tokens) {
    if (tokens.empty()) return std::nullopt;

    Parser parser(tokens);
    try {
        parser.module();
    } catch (const ParseFailure& failure) {
        return failure.error;
    }
    return parser.context_error();
}

}  // namespace code_sandbox
