/**
 * @file lexer.hpp
 * @brief Tokenizer for the Python 3 source accepted by the sandbox.
 * @author Dimitris Kafetzis
 *
 * Produces the token stream the validator walks: names, numbers, strings,
 * operators and the NEWLINE / INDENT / DEDENT structure tokens. Bracket
 * nesting, indentation consistency and string termination are enforced
 * here; any failure is reported as a LexError and the validator fails
 * closed on it.
 *
 * Replacement fields of f-strings are not opaque: their expression text is
 * attached to the string token so that code hidden inside `f"{...}"` is
 * tokenized and checked like any other expression.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

enum class TokenKind : uint8_t {
    Name,
    Number,
    String,
    Operator,
    Newline,
    Indent,
    Dedent,
    EndOfInput
};

/// Expression text of one f-string replacement field.
struct EmbeddedExpression {
    std::string text;
    SourceLocation origin;
};

struct Token {
    TokenKind kind;
    std::string text;
    SourceLocation location;
    std::vector<EmbeddedExpression> embedded;

    [[nodiscard]] bool is_op(std::string_view op) const noexcept {
        return kind == TokenKind::Operator && text == op;
    }
    [[nodiscard]] bool is_name(std::string_view name) const noexcept {
        return kind == TokenKind::Name && text == name;
    }
};

struct LexError {
    SourceLocation location;
    std::string message;
};

class Lexer {
public:
    enum class Mode : uint8_t {
        Module,       ///< Full source: emits NEWLINE / INDENT / DEDENT
        Expression    ///< f-string field: newlines are whitespace
    };

    explicit Lexer(std::string_view source, SourceLocation origin = {}, Mode mode = Mode::Module);

    [[nodiscard]] Result<std::vector<Token>, LexError> tokenize();

private:
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }
    [[nodiscard]] char peek(size_t ahead = 0) const noexcept;
    [[nodiscard]] SourceLocation location() const noexcept;
    void advance() noexcept;

    std::optional<LexError> handle_indentation();
    std::optional<LexError> lex_name();
    std::optional<LexError> lex_number();
    std::optional<LexError> lex_string(size_t start, SourceLocation start_loc, std::string_view prefix);
    std::optional<LexError> scan_fstring_field(Token& token, bool triple);
    std::optional<LexError> scan_format_spec(Token& token, bool triple);
    std::optional<LexError> skip_nested_string();
    std::optional<LexError> lex_operator();

    void emit(TokenKind kind, std::string text, SourceLocation loc);

    std::string src_;
    size_t pos_{0};
    size_t line_start_{0};
    uint32_t line_;
    uint32_t origin_line_;
    uint32_t origin_column_;
    Mode mode_;

    std::vector<Token> tokens_;
    std::vector<uint32_t> indents_{0};

    struct OpenBracket {
        char ch;
        SourceLocation location;
    };
    std::vector<OpenBracket> brackets_;

    bool at_line_start_{true};
    bool line_has_tokens_{false};
};

}  // namespace code_sandbox
