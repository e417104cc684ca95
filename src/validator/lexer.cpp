/**
 * @file lexer.cpp
 * @brief Python tokenizer implementation.
 * @author Dimitris Kafetzis
 */

#include "validator/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace code_sandbox {

namespace {

constexpr std::array<std::string_view, 5> kThreeCharOps = {
    "**=", "//=", ">>=", "<<=", "..."
};

constexpr std::array<std::string_view, 19> kTwoCharOps = {
    "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
};

constexpr std::string_view kOneCharOps = "+-*/%@&|^~<>()[]{},:;.=";

bool is_ident_start(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_string_prefix(std::string_view text) {
    if (text.empty() || text.size() > 2) return false;
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static constexpr std::array<std::string_view, 11> kPrefixes = {
        "r", "u", "b", "f", "t", "br", "rb", "fr", "rf", "tr", "rt"
    };
    return std::find(kPrefixes.begin(), kPrefixes.end(), lowered) != kPrefixes.end();
}

bool is_formatted_prefix(std::string_view prefix) {
    return prefix.find_first_of("fFtT") != std::string_view::npos;
}

char closer_for(char open) noexcept {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

std::string normalize_newlines(std::string_view source) {
    std::string out;
    out.reserve(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < source.size() && source[i + 1] == '\n') ++i;
        } else {
            out.push_back(source[i]);
        }
    }
    return out;
}

}  // namespace

Lexer::Lexer(std::string_view source, SourceLocation origin, Mode mode)
    : src_(normalize_newlines(source))
    , line_(origin.line)
    , origin_line_(origin.line)
    , origin_column_(origin.column)
    , mode_(mode) {}

char Lexer::peek(size_t ahead) const noexcept {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
}

SourceLocation Lexer::location() const noexcept {
    auto column = static_cast<uint32_t>(pos_ - line_start_);
    if (line_ == origin_line_) column += origin_column_;
    return SourceLocation{.line = line_, .column = column};
}

void Lexer::advance() noexcept {
    if (at_end()) return;
    if (src_[pos_] == '\n') {
        ++pos_;
        ++line_;
        line_start_ = pos_;
        return;
    }
    ++pos_;
}

void Lexer::emit(TokenKind kind, std::string text, SourceLocation loc) {
    tokens_.push_back(Token{.kind = kind, .text = std::move(text), .location = loc, .embedded = {}});
    if (kind != TokenKind::Newline && kind != TokenKind::Indent
        && kind != TokenKind::Dedent && kind != TokenKind::EndOfInput) {
        line_has_tokens_ = true;
    }
}

Result<std::vector<Token>, LexError> Lexer::tokenize() {
    while (true) {
        if (mode_ == Mode::Module && at_line_start_ && brackets_.empty()) {
            if (auto err = handle_indentation()) return *err;
            if (at_line_start_) {
                // Blank or comment-only line consumed
                if (at_end()) break;
                continue;
            }
        }
        if (at_end()) break;

        char c = peek();

        if (c == '\n') {
            if (mode_ == Mode::Module && brackets_.empty()) {
                if (line_has_tokens_) emit(TokenKind::Newline, "", location());
                line_has_tokens_ = false;
                at_line_start_ = true;
            }
            advance();
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\f') {
            advance();
            continue;
        }
        if (c == '#') {
            while (!at_end() && peek() != '\n') advance();
            continue;
        }
        if (c == '\\') {
            auto loc = location();
            advance();
            if (at_end()) return LexError{loc, "unexpected EOF while parsing"};
            if (peek() != '\n') {
                return LexError{loc, "unexpected character after line continuation character"};
            }
            advance();
            continue;
        }
        if (c == '\0') {
            return LexError{location(), "source code cannot contain null bytes"};
        }

        std::optional<LexError> err;
        if (is_ident_start(c)) {
            err = lex_name();
        } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
            err = lex_number();
        } else if (c == '"' || c == '\'') {
            err = lex_string(pos_, location(), "");
        } else {
            err = lex_operator();
        }
        if (err) return *err;
    }

    if (!brackets_.empty()) {
        const auto& open = brackets_.back();
        return LexError{open.location, std::format("'{}' was never closed", open.ch)};
    }

    if (mode_ == Mode::Module) {
        if (line_has_tokens_) emit(TokenKind::Newline, "", location());
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokenKind::Dedent, "", location());
        }
    }
    emit(TokenKind::EndOfInput, "", location());
    return std::move(tokens_);
}

std::optional<LexError> Lexer::handle_indentation() {
    uint32_t width = 0;
    while (!at_end()) {
        char c = peek();
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
        advance();
    }

    if (at_end()) return std::nullopt;

    if (peek() == '#') {
        while (!at_end() && peek() != '\n') advance();
    }
    if (peek() == '\n') {
        advance();
        return std::nullopt;
    }
    if (at_end()) return std::nullopt;

    at_line_start_ = false;
    auto loc = location();

    if (width > indents_.back()) {
        indents_.push_back(width);
        emit(TokenKind::Indent, "", loc);
        return std::nullopt;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        emit(TokenKind::Dedent, "", loc);
    }
    if (width != indents_.back()) {
        return LexError{loc, "unindent does not match any outer indentation level"};
    }
    return std::nullopt;
}

std::optional<LexError> Lexer::lex_name() {
    size_t start = pos_;
    auto loc = location();
    while (!at_end() && is_ident_char(peek())) advance();

    std::string_view text(src_.data() + start, pos_ - start);
    if ((peek() == '"' || peek() == '\'') && is_string_prefix(text)) {
        return lex_string(start, loc, text);
    }
    emit(TokenKind::Name, std::string(text), loc);
    return std::nullopt;
}

std::optional<LexError> Lexer::lex_number() {
    size_t start = pos_;
    auto loc = location();
    auto digits = [&](auto accepts) {
        size_t from = pos_;
        while (!at_end() && (accepts(peek()) || (peek() == '_' && accepts(peek(1))))) advance();
        return pos_ > from;
    };
    auto decimal = [](char c) { return is_digit(c); };

    char radix = peek() == '0' ? static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1)))) : '\0';
    if (radix == 'x' || radix == 'o' || radix == 'b') {
        advance();
        advance();
        bool any = false;
        if (radix == 'x') any = digits([](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
        if (radix == 'o') any = digits([](char c) { return c >= '0' && c <= '7'; });
        if (radix == 'b') any = digits([](char c) { return c == '0' || c == '1'; });
        if (!any || is_ident_char(peek()) || is_digit(peek())) {
            return LexError{loc, std::format("invalid {} literal",
                radix == 'x' ? "hexadecimal" : radix == 'o' ? "octal" : "binary")};
        }
        emit(TokenKind::Number, src_.substr(start, pos_ - start), loc);
        return std::nullopt;
    }

    digits(decimal);
    if (peek() == '.') {
        advance();
        digits(decimal);
    }
    if ((peek() == 'e' || peek() == 'E')
        && (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
        advance();
        if (peek() == '+' || peek() == '-') advance();
        digits(decimal);
    }
    if (peek() == 'j' || peek() == 'J') advance();

    // `1if x else y` is still accepted by the interpreter
    if (is_ident_char(peek())) {
        std::string_view rest(src_.data() + pos_, src_.size() - pos_);
        static constexpr std::array<std::string_view, 8> kGlued = {
            "and", "else", "for", "if", "in", "is", "not", "or"
        };
        bool glued = std::any_of(kGlued.begin(), kGlued.end(), [&](std::string_view kw) {
            return rest.starts_with(kw) && (rest.size() == kw.size() || !is_ident_char(rest[kw.size()]));
        });
        if (!glued) return LexError{location(), "invalid decimal literal"};
    }
    emit(TokenKind::Number, src_.substr(start, pos_ - start), loc);
    return std::nullopt;
}

std::optional<LexError> Lexer::lex_string(size_t start, SourceLocation start_loc,
                                          std::string_view prefix) {
    const bool formatted = is_formatted_prefix(prefix);
    const bool raw = prefix.find_first_of("rR") != std::string_view::npos;
    const char quote = peek();
    const bool triple = peek(1) == quote && peek(2) == quote;

    Token token{.kind = TokenKind::String, .text = {}, .location = start_loc, .embedded = {}};
    advance();
    if (triple) {
        advance();
        advance();
    }

    while (true) {
        if (at_end()) {
            return LexError{start_loc, std::format(
                "unterminated {}string literal (detected at line {})",
                triple ? "triple-quoted " : "", line_)};
        }
        char c = peek();
        if (c == '\\') {
            advance();
            char escaped = peek();
            // A backslash never hides a replacement field, raw or not
            if (formatted && (escaped == '{' || escaped == '}')) continue;
            if (formatted && !raw && escaped == 'N' && peek(1) == '{') {
                while (!at_end() && peek() != '}' && peek() != quote && peek() != '\n') advance();
                if (peek() == '}') advance();
                continue;
            }
            advance();
            continue;
        }
        if (c == '\n' && !triple) {
            return LexError{start_loc, std::format(
                "unterminated string literal (detected at line {})", line_)};
        }
        if (c == quote) {
            if (!triple) {
                advance();
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                advance();
                advance();
                advance();
                break;
            }
            advance();
            continue;
        }
        if (formatted && c == '{') {
            if (peek(1) == '{') {
                advance();
                advance();
                continue;
            }
            advance();
            if (auto err = scan_fstring_field(token, triple)) return err;
            continue;
        }
        if (formatted && c == '}') {
            if (peek(1) == '}') {
                advance();
                advance();
                continue;
            }
            return LexError{location(), "f-string: single '}' is not allowed"};
        }
        advance();
    }

    token.text = src_.substr(start, pos_ - start);
    tokens_.push_back(std::move(token));
    line_has_tokens_ = true;
    return std::nullopt;
}

std::optional<LexError> Lexer::skip_nested_string() {
    auto loc = location();
    const char quote = peek();
    const bool triple = peek(1) == quote && peek(2) == quote;
    advance();
    if (triple) {
        advance();
        advance();
    }
    while (!at_end()) {
        char c = peek();
        if (c == '\\') {
            advance();
            advance();
            continue;
        }
        if (c == quote && (!triple || (peek(1) == quote && peek(2) == quote))) {
            advance();
            if (triple) {
                advance();
                advance();
            }
            return std::nullopt;
        }
        advance();
    }
    return LexError{loc, "f-string: unterminated string"};
}

std::optional<LexError> Lexer::scan_fstring_field(Token& token, bool triple) {
    const size_t expr_start = pos_;
    const auto expr_loc = location();
    int depth = 0;

    auto record = [&]() -> std::optional<LexError> {
        std::string text = src_.substr(expr_start, pos_ - expr_start);
        if (text.find_first_not_of(" \t\n") == std::string::npos) {
            return LexError{expr_loc, "f-string: valid expression required before '}'"};
        }
        token.embedded.push_back(EmbeddedExpression{.text = std::move(text), .origin = expr_loc});
        return std::nullopt;
    };

    while (true) {
        if (at_end()) return LexError{expr_loc, "f-string: expecting '}'"};
        char c = peek();

        if (c == '\n' && !triple && depth == 0) {
            return LexError{expr_loc, "f-string: expecting '}'"};
        }
        if (c == '"' || c == '\'') {
            if (auto err = skip_nested_string()) return err;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
            advance();
            continue;
        }
        if (c == ')' || c == ']') {
            if (depth > 0) --depth;
            advance();
            continue;
        }
        if (c == '}') {
            if (depth > 0) {
                --depth;
                advance();
                continue;
            }
            if (auto err = record()) return err;
            advance();
            return std::nullopt;
        }
        if (depth == 0 && c == '!' && peek(1) != '=') {
            if (auto err = record()) return err;
            advance();
            while (!at_end() && peek() != ':' && peek() != '}') advance();
            if (peek() == ':') {
                advance();
                return scan_format_spec(token, triple);
            }
            if (at_end()) return LexError{expr_loc, "f-string: expecting '}'"};
            advance();
            return std::nullopt;
        }
        if (depth == 0 && c == ':') {
            if (auto err = record()) return err;
            advance();
            return scan_format_spec(token, triple);
        }
        advance();
    }
}

std::optional<LexError> Lexer::scan_format_spec(Token& token, bool triple) {
    const auto spec_loc = location();
    while (true) {
        if (at_end()) return LexError{spec_loc, "f-string: expecting '}'"};
        char c = peek();
        if (c == '\n' && !triple) return LexError{spec_loc, "f-string: expecting '}'"};
        if (c == '}') {
            advance();
            return std::nullopt;
        }
        if (c == '{') {
            advance();
            if (auto err = scan_fstring_field(token, triple)) return err;
            continue;
        }
        advance();
    }
}

std::optional<LexError> Lexer::lex_operator() {
    auto loc = location();
    std::string_view rest(src_.data() + pos_, src_.size() - pos_);

    auto take = [&](std::string_view op) {
        for (size_t i = 0; i < op.size(); ++i) advance();
        emit(TokenKind::Operator, std::string(op), loc);
    };

    for (auto op : kThreeCharOps) {
        if (rest.starts_with(op)) {
            take(op);
            return std::nullopt;
        }
    }
    for (auto op : kTwoCharOps) {
        if (rest.starts_with(op)) {
            take(op);
            return std::nullopt;
        }
    }

    char c = rest.front();
    if (kOneCharOps.find(c) == std::string_view::npos) {
        if (c == '!') return LexError{loc, "invalid syntax"};
        return LexError{loc, std::format("invalid character '{}' (U+{:04X})", c,
                                         static_cast<unsigned>(static_cast<unsigned char>(c)))};
    }

    if (c == '(' || c == '[' || c == '{') {
        brackets_.push_back(OpenBracket{.ch = c, .location = loc});
    } else if (c == ')' || c == ']' || c == '}') {
        if (brackets_.empty()) {
            return LexError{loc, std::format("unmatched '{}'", c)};
        }
        char open = brackets_.back().ch;
        if (closer_for(open) != c) {
            return LexError{loc, std::format(
                "closing parenthesis '{}' does not match opening parenthesis '{}'", c, open)};
        }
        brackets_.pop_back();
    }
    take(std::string_view(&rest.front(), 1));
    return std::nullopt;
}

}  // namespace code_sandbox
