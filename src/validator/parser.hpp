/**
 * @file parser.hpp
 * @brief Grammar check over the validator's token stream.
 * @author Dimitris Kafetzis
 *
 * A recursive-descent pass over the statements and expressions of a
 * module. No tree is built: the pass only decides whether the tokens form
 * a program the interpreter would compile. Besides the grammar proper it
 * enforces the context rules the compiler adds on top (return and yield
 * outside a function, break outside a loop, await outside an async
 * function, invalid assignment targets).
 *
 * Replacement fields of f-strings are parsed as expressions in the scope
 * of the code around them.
 */

#pragma once

#include "validator/lexer.hpp"

#include <optional>
#include <vector>

namespace code_sandbox {

/**
 * @brief Check a tokenized module against the Python grammar.
 * @param tokens Output of Lexer::tokenize() in Module mode.
 * @return The first error, or nullopt when the module is well formed.
 *
 * Grammar errors win over context errors, so `return 1` followed by a
 * malformed line reports the malformed line.
 */
[[nodiscard]] std::optional<LexError> check_syntax(const std::vector<Token>& tokens);

}  // namespace code_sandbox
