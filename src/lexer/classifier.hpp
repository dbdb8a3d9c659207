#pragma once

#include "../models/line.hpp"
#include "../models/token.hpp"
#include "statement.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace lexer {

/**
 * @brief Rebuilds source text from the tokens [start, end).
 *
 * Tokens are separated by a single space, except before '(', ')', ',', ';',
 * ':', '{', '}' and right after '('.
 * @param tokens The statement tokens.
 * @param start First token index.
 * @param end One past the last token index.
 * @return The joined text.
 */
std::string Join(const std::vector<models::Token> &tokens, std::size_t start,
                 std::size_t end);

/**
 * @brief Builds the line for a complete statement.
 *
 * The last token decides the kind: '{' opens a block, '}' closes one (or
 * ends a property missing its ';'), ';' ends a property. Properties are split
 * at their first ':'. Anything else is leftover code at end of stream.
 * @param parent The current block, may be null.
 * @param statement A non-empty statement.
 * @return The classified line.
 */
models::LinePtr Classify(const models::LinePtr &parent,
                         const Statement &statement);

} // namespace lexer
