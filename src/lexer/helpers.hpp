#pragma once
namespace lexer::helpers {

// Character classes, by code point.
bool IsWhitespace(int curr);
bool IsWordChar(int curr);
bool IsQuote(int curr);

/**
 * @brief Checks if a character ends a statement: ';', '{' or '}'.
 */
bool IsDelimiter(int curr);

/**
 * @brief Checks if no space is written before a character when joining.
 */
bool IsTightBefore(int curr);

} // namespace lexer::helpers
