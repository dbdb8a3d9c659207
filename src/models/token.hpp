#pragma once

#include <string>

namespace models {

/**
 * @brief Kind of a token produced by the tokenizer.
 */
enum class TokenType {
  kWord,       /**< Run of word characters. */
  kQuoted,     /**< Quoted string, quotes stripped. */
  kOrdinary,   /**< Single significant character. */
  kEndOfStream /**< No more input. */
};

/**
 * @struct Token
 * @brief A classified piece of input.
 */
struct Token {
  TokenType type = TokenType::kEndOfStream; /**< Token kind. */
  char32_t ch = 0; /**< Ordinary character, or the opening quote. */
  std::string text; /**< Word text, string content or ordinary char bytes. */
  int line_number = 0; /**< Source line the token started on. */

  /**
   * @brief Checks if the token is the given ordinary character.
   * @param c The character to compare with.
   * @return True for an ordinary token holding c.
   */
  bool IsOrdinary(char32_t c) const {
    return type == TokenType::kOrdinary && ch == c;
  }

  bool IsEnd() const { return type == TokenType::kEndOfStream; }
};

std::string ToString(TokenType type);

} // namespace models
