#pragma once

#include "../models/token.hpp"
#include <cstddef>
#include <vector>

namespace lexer {

/**
 * @brief Tokens of the statement being read, up to and including its
 * delimiter.
 */
class Statement {
public:
  static constexpr std::size_t kInitialCapacity = 256;
  static constexpr std::size_t kGrowthStep = 256;

  Statement();

  /**
   * @brief Appends a token, growing the storage by kGrowthStep when full.
   * @param token The token to append.
   */
  void Push(models::Token token);

  /**
   * @brief Removes the last token, if any.
   */
  void PopBack();

  /**
   * @brief Drops all tokens, keeping the storage.
   */
  void Clear() { tokens_.clear(); }

  bool Empty() const { return tokens_.empty(); }
  std::size_t Size() const { return tokens_.size(); }
  std::size_t Capacity() const { return tokens_.capacity(); }

  const models::Token &Back() const { return tokens_.back(); }
  const models::Token &operator[](std::size_t index) const {
    return tokens_[index];
  }
  const std::vector<models::Token> &GetTokens() const { return tokens_; }

  /**
   * @brief Checks if the last token is ';', '{' or '}'.
   */
  bool IsTerminated() const;

private:
  std::vector<models::Token> tokens_;
};

} // namespace lexer
