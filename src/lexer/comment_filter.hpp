#pragma once

#include "../models/token.hpp"

namespace lexer {

/**
 * @brief Tracks whether tokens are inside a comment.
 *
 * Entering is decided by the statement reader when an ordinary '*' follows
 * an ordinary '/'. Once inside, tokens are fed here until the closing
 * '*' '/' pair.
 */
class CommentFilter {
public:
  CommentFilter();

  bool InComment() const { return in_comment_; }

  /**
   * @brief Starts a comment.
   */
  void Enter();

  /**
   * @brief Consumes a token read inside a comment.
   * @param token The discarded token.
   * @return True if the token closed the comment.
   */
  bool Feed(const models::Token &token);

private:
  bool in_comment_;
  char32_t last_comment_char_; /**< 0 when the last token was not ordinary. */
};

} // namespace lexer
