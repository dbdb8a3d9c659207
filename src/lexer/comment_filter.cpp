#include "comment_filter.hpp"

namespace lexer {

CommentFilter::CommentFilter() : in_comment_(false), last_comment_char_(0) {}

void CommentFilter::Enter() {
  in_comment_ = true;
  last_comment_char_ = 0;
}

bool CommentFilter::Feed(const models::Token &token) {
  char32_t curr =
      token.type == models::TokenType::kOrdinary ? token.ch : char32_t{0};
  if (curr == '/' && last_comment_char_ == '*') {
    in_comment_ = false;
    last_comment_char_ = 0; // "*//*" starts a new comment
    return true;
  }
  last_comment_char_ = curr;
  return false;
}

} // namespace lexer
