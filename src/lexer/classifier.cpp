#include "classifier.hpp"

#include "helpers.hpp"
#include <memory>
#include <optional>

namespace lexer {
namespace {

// Splits tokens [0, end) at the first ':' into declaration and value.
models::LinePtr MakeProperty(const models::LinePtr &parent,
                             const std::vector<models::Token> &tokens,
                             std::size_t end, int line_number) {
  for (std::size_t i = 0; i < end; i++) {
    if (tokens[i].IsOrdinary(':')) {
      return std::make_shared<const models::Line>(
          parent, models::LineKind::kProperty, Join(tokens, 0, i),
          Join(tokens, i + 1, end), line_number);
    }
  }
  // Property without value, not possible in pure CSS
  return std::make_shared<const models::Line>(
      parent, models::LineKind::kProperty, Join(tokens, 0, end), std::nullopt,
      line_number);
}

} // namespace

std::string Join(const std::vector<models::Token> &tokens, std::size_t start,
                 std::size_t end) {
  std::string result;
  bool after_paren = false;

  for (std::size_t i = start; i < end; i++) {
    const models::Token &token = tokens[i];
    bool ordinary = token.type == models::TokenType::kOrdinary;

    if (i > start && !after_paren &&
        !(ordinary && helpers::IsTightBefore(static_cast<int>(token.ch)))) {
      result += ' ';
    }
    if (token.type == models::TokenType::kQuoted) {
      char quote = static_cast<char>(token.ch);
      result += quote;
      result += token.text;
      result += quote;
    } else {
      result += token.text;
    }
    after_paren = token.IsOrdinary('(');
  }
  return result;
}

models::LinePtr Classify(const models::LinePtr &parent,
                         const Statement &statement) {
  const auto &tokens = statement.GetTokens();
  std::size_t length = tokens.size();
  int line_number = tokens.front().line_number;
  const models::Token &last = tokens.back();

  if (last.IsOrdinary('{')) {
    return std::make_shared<const models::Line>(
        parent, models::LineKind::kBlockOpening, Join(tokens, 0, length - 1),
        std::nullopt, line_number);
  }

  if (last.IsOrdinary('}')) {
    // More than one token when the last property of the block lacks its ';'
    if (length > 1) {
      return MakeProperty(parent, tokens, length - 1, line_number);
    }
    return models::Line::MakeClosure(parent, line_number);
  }

  if (last.IsOrdinary(';')) {
    return MakeProperty(parent, tokens, length - 1, line_number);
  }

  // Unexpected code at end of stream
  return std::make_shared<const models::Line>(
      parent, models::LineKind::kUnknown, Join(tokens, 0, length),
      std::nullopt, line_number);
}

} // namespace lexer
