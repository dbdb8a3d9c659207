#include "statement.hpp"

#include "helpers.hpp"
#include <utility>

namespace lexer {

Statement::Statement() { tokens_.reserve(kInitialCapacity); }

void Statement::Push(models::Token token) {
  if (tokens_.size() == tokens_.capacity()) {
    tokens_.reserve(tokens_.capacity() + kGrowthStep);
  }
  tokens_.push_back(std::move(token));
}

void Statement::PopBack() {
  if (!tokens_.empty()) {
    tokens_.pop_back();
  }
}

bool Statement::IsTerminated() const {
  return !tokens_.empty() &&
         tokens_.back().type == models::TokenType::kOrdinary &&
         helpers::IsDelimiter(static_cast<int>(tokens_.back().ch));
}

} // namespace lexer
