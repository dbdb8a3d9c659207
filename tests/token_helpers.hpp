#pragma once

#include "../src/lexer/statement.hpp"
#include "../src/lexer/tokenizer.hpp"
#include "../src/models/token.hpp"
#include <sstream>
#include <string>

inline models::Token Ordinary(char c) {
  models::Token token;
  token.type = models::TokenType::kOrdinary;
  token.ch = static_cast<char32_t>(c);
  token.text = std::string(1, c);
  return token;
}

inline models::Token Word(const std::string &text) {
  models::Token token;
  token.type = models::TokenType::kWord;
  token.text = text;
  return token;
}

// Every token of the text, comments not filtered.
inline lexer::Statement ReadStatement(const std::string &text) {
  std::istringstream in(text);
  lexer::Tokenizer tokenizer(&in);
  lexer::Statement statement;
  for (auto token = tokenizer.Next(); !token.IsEnd();
       token = tokenizer.Next()) {
    statement.Push(token);
  }
  return statement;
}
