#include "token.hpp"

namespace models {

std::string ToString(TokenType type) {
  switch (type) {
  case TokenType::kWord:
    return "WORD";
  case TokenType::kQuoted:
    return "QUOTED";
  case TokenType::kOrdinary:
    return "ORDINARY";
  case TokenType::kEndOfStream:
    return "EOF";
  }
  return "?";
}

} // namespace models
