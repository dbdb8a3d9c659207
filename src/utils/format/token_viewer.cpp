#include "token_viewer.hpp"

#include "../../fatal/fatal.hpp"
#include <fmt/core.h>

namespace format {

std::size_t TokenViewer::view(lexer::Tokenizer &tokenizer, std::ostream &out) {
  std::size_t count = 0;
  for (auto token = tokenizer.Next(); !token.IsEnd();
       token = tokenizer.Next()) {
    std::string curr = token.type == models::TokenType::kWord
                           ? "-"
                           : loger::explainToString(token.ch);
    out << fmt::format("{}: {} {} \"{}\"", token.line_number,
                       models::ToString(token.type), curr, token.text)
        << '\n';
    count++;
  }
  out.flush();
  return count;
}

} // namespace format
