#pragma once
#include "../../lexer/tokenizer.hpp"
#include <cstddef>
#include <ostream>

namespace format {
/**
 * @class TokenViewer
 * @brief Dumps the raw token stream, one token per line.
 *
 * Each line reads `<line number>: <type> <character> "<text>"`.
 */
class TokenViewer {
public:
  /**
   * @brief Reads tokens until the end of stream and prints them.
   * @param tokenizer The tokenizer to drain.
   * @param out The output stream.
   * @return The number of tokens printed, end of stream excluded.
   */
  std::size_t view(lexer::Tokenizer &tokenizer, std::ostream &out);
};
} // namespace format
