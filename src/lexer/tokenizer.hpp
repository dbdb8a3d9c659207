#pragma once
#include "../models/token.hpp"
#include "char_stream.hpp"
#include <istream>
#include <string>

namespace lexer {
/**
 * @brief Splits a character stream into words, quoted strings and ordinary
 * characters.
 *
 * Input is decoded as UTF-8; bytes that do not form a valid sequence are
 * read as Latin-1. The tokenizer is forward-only: once the end of stream is
 * reached, every call returns an end-of-stream token.
 */
class Tokenizer {
public:
  /**
   * @brief Constructs a tokenizer over an input stream.
   * @param in The stream to read, not owned.
   * @throws std::invalid_argument if in is null.
   */
  explicit Tokenizer(std::istream *in);

  /**
   * @brief Reads the next token.
   * @return The next token, kEndOfStream at the end of input.
   * @throws std::ios_base::failure on a read fault.
   */
  models::Token Next();

  /**
   * @brief Enables or disables quoted strings.
   * @param quotes_enabled When false, quotes are ordinary characters.
   */
  void SetQuotesEnabled(bool quotes_enabled) {
    quotes_enabled_ = quotes_enabled;
  }

  bool IsQuotesEnabled() const { return quotes_enabled_; }

  int GetLineNumber() const { return stream_.GetLineNumber(); }

private:
  /**
   * @brief Reads one code point.
   * @param bytes Receives the bytes of the code point.
   * @return The code point, or EOF.
   */
  int GetCodePoint(std::string &bytes);

  /**
   * @brief Reads the rest of a word.
   * @param token The token holding the first character.
   */
  void ScanWord(models::Token &token);

  /**
   * @brief Reads a quoted string up to its closing quote.
   * @param token The token holding the opening quote.
   */
  void ScanQuoted(models::Token &token);

  file::CharStream stream_;
  bool quotes_enabled_;
  bool at_end_;
};
} // namespace lexer
