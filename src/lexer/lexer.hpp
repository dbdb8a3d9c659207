#pragma once
#include "../models/line.hpp"
#include "comment_filter.hpp"
#include "nesting.hpp"
#include "statement.hpp"
#include "tokenizer.hpp"
#include <istream>

namespace lexer {
/**
 * @brief Lenient reader of CSS, sass and less syntax.
 *
 * Identifies block openings, properties and block closures without parsing
 * selectors or property values. Comments are skipped. Missing ';' before
 * '}', unbalanced braces and trailing code are tolerated.
 */
class Lexer {
public:
  /**
   * @brief Builds a new lexer over the given stream.
   * @param in The stream providing CSS code, not owned.
   * @throws std::invalid_argument if in is null.
   */
  explicit Lexer(std::istream *in);

  /**
   * @brief Reads the next line of CSS.
   * @return The line, or null once the end of stream was reached.
   * @throws std::ios_base::failure if the stream fails.
   */
  models::LinePtr NextLine();

  /**
   * @brief Gets the open block chain.
   */
  const NestingTracker &GetNesting() const { return nesting_; }

private:
  /**
   * @brief Reads tokens until a statement is complete or the stream ends.
   * @return True if a delimiter ended the statement.
   */
  bool ReadStatement();

  /**
   * @brief Prints a produced line when verbose.
   * @param line The produced line.
   * @return The same line.
   */
  models::LinePtr Trace(models::LinePtr line) const;

  Tokenizer tokenizer_;
  CommentFilter comment_;
  Statement statement_;
  NestingTracker nesting_;
};
} // namespace lexer
