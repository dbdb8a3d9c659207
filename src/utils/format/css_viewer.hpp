#pragma once
#include "../../lexer/lexer.hpp"
#include <cstddef>
#include <ostream>
#include <string>

namespace format {
/**
 * @class CssViewer
 * @brief Prints every line read by a lexer as indented CSS code.
 */
class CssViewer {
public:
  /**
   * @brief Constructs a viewer.
   * @param indent_unit Text written once per nesting level.
   * @param need_annotate_kinds Whether to append the line kind in a comment.
   */
  explicit CssViewer(std::string indent_unit = "\t",
                     bool need_annotate_kinds = false);

  /**
   * @brief Reads lines until the end of stream and prints them.
   * @param lexer The lexer to drain.
   * @param out The output stream.
   * @return The number of lines printed.
   */
  std::size_t view(lexer::Lexer &lexer, std::ostream &out) const;

  /**
   * @brief Formats a single line.
   */
  std::string format_line(const models::Line &line) const;

private:
  std::string indent_unit_;
  bool need_annotate_kinds_;
};
} // namespace format
