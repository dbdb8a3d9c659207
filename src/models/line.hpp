#pragma once

#include "models_fwd.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace models {

/**
 * @brief Classification of a line of CSS.
 */
enum class LineKind {
  kUnknown,      /**< Leftover code at end of stream. */
  kBlockOpening, /**< Code before a '{'. */
  kProperty,     /**< Declaration, with a value when a ':' was found. */
  kBlockClosure  /**< A '}'. */
};

/**
 * @class Line
 * @brief Line of CSS: a block opening, a property declaration or a block
 * closure.
 *
 * Lines are immutable. A line refers to the innermost block that was still
 * open when it was produced. Block closures refer to the block they close.
 */
class Line {
public:
  /**
   * @brief Builds a new line.
   * @param parent The enclosing block opening, may be null.
   * @param kind The line kind.
   * @param declaration Text before the delimiter, or before ':'.
   * @param value Text after ':', kept for properties only.
   * @param line_number Source line of the statement.
   */
  Line(LinePtr parent, LineKind kind, std::string declaration,
       std::optional<std::string> value = std::nullopt, int line_number = 0);

  /**
   * @brief Builds an empty block closure.
   * @param parent The block being closed, may be null.
   * @param line_number Source line of the statement.
   * @return The closure line.
   */
  static LinePtr MakeClosure(LinePtr parent, int line_number = 0);

  LineKind GetKind() const { return kind_; }

  /**
   * @brief Gets the parent line.
   * @return The enclosing block opening, null at top level.
   */
  const LinePtr &GetParent() const { return parent_; }

  /**
   * @brief Gets the declaration part of the line.
   * @return Code before '{' or ':', empty for a block closure. When ':' is
   * missing, code before ';'. Whole code for unknown lines.
   */
  const std::string &GetDeclaration() const { return declaration_; }

  /**
   * @brief Gets the property value.
   * @return Code after ':', nullopt when ':' is missing or the line is not a
   * property.
   */
  const std::optional<std::string> &GetValue() const { return value_; }

  int GetLineNumber() const { return line_number_; }

  /**
   * @brief Counts the ancestors of the line.
   * @return Length of the parent chain.
   */
  std::size_t GetDepth() const;

  /**
   * @brief Converts this line to formatted CSS code.
   * @param indent_unit Text repeated once per indentation level.
   * @return CSS code, without line break.
   */
  std::string ToCssCode(std::string_view indent_unit = "\t") const;

  /**
   * @brief Formats the line followed by its kind in a comment.
   */
  std::string ToString() const;

private:
  LinePtr parent_;
  LineKind kind_;
  std::string declaration_;
  std::optional<std::string> value_;
  int line_number_;
};

std::string ToString(LineKind kind);

} // namespace models
