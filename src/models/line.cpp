#include "line.hpp"

#include <fmt/core.h>
#include <utility>

namespace models {

Line::Line(LinePtr parent, LineKind kind, std::string declaration,
           std::optional<std::string> value, int line_number)
    : parent_(std::move(parent)), kind_(kind),
      declaration_(std::move(declaration)), value_(std::move(value)),
      line_number_(line_number) {
  if (kind_ != LineKind::kProperty) {
    value_.reset();
  }
}

LinePtr Line::MakeClosure(LinePtr parent, int line_number) {
  return std::make_shared<const Line>(std::move(parent),
                                      LineKind::kBlockClosure, std::string{},
                                      std::nullopt, line_number);
}

std::size_t Line::GetDepth() const {
  std::size_t depth = 0;
  for (const Line *curr = parent_.get(); curr; curr = curr->parent_.get()) {
    depth++;
  }
  return depth;
}

std::string Line::ToCssCode(std::string_view indent_unit) const {
  std::string result;

  // A closing brace aligns with its opening line.
  std::size_t indent = GetDepth();
  if (kind_ == LineKind::kBlockClosure && indent > 0) {
    indent--;
  }
  for (std::size_t i = 0; i < indent; i++) {
    result += indent_unit;
  }

  switch (kind_) {
  case LineKind::kProperty:
    result += declaration_;
    if (value_.has_value()) {
      result += fmt::format(": {}", *value_);
    }
    result += ';';
    break;
  case LineKind::kBlockOpening:
    result += fmt::format("{} {{", declaration_);
    break;
  case LineKind::kBlockClosure:
    result += declaration_;
    result += '}';
    break;
  default:
    result += declaration_;
    break;
  }
  return result;
}

std::string Line::ToString() const {
  return fmt::format("{} /* {} */", ToCssCode(), models::ToString(kind_));
}

std::string ToString(LineKind kind) {
  switch (kind) {
  case LineKind::kBlockOpening:
    return "BLOCK_OPENING";
  case LineKind::kProperty:
    return "PROPERTY";
  case LineKind::kBlockClosure:
    return "BLOCK_CLOSURE";
  default:
    return "UNKNOWN";
  }
}

} // namespace models
