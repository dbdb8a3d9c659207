#include "css_viewer.hpp"

#include <fmt/core.h>
#include <utility>

namespace format {

CssViewer::CssViewer(std::string indent_unit, bool need_annotate_kinds)
    : indent_unit_(std::move(indent_unit)),
      need_annotate_kinds_(need_annotate_kinds) {}

std::string CssViewer::format_line(const models::Line &line) const {
  if (need_annotate_kinds_) {
    return fmt::format("{} /* {} */", line.ToCssCode(indent_unit_),
                       models::ToString(line.GetKind()));
  }
  return line.ToCssCode(indent_unit_);
}

std::size_t CssViewer::view(lexer::Lexer &lexer, std::ostream &out) const {
  std::size_t count = 0;
  while (auto line = lexer.NextLine()) {
    out << format_line(*line) << '\n';
    count++;
  }
  out.flush();
  return count;
}

} // namespace format
