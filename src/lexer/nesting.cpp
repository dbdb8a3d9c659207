#include "nesting.hpp"

namespace lexer {
NestingTracker::NestingTracker()
    : pending_closure_(false), pending_line_number_(0) {}

std::size_t NestingTracker::GetLevel() const {
  return curr_parent_ ? curr_parent_->GetDepth() + 1 : 0;
}

void NestingTracker::Track(const models::LinePtr &line, char32_t terminator) {
  switch (terminator) {
  case '{':
    curr_parent_ = line;
    break;
  case '}':
    if (line->GetKind() == models::LineKind::kProperty) {
      pending_closure_ = true;
      pending_line_number_ = line->GetLineNumber();
    } else {
      Pop();
    }
    break;
  default:
    break;
  }
}

models::LinePtr NestingTracker::EmitPendingClosure() {
  auto closure =
      models::Line::MakeClosure(curr_parent_, pending_line_number_);
  Pop();
  pending_closure_ = false;
  return closure;
}

void NestingTracker::Pop() {
  if (curr_parent_) {
    curr_parent_ = curr_parent_->GetParent();
  }
}
} // namespace lexer
