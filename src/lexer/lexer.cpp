#include "lexer.hpp"

#include "../fatal/fatal.hpp"
#include "../utils/verbose/verbose.hpp"
#include "classifier.hpp"
#include <fmt/core.h>
#include <iostream>
#include <utility>

namespace lexer {
Lexer::Lexer(std::istream *in) : tokenizer_(in) {}

bool Lexer::ReadStatement() {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  statement_.Clear();

  for (;;) {
    models::Token token = tokenizer_.Next();
    if (verbose_flags.NeedToPrintVeryVerbose()) {
      std::cerr << fmt::format("lenicss: line {}: {} {} \"{}\"",
                               token.line_number, models::ToString(token.type),
                               loger::explainToString(token.ch), token.text)
                << std::endl;
    }
    if (token.IsEnd()) {
      return false;
    }

    if (comment_.InComment()) {
      if (comment_.Feed(token)) {
        tokenizer_.SetQuotesEnabled(true);
      }
      continue;
    }

    if (token.IsOrdinary('*') && !statement_.Empty() &&
        statement_.Back().IsOrdinary('/')) {
      statement_.PopBack(); // the '/' is not part of the statement
      comment_.Enter();
      tokenizer_.SetQuotesEnabled(false);
      continue;
    }

    statement_.Push(std::move(token));
    if (statement_.IsTerminated()) {
      return true;
    }
  }
}

models::LinePtr Lexer::NextLine() {
  // Block closed by a property lacking its ';'
  if (nesting_.HasPendingClosure()) {
    return Trace(nesting_.EmitPendingClosure());
  }

  if (ReadStatement()) {
    auto line = Classify(nesting_.GetCurrParent(), statement_);
    nesting_.Track(line, statement_.Back().ch);
    return Trace(std::move(line));
  }

  if (statement_.Empty()) {
    return nullptr;
  }
  // Syntax problem at end of stream
  return Trace(Classify(nesting_.GetCurrParent(), statement_));
}

models::LinePtr Lexer::Trace(models::LinePtr line) const {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (verbose_flags.NeedToPrintVerbose()) {
    std::cerr << fmt::format("lenicss: line {}, level {}: {}",
                             line->GetLineNumber(), nesting_.GetLevel(),
                             line->ToString())
              << std::endl;
  }
  return line;
}
} // namespace lexer
