#include "tokenizer.hpp"

#include "helpers.hpp"

namespace lexer {
namespace {

bool IsContinuation(int c) { return c != EOF && (c & 0xC0) == 0x80; }

// Number of continuation bytes after a UTF-8 lead byte, -1 if invalid.
// low and high receive the range allowed for the first continuation byte,
// which excludes overlong forms, surrogates and code points past U+10FFFF.
int ContinuationCount(int lead, int &low, int &high) {
  low = 0x80;
  high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 1;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    if (lead == 0xE0) {
      low = 0xA0;
    } else if (lead == 0xED) {
      high = 0x9F;
    }
    return 2;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    if (lead == 0xF0) {
      low = 0x90;
    } else if (lead == 0xF4) {
      high = 0x8F;
    }
    return 3;
  }
  return -1;
}

} // namespace

Tokenizer::Tokenizer(std::istream *in)
    : stream_(in), quotes_enabled_(true), at_end_(false) {}

int Tokenizer::GetCodePoint(std::string &bytes) {
  bytes.clear();
  int lead = stream_.GetChar();
  if (lead == EOF) {
    return EOF;
  }
  bytes.push_back(static_cast<char>(lead));
  if (lead < 0x80) {
    return lead;
  }

  int low;
  int high;
  int count = ContinuationCount(lead, low, high);
  if (count < 0) {
    return lead; // Latin-1
  }

  int code_point = lead & (0x3F >> count);
  std::string tail;
  for (int i = 0; i < count; i++) {
    int curr = stream_.GetChar();
    if (!IsContinuation(curr) || (i == 0 && (curr < low || curr > high))) {
      stream_.Ungetch(curr);
      stream_.push_back(tail);
      return lead; // Latin-1
    }
    tail.push_back(static_cast<char>(curr));
    code_point = (code_point << 6) | (curr & 0x3F);
  }
  bytes += tail;
  return code_point;
}

void Tokenizer::ScanWord(models::Token &token) {
  std::string bytes;
  int curr;
  while ((curr = GetCodePoint(bytes)) != EOF) {
    if (!helpers::IsWordChar(curr)) {
      stream_.push_back(bytes);
      return;
    }
    token.text += bytes;
  }
}

void Tokenizer::ScanQuoted(models::Token &token) {
  std::string bytes;
  int curr;
  while ((curr = GetCodePoint(bytes)) != EOF) {
    if (curr == static_cast<int>(token.ch)) {
      return;
    }
    if (curr == '\n' || curr == '\r') {
      stream_.push_back(bytes);
      return;
    }
    token.text += bytes;
    if (curr == '\\') {
      curr = GetCodePoint(bytes);
      if (curr == EOF) {
        return;
      }
      if (curr == '\n' || curr == '\r') {
        stream_.push_back(bytes);
        return;
      }
      token.text += bytes;
    }
  }
}

models::Token Tokenizer::Next() {
  models::Token token;
  if (at_end_) {
    token.line_number = stream_.GetLineNumber();
    return token;
  }

  std::string bytes;
  int curr;
  do {
    curr = GetCodePoint(bytes);
  } while (curr != EOF && helpers::IsWhitespace(curr));

  token.line_number = stream_.GetLineNumber();
  if (curr == EOF) {
    at_end_ = true;
    return token;
  }

  token.ch = static_cast<char32_t>(curr);
  if (helpers::IsWordChar(curr)) {
    token.type = models::TokenType::kWord;
    token.ch = 0;
    token.text = bytes;
    ScanWord(token);
  } else if (quotes_enabled_ && helpers::IsQuote(curr)) {
    token.type = models::TokenType::kQuoted;
    ScanQuoted(token);
  } else {
    token.type = models::TokenType::kOrdinary;
    token.text = bytes;
  }
  return token;
}
} // namespace lexer
