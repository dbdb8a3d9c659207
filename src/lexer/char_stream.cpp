#include "char_stream.hpp"

#include <stdexcept>

namespace file {
CharStream::CharStream(std::istream *in) : in_(in), line_number_(1) {
  if (in_ == nullptr) {
    throw std::invalid_argument("null input stream");
  }
  in_->exceptions(in_->exceptions() | std::ios_base::badbit);
}

int CharStream::GetChar() {
  int curr;
  if (!pushed_back_stream_.empty()) {
    curr = static_cast<unsigned char>(pushed_back_stream_.back());
    pushed_back_stream_.pop_back();
  } else {
    curr = in_->get();
    if (curr == std::char_traits<char>::eof()) {
      return EOF;
    }
  }

  if (curr == '\n') {
    line_number_++;
  }
  return curr;
}

void CharStream::Ungetch(int curr) {
  if (curr == EOF) {
    return;
  }
  if (curr == '\n') {
    line_number_--;
  }
  pushed_back_stream_.push_back(static_cast<char>(curr));
}

void CharStream::push_back(const std::string &value) {
  for (auto it = value.rbegin(); it != value.rend(); ++it) {
    Ungetch(static_cast<unsigned char>(*it));
  }
}

} // namespace file
