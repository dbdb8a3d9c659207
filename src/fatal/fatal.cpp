#include "fatal.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <sstream>

namespace loger {
static std::string file_name_ = "stdin";
static int nr_errs_ = 0;

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::cerr << fmt::format("lenicss: {0}, Error: {1}{2}", file_name_, s1,
                           s2.value_or(""));
  std::cerr << std::endl;
  nr_errs_++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  non_fatal(s1, s2);
  std::exit(EXIT_FAILURE);
}

void SetFileName(const std::string_view &file_name) {
  file_name_ = std::string(file_name);
}

int GetErrorCount() { return nr_errs_; }

void ResetErrorCount() { nr_errs_ = 0; }

std::string explainToString(int n) {
  std::stringstream ss;
  switch (n) {
  default:
    if (n > ' ' && n < 127)
      ss << "'" << static_cast<char>(n) << "' = ";
    ss << n;
    break;
  case '\b':
    ss << "\\b";
    break;
  case '\t':
    ss << "\\t";
    break;
  case '\f':
    ss << "\\f";
    break;
  case '\n':
    ss << "\\n";
    break;
  case '\r':
    ss << "\\r";
    break;
  case ' ':
    ss << "' '";
    break;
  }
  return ss.str();
}
} // namespace loger
