#include "helpers.hpp"

#include <algorithm>
#include <array>

namespace lexer::helpers {

// Colours, units and the sass/less identifier prefixes.
constexpr std::array<int, 6> kWordSymbols = {'-', '.', '%', '#', '$', '@'};
constexpr std::array<int, 7> kTightChars = {'(', ')', ',', ';',
                                            ':', '{', '}'};

// First non-ASCII code point accepted in words (after the C1 controls).
constexpr int kFirstWordNonAscii = 128 + 32;

bool IsWhitespace(int curr) { return curr >= 0 && curr <= ' '; }

bool IsWordChar(int curr) {
  if ((curr >= 'a' && curr <= 'z') || (curr >= 'A' && curr <= 'Z') ||
      (curr >= '0' && curr <= '9')) {
    return true;
  }
  if (curr >= kFirstWordNonAscii) {
    return true;
  }
  return std::find(kWordSymbols.begin(), kWordSymbols.end(), curr) !=
         kWordSymbols.end();
}

bool IsQuote(int curr) { return curr == '"' || curr == '\''; }

bool IsDelimiter(int curr) { return curr == ';' || curr == '{' || curr == '}'; }

bool IsTightBefore(int curr) {
  return std::find(kTightChars.begin(), kTightChars.end(), curr) !=
         kTightChars.end();
}

} // namespace lexer::helpers
