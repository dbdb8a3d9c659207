#pragma once

#include <cstdio>
#include <istream>
#include <string>

namespace file {
/**
 * @brief Forward-only byte source with push-back and line counting.
 */
class CharStream {
public:
  /**
   * @brief Constructs a CharStream over an input stream.
   * @param in The stream to read, not owned.
   * @throws std::invalid_argument if in is null.
   *
   * The stream is switched to throw on badbit, so read faults propagate
   * as std::ios_base::failure.
   */
  explicit CharStream(std::istream *in);

  /**
   * @brief Gets the next byte from the stream.
   * @return The next byte (0-255), or EOF.
   */
  int GetChar();

  /**
   * @brief Pushes a byte back into the stream.
   * @param curr The byte to be pushed back, EOF is ignored.
   */
  void Ungetch(int curr);

  /**
   * @brief Pushes a sequence of bytes back, to be read again in order.
   * @param value The bytes to be pushed back.
   */
  void push_back(const std::string &value);

  /**
   * @brief Gets the current line number, starting at 1.
   */
  int GetLineNumber() const { return line_number_; }

private:
  std::istream *in_;

  /**
   * @brief Pushed back bytes, last one is read first.
   */
  std::string pushed_back_stream_;

  int line_number_;
};

} // namespace file
