#include <gtest/gtest.h>

#include "../src/lexer/char_stream.hpp"
#include "failing_buf.hpp"
#include <sstream>
#include <stdexcept>

TEST(CharStreamTest, Constructor_NullStream_Throws) {
  EXPECT_THROW({ file::CharStream stream(nullptr); }, std::invalid_argument);
}

TEST(CharStreamTest, GetChar_ReadsBytesThenEof) {
  std::istringstream in("a\xC3\xA9");
  file::CharStream stream(&in);

  EXPECT_EQ(stream.GetChar(), 'a');
  EXPECT_EQ(stream.GetChar(), 0xC3);
  EXPECT_EQ(stream.GetChar(), 0xA9);
  EXPECT_EQ(stream.GetChar(), EOF);
  EXPECT_EQ(stream.GetChar(), EOF);
}

TEST(CharStreamTest, Ungetch_ReturnsLastPushedFirst) {
  std::istringstream in("c");
  file::CharStream stream(&in);

  stream.Ungetch('b');
  stream.Ungetch('a');
  stream.Ungetch(EOF);
  EXPECT_EQ(stream.GetChar(), 'a');
  EXPECT_EQ(stream.GetChar(), 'b');
  EXPECT_EQ(stream.GetChar(), 'c');
}

TEST(CharStreamTest, PushBack_KeepsOrder) {
  std::istringstream in("!");
  file::CharStream stream(&in);

  stream.push_back("xyz");
  EXPECT_EQ(stream.GetChar(), 'x');
  EXPECT_EQ(stream.GetChar(), 'y');
  EXPECT_EQ(stream.GetChar(), 'z');
  EXPECT_EQ(stream.GetChar(), '!');
}

TEST(CharStreamTest, GetLineNumber_CountsNewlines) {
  std::istringstream in("a\nb\n");
  file::CharStream stream(&in);
  EXPECT_EQ(stream.GetLineNumber(), 1);

  stream.GetChar();
  int newline = stream.GetChar();
  EXPECT_EQ(stream.GetLineNumber(), 2);

  stream.Ungetch(newline);
  EXPECT_EQ(stream.GetLineNumber(), 1);
  stream.GetChar();
  EXPECT_EQ(stream.GetLineNumber(), 2);
}

TEST(CharStreamTest, GetChar_ReadFault_Propagates) {
  FailingBuf buf("ab");
  std::istream in(&buf);
  file::CharStream stream(&in);

  EXPECT_EQ(stream.GetChar(), 'a');
  EXPECT_EQ(stream.GetChar(), 'b');
  EXPECT_THROW(stream.GetChar(), std::ios_base::failure);
}
