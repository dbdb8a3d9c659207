#include <gtest/gtest.h>

#include "../src/utils/format/css_viewer.hpp"
#include "../src/utils/format/token_viewer.hpp"
#include <sstream>

TEST(CssViewerTest, View_PrintsIndentedLines) {
  std::istringstream in("a{b:c}d{}");
  lexer::Lexer lexer(&in);
  std::ostringstream out;
  format::CssViewer viewer;

  EXPECT_EQ(viewer.view(lexer, out), 5u);
  EXPECT_EQ(out.str(), "a {\n"
                       "\tb: c;\n"
                       "}\n"
                       "d {\n"
                       "}\n");
}

TEST(CssViewerTest, View_AnnotatedWithSpaces) {
  std::istringstream in("a { b: c; } x");
  lexer::Lexer lexer(&in);
  std::ostringstream out;
  format::CssViewer viewer("  ", true);

  EXPECT_EQ(viewer.view(lexer, out), 4u);
  EXPECT_EQ(out.str(), "a { /* BLOCK_OPENING */\n"
                       "  b: c; /* PROPERTY */\n"
                       "} /* BLOCK_CLOSURE */\n"
                       "x /* UNKNOWN */\n");
}

TEST(CssViewerTest, View_EmptyInput_PrintsNothing) {
  std::istringstream in("");
  lexer::Lexer lexer(&in);
  std::ostringstream out;
  format::CssViewer viewer;

  EXPECT_EQ(viewer.view(lexer, out), 0u);
  EXPECT_EQ(out.str(), "");
}

TEST(TokenViewerTest, View_DumpsEveryToken) {
  std::istringstream in("a:\n'b c'");
  lexer::Tokenizer tokenizer(&in);
  std::ostringstream out;
  format::TokenViewer viewer;

  EXPECT_EQ(viewer.view(tokenizer, out), 3u);
  EXPECT_EQ(out.str(), "1: WORD - \"a\"\n"
                       "1: ORDINARY ':' = 58 \":\"\n"
                       "2: QUOTED ''' = 39 \"b c\"\n");
}
