#include <gtest/gtest.h>

#include "../src/fatal/fatal.hpp"
#include "../src/main/main_processor.hpp"
#include "failing_buf.hpp"
#include <cstdlib>
#include <sstream>
#include <string>

TEST(MainProcessorTest, ProcessStream_PrintsLines) {
  LaunchSettings settings;
  settings.indent_unit = "  ";
  MainProcessor processor;
  processor.SetLaunchSettings(settings);

  std::istringstream in("a { b: c }");
  std::ostringstream out;
  processor.ProcessStream(in, out, "a.css");

  EXPECT_EQ(out.str(), "a {\n  b: c;\n}\n");
}

TEST(MainProcessorTest, ProcessStream_DumpsTokens) {
  LaunchSettings settings;
  settings.need_dump_tokens = true;
  MainProcessor processor;
  processor.SetLaunchSettings(settings);

  std::istringstream in("a;");
  std::ostringstream out;
  processor.ProcessStream(in, out, "a.css");

  EXPECT_EQ(out.str(), "1: WORD - \"a\"\n1: ORDINARY ';' = 59 \";\"\n");
}

TEST(MainProcessorTest, ProcessStream_ReadFault_IsFatal) {
  MainProcessor processor;
  FailingBuf buf("a { b: c; ");
  std::istream in(&buf);
  std::ostringstream out;

  EXPECT_EXIT(processor.ProcessStream(in, out, "broken.css"),
              ::testing::ExitedWithCode(1),
              "lenicss: broken.css, Error: read error: ");
}

TEST(MainProcessorTest, Main_MissingFile_Fails) {
  char *argv[] = {(char *)"program", (char *)"/nonexistent/lenicss.css"};
  MainProcessor processor;

  ::testing::internal::CaptureStderr();
  int status = processor.main(2, argv);
  std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(status, EXIT_FAILURE);
  EXPECT_NE(output.find("/nonexistent/lenicss.css, Error: cannot open file"),
            std::string::npos);
}

TEST(MainProcessorTest, Main_ErrorCountStartsAtZero) {
  char *missing_argv[] = {(char *)"program", (char *)"/nonexistent/a.css"};
  std::string sample = std::string(LENICSS_TEST_DATA_DIR) + "/sample.css";
  char *argv[] = {(char *)"program", sample.data()};
  MainProcessor processor;

  ::testing::internal::CaptureStderr();
  EXPECT_EQ(processor.main(2, missing_argv), EXIT_FAILURE);
  ::testing::internal::GetCapturedStderr();

  ::testing::internal::CaptureStdout();
  int status = processor.main(2, argv);
  std::string output = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(status, EXIT_SUCCESS);
  EXPECT_EQ(output.rfind("@charset \"UTF-8\";\n", 0), 0u);
}

TEST(MainProcessorTest, Main_Version_Stops) {
  char *argv[] = {(char *)"program", (char *)"-V"};
  MainProcessor processor;

  ::testing::internal::CaptureStdout();
  int status = processor.main(2, argv);
  std::string output = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(status, 0);
  EXPECT_EQ(output, "lenicss 1.0.0\n");
}
