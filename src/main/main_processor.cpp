#include "main_processor.hpp"

#include "../fatal/fatal.hpp"
#include "../lexer/lexer.hpp"
#include "../utils/format/css_viewer.hpp"
#include "../utils/format/token_viewer.hpp"
#include "arguments_parser.hpp"
#include "help.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <stdexcept>

int MainProcessor::main(int argc, char *argv[]) {
  loger::ResetErrorCount();
  ArgumentsParser parser;
  try {
    launch_settings_ = parser.Parse(argc, argv);
  } catch (const std::runtime_error &error) {
    PrintHelp();
    loger::fatal(error.what());
  }

  if (HandleLaunchSettings()) {
    return 0;
  }

  if (launch_settings_.input_files.empty()) {
    ProcessFile("-");
  }
  for (const auto &name : launch_settings_.input_files) {
    ProcessFile(name);
  }
  return loger::GetErrorCount() > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}

bool MainProcessor::HandleLaunchSettings() {
  if (launch_settings_.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }

  if (launch_settings_.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  return false;
}

void MainProcessor::ProcessFile(const std::string &name) {
  if (name == "-") {
    ProcessStream(std::cin, std::cout, "stdin");
    return;
  }

  std::ifstream file(name, std::ios::binary);
  if (!file.is_open()) {
    loger::SetFileName(name);
    loger::non_fatal("cannot open file");
    return;
  }
  ProcessStream(file, std::cout, name);
}

void MainProcessor::ProcessStream(std::istream &in, std::ostream &out,
                                  const std::string &name) {
  loger::SetFileName(name);
  try {
    if (launch_settings_.need_dump_tokens) {
      lexer::Tokenizer tokenizer(&in);
      format::TokenViewer viewer;
      viewer.view(tokenizer, out);
      return;
    }

    lexer::Lexer lexer(&in);
    format::CssViewer viewer(launch_settings_.indent_unit,
                             launch_settings_.need_annotate_kinds);
    viewer.view(lexer, out);
  } catch (const std::ios_base::failure &error) {
    loger::fatal("read error: ", std::string(error.what()));
  }
}

void MainProcessor::Exit(int error_status) {
  std::cout.flush();
  std::exit(error_status);
}
