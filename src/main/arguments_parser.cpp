#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <string>

LaunchSettings ArgumentsParser::Parse(int &argc, char **&argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  verbose_flags.Reset();

  // a lone "-" is standard input, "--" ends the options
  while (argc > 1 && argv[1][0] == '-' && argv[1][1] != '\0') {
    if (argv[1][1] == '-' && argv[1][2] == '\0') {
      argc--;
      argv++;
      break;
    }
    switch (argv[1][1]) {
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    case 's': {
      result.SetIndentOptions(std::string(&argv[1][2]));
      break;
    }
    case 't': {
      result.need_annotate_kinds = true;
      break;
    }
    case 'T': {
      result.need_dump_tokens = true;
      break;
    }
    case 'v': {
      if (argv[1][2] == 'v') {
        verbose_flags.SetNeedToPrintVeryVerbose();
      } else {
        verbose_flags.SetNeedToPrintVerbose();
      }
      break;
    }
    default:
      throw std::runtime_error(fmt::format("unknown option '{}'", argv[1]));
    }
    argc--;
    argv++;
  }

  for (int i = 1; i < argc; i++) {
    result.input_files.push_back(argv[i]);
  }
  return result;
}
