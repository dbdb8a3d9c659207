#pragma once

#include <string>
#include <vector>

struct LaunchSettings {
  bool need_annotate_kinds = false;
  bool need_dump_tokens = false;
  bool need_to_print_version_and_stop = false;
  bool need_to_print_help_and_stop = false;

  std::string indent_unit = "\t";

  std::vector<std::string> input_files; // empty or "-" for stdin

  /**
   * @brief Switches indentation to spaces.
   * @param value Number of spaces, as written after the option; empty for
   * the default of 4.
   * @throws std::runtime_error if value is not a small number.
   */
  void SetIndentOptions(const std::string &value);
};
