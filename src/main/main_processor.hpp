#pragma once

#include "launch_settings.hpp"
#include <istream>
#include <ostream>
#include <string>

/**
 * @brief Class representing the main processor of the program.
 */
class MainProcessor {
public:
  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Processes one input according to the launch settings.
   * @param in The input stream.
   * @param out The output stream.
   * @param name The input name used in error messages.
   */
  void ProcessStream(std::istream &in, std::ostream &out,
                     const std::string &name);

  void SetLaunchSettings(const LaunchSettings &settings) {
    launch_settings_ = settings;
  }

  /**
   * @brief Exits the program with the specified error status.
   * @param error_status The error status to exit with.
   */
  [[noreturn]] static void Exit(int error_status);

private:
  /**
   * @brief Handles the options that stop before reading any input.
   * @return True if the program must stop.
   */
  bool HandleLaunchSettings();

  /**
   * @brief Processes a named file, or standard input for "-".
   * @param name The file name.
   */
  void ProcessFile(const std::string &name);

  LaunchSettings launch_settings_;
};
