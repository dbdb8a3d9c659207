#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing trace information.
 *
 * Verbose mode traces every produced line, very verbose mode also traces
 * every token read. Traces go to standard error.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags();

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to print verbose information is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Check if the flag to print very verbose information is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVeryVerbose() const;

  /**
   * @brief Clear every flag.
   */
  void Reset();

  void SetNeedToPrintVerbose();

  /**
   * @brief Set the flag to print very verbose information; implies verbose.
   */
  void SetNeedToPrintVeryVerbose();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_;
  bool need_to_print_very_verbose_;
};

} // namespace utils::verbose
