#ifndef FATAL_LENICSS_H
#define FATAL_LENICSS_H

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for error handling and
 * explanation.
 *
 * The `loger` namespace provides functions for logging fatal and non-fatal
 * errors, as well as converting a character to a readable string.
 */
namespace loger {

/**
 * @brief Logs a fatal error with an optional additional message, then exits
 * with status 1.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
[[noreturn]] void fatal(const std::string_view &s1,
                        const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Sets the file name reported with errors.
 * @param file_name The input being processed.
 */
void SetFileName(const std::string_view &file_name);

/**
 * @brief Gets the number of errors logged so far.
 */
int GetErrorCount();

void ResetErrorCount();

/**
 * @brief Converts a character to a string representation.
 * @param n The code point.
 * @return The string representation of the character.
 */
std::string explainToString(int n);

} // namespace loger

#endif
