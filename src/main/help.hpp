#pragma once
#include <string_view>

constexpr std::string_view kVersion = "lenicss 1.0.0";

/**
 * @brief Prints usage on standard output.
 */
void PrintHelp();

void PrintVersion();
