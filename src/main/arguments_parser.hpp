#pragma once
#include "launch_settings.hpp"

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating launch settings.
 */
class ArgumentsParser {
public:
    /**
     * @brief Parses the command-line arguments and generates launch settings.
     * @param[in, out] argc The number of command-line arguments.
     *                     On return, the number of arguments left after options.
     * @param[in, out] argv The array of command-line arguments.
     *                     On return, points just before the first input file.
     * @return The generated launch settings based on the parsed command-line arguments.
     * @throws std::runtime_error on an unknown or malformed option.
     */
    LaunchSettings Parse(int& argc, char **&argv);
};
