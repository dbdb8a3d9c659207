#include "launch_settings.hpp"

#include <fmt/core.h>
#include <stdexcept>

static constexpr std::size_t kDefaultIndentSpaces = 4;
static constexpr std::size_t kMaxIndentSpaces = 16;

void LaunchSettings::SetIndentOptions(const std::string &value) {
  std::size_t spaces = kDefaultIndentSpaces;
  if (!value.empty()) {
    if (value.find_first_not_of("0123456789") != std::string::npos ||
        value.size() > 2) {
      throw std::runtime_error(
          fmt::format("bad indentation width '{}'", value));
    }
    spaces = std::stoul(value);
  }
  if (spaces > kMaxIndentSpaces) {
    throw std::runtime_error(
        fmt::format("indentation width {} exceeds {}", spaces,
                    kMaxIndentSpaces));
  }
  indent_unit.assign(spaces, ' ');
}
