#pragma once

#include <memory>

namespace models {

struct Token;
class Line;

using LinePtr = std::shared_ptr<const Line>;

} // namespace models
