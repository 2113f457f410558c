#pragma once

#include <string>

#include "core/config.hpp"
#include "core/types.hpp"

namespace rover {

enum class Direction {
    Forward = 0,
    Backward = 1,
    Left = 2,
    Right = 3,
    Stop = 4,
};

// Exact, case-sensitive match against the five direction names; anything
// else returns false and leaves `out` untouched.
bool parseDirection(const std::string& text, Direction& out);
const char* directionName(Direction direction);

VelocityCommand velocityFor(Direction direction, const TeleopConfig& config);

}  // namespace rover
