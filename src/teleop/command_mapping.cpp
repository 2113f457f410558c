#include "teleop/command_mapping.hpp"

namespace rover {

bool parseDirection(const std::string& text, Direction& out) {
    if (text == "forward") {
        out = Direction::Forward;
    } else if (text == "backward") {
        out = Direction::Backward;
    } else if (text == "left") {
        out = Direction::Left;
    } else if (text == "right") {
        out = Direction::Right;
    } else if (text == "stop") {
        out = Direction::Stop;
    } else {
        return false;
    }
    return true;
}

const char* directionName(Direction direction) {
    switch (direction) {
        case Direction::Forward:
            return "forward";
        case Direction::Backward:
            return "backward";
        case Direction::Left:
            return "left";
        case Direction::Right:
            return "right";
        case Direction::Stop:
            return "stop";
    }
    return "stop";
}

VelocityCommand velocityFor(Direction direction, const TeleopConfig& config) {
    VelocityCommand cmd;
    switch (direction) {
        case Direction::Forward:
            cmd.linear_x = config.linear_speed;
            break;
        case Direction::Backward:
            cmd.linear_x = -config.linear_speed;
            break;
        case Direction::Left:
            cmd.angular_z = config.angular_speed;
            break;
        case Direction::Right:
            cmd.angular_z = -config.angular_speed;
            break;
        case Direction::Stop:
            break;
    }
    return cmd;
}

}  // namespace rover
