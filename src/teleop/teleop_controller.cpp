#include "teleop/teleop_controller.hpp"

#include <iostream>
#include <utility>

namespace rover {

TeleopController::TeleopController(const TeleopConfig& config, std::unique_ptr<MotionSink> sink)
    : config_(config), sink_(std::move(sink)) {}

TeleopResult TeleopController::handle(const std::string& direction) {
    Direction parsed = Direction::Stop;
    if (!parseDirection(direction, parsed)) {
        return TeleopResult{false, "Invalid direction"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sink_) {
        return TeleopResult{false, "Motion bridge not available"};
    }
    std::string err;
    if (!sink_->publish(velocityFor(parsed, config_), err)) {
        std::cerr << "teleop: publish " << directionName(parsed) << " failed: " << err << "\n";
        return TeleopResult{false, "Motion bridge not available"};
    }
    return TeleopResult{true, {}};
}

void TeleopController::releaseSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_.reset();
}

}  // namespace rover
