#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/config.hpp"
#include "teleop/command_mapping.hpp"
#include "teleop/motion_sink.hpp"

namespace rover {

struct TeleopResult {
    bool ok{false};
    std::string detail;
};

// Validates a direction and forwards its velocity pair to the motion sink.
// A null sink means no motion bridge is wired up; commands then fail with
// "unavailable" instead of crashing.
class TeleopController {
public:
    TeleopController(const TeleopConfig& config, std::unique_ptr<MotionSink> sink);

    TeleopResult handle(const std::string& direction);

    bool bridgeAvailable() const { return sink_ != nullptr; }
    void releaseSink();

private:
    TeleopConfig config_;
    std::mutex mutex_;
    std::unique_ptr<MotionSink> sink_;
};

}  // namespace rover
