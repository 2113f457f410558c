#include "teleop/teleop_controller.hpp"

#include <iostream>
#include <memory>
#include <vector>

namespace {

class RecordingSink : public rover::MotionSink {
public:
    explicit RecordingSink(std::vector<rover::VelocityCommand>* log, bool fail = false) : log_(log), fail_(fail) {}

    bool publish(const rover::VelocityCommand& cmd, std::string& error) override {
        if (fail_) {
            error = "bridge down";
            return false;
        }
        log_->push_back(cmd);
        return true;
    }

private:
    std::vector<rover::VelocityCommand>* log_;
    bool fail_;
};

}  // namespace

int main() {
    const rover::TeleopConfig cfg;
    std::vector<rover::VelocityCommand> published;

    rover::TeleopController controller(cfg, std::make_unique<RecordingSink>(&published));
    if (!controller.bridgeAvailable()) {
        std::cerr << "controller with a sink should report the bridge available\n";
        return 1;
    }

    rover::TeleopResult r = controller.handle("forward");
    if (!r.ok || published.size() != 1U || published[0].linear_x != 0.3 || published[0].angular_z != 0.0) {
        std::cerr << "forward should publish exactly (0.3, 0)\n";
        return 1;
    }
    r = controller.handle("right");
    if (!r.ok || published.size() != 2U || published[1].angular_z != -0.8) {
        std::cerr << "right should publish (0, -0.8)\n";
        return 1;
    }

    r = controller.handle("sideways");
    if (r.ok || r.detail != "Invalid direction" || published.size() != 2U) {
        std::cerr << "invalid direction must be rejected without publishing\n";
        return 1;
    }

    rover::TeleopController no_bridge(cfg, nullptr);
    r = no_bridge.handle("stop");
    if (r.ok || r.detail != "Motion bridge not available") {
        std::cerr << "missing sink should degrade to unavailable\n";
        return 1;
    }
    r = no_bridge.handle("bogus");
    if (r.ok || r.detail != "Invalid direction") {
        std::cerr << "validation should come before the sink check\n";
        return 1;
    }

    std::vector<rover::VelocityCommand> unused;
    rover::TeleopController failing(cfg, std::make_unique<RecordingSink>(&unused, true));
    r = failing.handle("left");
    if (r.ok || r.detail != "Motion bridge not available") {
        std::cerr << "publish failure should report unavailable\n";
        return 1;
    }

    controller.releaseSink();
    if (controller.bridgeAvailable() || controller.handle("forward").ok || published.size() != 2U) {
        std::cerr << "released sink should no longer receive commands\n";
        return 1;
    }
    return 0;
}
