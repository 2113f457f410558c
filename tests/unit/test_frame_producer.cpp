#include "camera/frame_producer.hpp"
#include "camera/synthetic_source.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace {

// Hardware stand-in: fails for the first `fail_count` calls, then serves
// frames. Counts opens to check the device is reused once open.
class ScriptedCamera : public rover::FrameSource {
public:
    ScriptedCamera(int fail_count, int* opens, int* closes) : fail_left_(fail_count), opens_(opens), closes_(closes) {}

    bool produceFrame(rover::Frame& out, std::string& error) override {
        if (fail_left_ > 0) {
            fail_left_--;
            error = "no camera at /dev/video0";
            return false;
        }
        if (!open_) {
            open_ = true;
            (*opens_)++;
        }
        out.timestamp = "2024-01-01T00:00:00.000000Z";
        out.image_data_url = "data:image/jpeg;base64,AAAA";
        out.source = rover::FrameSourceKind::Hardware;
        out.status = "live";
        out.profile = "1280x720@60fps";
        return true;
    }

    void close() override {
        open_ = false;
        (*closes_)++;
    }

private:
    int fail_left_;
    int* opens_;
    int* closes_;
    bool open_{false};
};

class BrokenSource : public rover::FrameSource {
public:
    bool produceFrame(rover::Frame&, std::string& error) override {
        error = "encoder exploded";
        return false;
    }
};

}  // namespace

int main() {
    const rover::EncodeOptions opts;

    rover::FrameProducer no_hw(nullptr, std::make_unique<rover::SyntheticFrameSource>(opts, 80.0));
    rover::Frame f = no_hw.produce();
    if (f.source != rover::FrameSourceKind::Synthetic || f.status != "camera backend not available" ||
        f.image_data_url.rfind("data:image/jpeg;base64,", 0) != 0 || no_hw.hasHardware()) {
        std::cerr << "missing backend should yield synthetic frames carrying the reason\n";
        return 1;
    }

    int opens = 0;
    int closes = 0;
    rover::FrameProducer producer(
        std::make_unique<ScriptedCamera>(2, &opens, &closes),
        std::make_unique<rover::SyntheticFrameSource>(opts, 80.0));

    for (int i = 0; i < 2; ++i) {
        f = producer.produce();
        if (f.source != rover::FrameSourceKind::Synthetic || f.status != "no camera at /dev/video0" ||
            producer.lastFrameFromHardware() || producer.lastDiagnostic() != "no camera at /dev/video0") {
            std::cerr << "hardware failure should substitute synthetic with the failure reason\n";
            return 1;
        }
    }
    // The hardware is retried every cycle, so it recovers without a restart.
    for (int i = 0; i < 5; ++i) {
        f = producer.produce();
        if (f.source != rover::FrameSourceKind::Hardware || f.status != "live" || !producer.lastFrameFromHardware()) {
            std::cerr << "recovered hardware should be used\n";
            return 1;
        }
    }
    if (opens != 1) {
        std::cerr << "open device should be reused across cycles, opens=" << opens << "\n";
        return 1;
    }
    if (!producer.lastDiagnostic().empty()) {
        std::cerr << "diagnostic should clear once hardware is live\n";
        return 1;
    }
    producer.close();
    if (closes != 1) {
        std::cerr << "close should release the hardware source\n";
        return 1;
    }

    rover::FrameProducer both_broken(nullptr, std::make_unique<BrokenSource>());
    f = both_broken.produce();
    if (f.image_data_url != "data:image/jpeg;base64," || f.timestamp.empty() ||
        f.status.find("encoder exploded") == std::string::npos) {
        std::cerr << "total failure should still produce a well-formed frame\n";
        return 1;
    }
    return 0;
}
