#pragma once

#include <memory>
#include <string>

#include "camera/frame_source.hpp"

namespace rover {

// Hardware-first frame selection. Every call tries the hardware source (which
// reuses an already open device) and substitutes the synthetic source for
// that cycle on any failure, carrying the failure reason in the frame status.
class FrameProducer {
public:
    // `hardware` may be null when no camera backend is available.
    FrameProducer(std::unique_ptr<FrameSource> hardware, std::unique_ptr<FrameSource> synthetic);

    FrameProducer(const FrameProducer&) = delete;
    FrameProducer& operator=(const FrameProducer&) = delete;

    Frame produce();
    void close();

    bool hasHardware() const { return hardware_ != nullptr; }
    bool lastFrameFromHardware() const { return last_from_hardware_; }
    const std::string& lastDiagnostic() const { return last_diagnostic_; }

private:
    void noteDiagnostic(const std::string& reason);

    std::unique_ptr<FrameSource> hardware_;
    std::unique_ptr<FrameSource> synthetic_;
    bool last_from_hardware_{false};
    bool logged_live_{false};
    std::string last_diagnostic_;
};

}  // namespace rover
