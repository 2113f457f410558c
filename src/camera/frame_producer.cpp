#include "camera/frame_producer.hpp"

#include <iostream>

#include "core/time_utils.hpp"

namespace rover {

FrameProducer::FrameProducer(std::unique_ptr<FrameSource> hardware, std::unique_ptr<FrameSource> synthetic)
    : hardware_(std::move(hardware)), synthetic_(std::move(synthetic)) {}

void FrameProducer::noteDiagnostic(const std::string& reason) {
    if (reason != last_diagnostic_) {
        std::cerr << "camera: hardware unavailable, using synthetic source: " << reason << "\n";
        last_diagnostic_ = reason;
    }
    logged_live_ = false;
}

Frame FrameProducer::produce() {
    std::string reason = "camera backend not available";
    if (hardware_) {
        Frame frame;
        if (hardware_->produceFrame(frame, reason)) {
            if (!logged_live_) {
                std::cerr << "camera: hardware feed live (" << frame.profile << ")\n";
                logged_live_ = true;
            }
            last_diagnostic_.clear();
            last_from_hardware_ = true;
            return frame;
        }
    }
    noteDiagnostic(reason);
    last_from_hardware_ = false;

    Frame frame;
    std::string synth_error;
    if (synthetic_ && synthetic_->produceFrame(frame, synth_error)) {
        frame.status = reason;
        return frame;
    }

    // Still hand out a well-formed frame with an empty image body.
    frame.timestamp = utcIsoTimestamp();
    frame.image_data_url = "data:image/jpeg;base64,";
    frame.source = FrameSourceKind::Synthetic;
    frame.status = synth_error.empty() ? reason : reason + "; " + synth_error;
    frame.profile.clear();
    return frame;
}

void FrameProducer::close() {
    if (hardware_) {
        hardware_->close();
    }
    if (synthetic_) {
        synthetic_->close();
    }
}

}  // namespace rover
