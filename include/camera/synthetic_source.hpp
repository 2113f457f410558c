#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "camera/frame_source.hpp"
#include "codec/frame_encoder.hpp"

namespace rover {

// Animated RGB gradient that keeps the UI alive when no camera is usable.
// Output depends only on the time elapsed since construction.
class SyntheticFrameSource : public FrameSource {
public:
    SyntheticFrameSource(const EncodeOptions& encode, double nominal_fps);

    bool produceFrame(Frame& out, std::string& error) override;

    // Renders the gradient for `t_seconds` of elapsed time.
    void render(double t_seconds, cv::Mat& rgb) const;

    int width() const { return width_; }
    int height() const { return height_; }
    const std::string& profile() const { return profile_; }

private:
    EncodeOptions encode_{};
    int width_{960};
    int height_{540};
    int64_t start_ns_{0};
    std::string profile_;
    cv::Mat rgb_;
};

}  // namespace rover
