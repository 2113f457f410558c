#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "camera/frame_source.hpp"
#include "codec/frame_encoder.hpp"
#include "core/config.hpp"

namespace rover {

// Hardware camera behind cv::VideoCapture. Opens lazily on the first
// produceFrame(), walking the configured profiles until one is accepted, and
// keeps the device open across calls. Only a single RGB view is taken per
// cycle; no depth is ever requested.
class CameraIngest : public FrameSource {
public:
    CameraIngest(const CameraConfig& config, const EncodeOptions& encode);
    ~CameraIngest() override;

    CameraIngest(const CameraIngest&) = delete;
    CameraIngest& operator=(const CameraIngest&) = delete;

    bool produceFrame(Frame& out, std::string& error) override;
    void close() override;

    bool isOpen() const;
    const std::string& activeProfile() const { return active_profile_; }
    const std::string& activeSourceDescription() const { return active_source_desc_; }

    // Grabs one RGB image from the open device (left view only when
    // configured). Exposed for tools that bypass encoding.
    bool captureRgb(cv::Mat& rgb, std::string& error);

private:
    bool ensureOpen(std::string& error);
    bool openWithProfile(const CameraProfile& profile, std::string& error);
    bool openV4L2(int device_index, std::string& error);
    bool openGStreamer(const std::string& pipeline, std::string& error);

    static constexpr int kMaxGrabFailures = 30;

    cv::VideoCapture cap_;
    CameraConfig config_{};
    EncodeOptions encode_{};
    std::vector<CameraProfile> profiles_;
    std::string profiles_error_;
    cv::Mat bgr_;
    cv::Mat rgb_;
    std::string active_profile_;
    std::string active_source_desc_;
    int grab_fail_streak_{0};
};

}  // namespace rover
