#include "camera/camera_ingest.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace rover {

namespace {

std::string describeProfile(int width, int height, int fps) {
    return std::to_string(width) + "x" + std::to_string(height) + "@" + std::to_string(fps) + "fps";
}

}  // namespace

CameraIngest::CameraIngest(const CameraConfig& config, const EncodeOptions& encode)
    : config_(config), encode_(encode) {
    if (!parseCameraProfiles(config_.profiles, profiles_, profiles_error_)) {
        profiles_.clear();
    }
}

CameraIngest::~CameraIngest() {
    close();
}

bool CameraIngest::openV4L2(int device_index, std::string& error) {
#ifdef __linux__
    const std::string dev = "/dev/video" + std::to_string(device_index);
    if (::access(dev.c_str(), F_OK) != 0) {
        error = "V4L2 device not found: " + dev;
        return false;
    }
#endif
    if (!cap_.open(device_index, cv::CAP_V4L2)) {
        error = "failed to open V4L2 camera device index " + std::to_string(device_index);
        return false;
    }
    active_source_desc_ = "v4l2:/dev/video" + std::to_string(device_index);
    error.clear();
    return true;
}

bool CameraIngest::openGStreamer(const std::string& pipeline, std::string& error) {
    if (!cap_.open(pipeline, cv::CAP_GSTREAMER)) {
        error = "failed to open GStreamer pipeline";
        return false;
    }
    active_source_desc_ = "gstreamer:" + pipeline;
    error.clear();
    return true;
}

bool CameraIngest::openWithProfile(const CameraProfile& profile, std::string& error) {
    if (config_.source_mode == "gstreamer") {
        // The pipeline fixes caps itself; accept whatever it negotiates.
        if (!openGStreamer(config_.gstreamer_pipeline, error)) {
            return false;
        }
        const int w = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
        const int h = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
        const int fps = static_cast<int>(std::lround(cap_.get(cv::CAP_PROP_FPS)));
        active_profile_ = describeProfile(config_.left_view_only ? w / 2 : w, h, fps);
        return true;
    }

    if (!openV4L2(config_.device_index, error)) {
        return false;
    }
    // Side-by-side stereo devices report both views in one image.
    const int requested_width = config_.left_view_only ? profile.width * 2 : profile.width;
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(requested_width));
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(profile.height));
    cap_.set(cv::CAP_PROP_FPS, static_cast<double>(profile.fps));

    const int got_w = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    const int got_h = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (got_w != requested_width || got_h != profile.height) {
        error = "camera rejected profile " + describeProfile(profile.width, profile.height, profile.fps) +
                " (got " + std::to_string(got_w) + "x" + std::to_string(got_h) + ")";
        cap_.release();
        active_source_desc_.clear();
        return false;
    }
    active_profile_ = describeProfile(profile.width, profile.height, profile.fps);
    error.clear();
    return true;
}

bool CameraIngest::ensureOpen(std::string& error) {
    if (cap_.isOpened()) {
        return true;
    }
    if (profiles_.empty()) {
        error = "no usable camera profiles: " + profiles_error_;
        return false;
    }

    std::string last_error;
    try {
        for (const auto& profile : profiles_) {
            if (openWithProfile(profile, last_error)) {
                grab_fail_streak_ = 0;
                error.clear();
                return true;
            }
            if (config_.source_mode == "gstreamer") {
                break;
            }
            // A missing device node will not appear between profile attempts.
            if (last_error.find("not found") != std::string::npos) {
                break;
            }
        }
    } catch (const cv::Exception& e) {
        last_error = std::string("camera backend error: ") + e.what();
        if (cap_.isOpened()) {
            cap_.release();
        }
    }
    error = "failed to open camera: " + last_error;
    return false;
}

bool CameraIngest::captureRgb(cv::Mat& rgb, std::string& error) {
    if (!cap_.isOpened()) {
        error = "camera is not open";
        return false;
    }

    try {
        if (!cap_.read(bgr_) || bgr_.empty()) {
            error = "failed to grab frame from camera";
            return false;
        }
        cv::Mat view = bgr_;
        if (config_.left_view_only && bgr_.cols >= 2) {
            view = bgr_(cv::Rect(0, 0, bgr_.cols / 2, bgr_.rows));
        }
        if (view.channels() == 4) {
            cv::cvtColor(view, rgb, cv::COLOR_BGRA2RGB);
        } else if (view.channels() == 3) {
            cv::cvtColor(view, rgb, cv::COLOR_BGR2RGB);
        } else {
            cv::cvtColor(view, rgb, cv::COLOR_GRAY2RGB);
        }
    } catch (const cv::Exception& e) {
        error = std::string("camera grab error: ") + e.what();
        return false;
    }
    error.clear();
    return true;
}

bool CameraIngest::produceFrame(Frame& out, std::string& error) {
    if (!ensureOpen(error)) {
        return false;
    }

    if (!captureRgb(rgb_, error)) {
        grab_fail_streak_++;
        if (grab_fail_streak_ >= kMaxGrabFailures) {
            // Force a fresh open on the next cycle; the device may have been replugged.
            close();
            error += " (device closed after repeated failures)";
        }
        return false;
    }
    grab_fail_streak_ = 0;

    const EncodedImage encoded = encodeFrame(rgb_, encode_);
    if (encoded.data_url.empty()) {
        error = "failed to encode camera frame";
        return false;
    }

    out.timestamp = utcIsoTimestamp();
    out.image_data_url = encoded.data_url;
    out.source = FrameSourceKind::Hardware;
    out.status = "live";
    out.profile = active_profile_;
    error.clear();
    return true;
}

void CameraIngest::close() {
    bgr_.release();
    rgb_.release();
    active_profile_.clear();
    if (cap_.isOpened()) {
        cap_.release();
    }
    active_source_desc_.clear();
}

bool CameraIngest::isOpen() const {
    return cap_.isOpened();
}

}  // namespace rover
