#include "camera/synthetic_source.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/time_utils.hpp"

namespace rover {

namespace {

constexpr double kTwoPi = 6.283185307179586;

// Oscillation rates of the three channels, in cycles per second.
constexpr double kRedRate = 0.10;
constexpr double kGreenRate = 0.17;
constexpr double kBlueRate = 0.07;

uint8_t toByte(double v) {
    return static_cast<uint8_t>(std::clamp(v, 0.0, 1.0) * 255.0);
}

}  // namespace

SyntheticFrameSource::SyntheticFrameSource(const EncodeOptions& encode, double nominal_fps)
    : encode_(encode), start_ns_(nowSteadyNs()) {
    width_ = std::max(16, encode_.max_width);
    height_ = std::max(1, static_cast<int>(std::lround(static_cast<double>(width_) * 9.0 / 16.0)));
    profile_ = "synthetic " + std::to_string(width_) + "x" + std::to_string(height_) + "@" +
               std::to_string(static_cast<int>(std::lround(nominal_fps))) + "fps";
}

void SyntheticFrameSource::render(double t_seconds, cv::Mat& rgb) const {
    rgb.create(height_, width_, CV_8UC3);

    const double x_den = (width_ > 1) ? static_cast<double>(width_ - 1) : 1.0;
    const double y_den = (height_ > 1) ? static_cast<double>(height_ - 1) : 1.0;

    // Red varies along x, green along y, blue along x+y. The blue term is
    // split with sin(a+b) so the inner loop stays multiply-add only.
    std::vector<uint8_t> red(static_cast<std::size_t>(width_));
    std::vector<double> sin_bx(static_cast<std::size_t>(width_));
    std::vector<double> cos_bx(static_cast<std::size_t>(width_));
    for (int x = 0; x < width_; ++x) {
        const double xv = static_cast<double>(x) / x_den;
        red[static_cast<std::size_t>(x)] = toByte(0.6 + 0.4 * std::sin(kTwoPi * (xv + t_seconds * kRedRate)));
        const double bx = kTwoPi * (xv + t_seconds * kBlueRate);
        sin_bx[static_cast<std::size_t>(x)] = std::sin(bx);
        cos_bx[static_cast<std::size_t>(x)] = std::cos(bx);
    }

    for (int y = 0; y < height_; ++y) {
        const double yv = static_cast<double>(y) / y_den;
        const uint8_t green = toByte(0.5 + 0.5 * std::sin(kTwoPi * (yv + t_seconds * kGreenRate)));
        const double by = kTwoPi * yv;
        const double sin_by = std::sin(by);
        const double cos_by = std::cos(by);

        auto* row = rgb.ptr<cv::Vec3b>(y);
        for (int x = 0; x < width_; ++x) {
            const std::size_t i = static_cast<std::size_t>(x);
            const double blue = 0.45 + 0.5 * (sin_bx[i] * cos_by + cos_bx[i] * sin_by);
            row[x] = cv::Vec3b(red[i], green, toByte(blue));
        }
    }
}

bool SyntheticFrameSource::produceFrame(Frame& out, std::string& error) {
    const double t = static_cast<double>(nowSteadyNs() - start_ns_) / 1e9;
    render(t, rgb_);

    const EncodedImage encoded = encodeFrame(rgb_, encode_);
    if (encoded.data_url.empty()) {
        error = "failed to encode synthetic frame";
        return false;
    }

    out.timestamp = utcIsoTimestamp();
    out.image_data_url = encoded.data_url;
    out.source = FrameSourceKind::Synthetic;
    out.status = "synthetic-feed";
    out.profile = profile_;
    error.clear();
    return true;
}

}  // namespace rover
