#include "camera/synthetic_source.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

int main() {
    rover::EncodeOptions opts;
    rover::SyntheticFrameSource source(opts, 80.0);
    if (source.width() != 960 || source.height() != 540 || source.profile() != "synthetic 960x540@80fps") {
        std::cerr << "unexpected synthetic geometry/profile: " << source.profile() << "\n";
        return 1;
    }

    cv::Mat a;
    cv::Mat b;
    cv::Mat c;
    source.render(0.0, a);
    source.render(0.0, b);
    source.render(0.0125, c);
    if (a.type() != CV_8UC3 || a.cols != 960 || a.rows != 540) {
        std::cerr << "render should produce 960x540 RGB\n";
        return 1;
    }
    if (cv::norm(a, b, cv::NORM_INF) != 0.0) {
        std::cerr << "render must be a pure function of time\n";
        return 1;
    }
    // One frame period apart: changed, but only slightly.
    const double step = cv::norm(a, c, cv::NORM_INF);
    if (step == 0.0 || step > 8.0) {
        std::cerr << "consecutive frames should differ smoothly, max step " << step << "\n";
        return 1;
    }

    // Top-left pixel at t=0: R=0.6+0.4 sin(0), G=0.5+0.5 sin(0), B=0.45+0.5 sin(0).
    const cv::Vec3b p = a.at<cv::Vec3b>(0, 0);
    if (std::abs(p[0] - 153) > 1 || std::abs(p[1] - 127) > 1 || std::abs(p[2] - 114) > 1) {
        std::cerr << "unexpected gradient origin " << p << "\n";
        return 1;
    }

    rover::Frame frame;
    std::string err;
    if (!source.produceFrame(frame, err)) {
        std::cerr << "produceFrame failed: " << err << "\n";
        return 1;
    }
    if (frame.source != rover::FrameSourceKind::Synthetic || frame.status != "synthetic-feed" ||
        frame.image_data_url.rfind("data:image/jpeg;base64,", 0) != 0 || frame.timestamp.empty() ||
        frame.profile != source.profile()) {
        std::cerr << "synthetic frame metadata mismatch\n";
        return 1;
    }
    return 0;
}
