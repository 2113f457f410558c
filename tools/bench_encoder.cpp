#include "camera/synthetic_source.hpp"
#include "codec/frame_encoder.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

int64_t pct(std::vector<int64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}

}  // namespace

// Usage: bench_encoder [jpeg|webp] [count]
int main(int argc, char** argv) {
    rover::EncodeOptions opts;
    if (argc > 1 && !rover::parseImageFormat(argv[1], opts.format)) {
        std::cerr << "unknown format '" << argv[1] << "'\n";
        return 1;
    }
    const int count = (argc > 2) ? std::max(1, std::stoi(argv[2])) : 300;

    // Full-width 1080p source so every sample pays for the Lanczos downscale.
    rover::EncodeOptions source_opts;
    source_opts.max_width = 1920;
    const rover::SyntheticFrameSource source(source_opts, 60.0);

    std::vector<int64_t> render_ns;
    std::vector<int64_t> encode_ns;
    std::vector<int64_t> bytes;
    render_ns.reserve(static_cast<std::size_t>(count));
    encode_ns.reserve(static_cast<std::size_t>(count));
    bytes.reserve(static_cast<std::size_t>(count));

    cv::Mat rgb;
    bool substituted = false;
    for (int i = 0; i < count; ++i) {
        const int64_t t0 = rover::nowSteadyNs();
        source.render(static_cast<double>(i) / 60.0, rgb);
        const int64_t t1 = rover::nowSteadyNs();
        const rover::EncodedImage img = rover::encodeFrame(rgb, opts);
        const int64_t t2 = rover::nowSteadyNs();
        if (img.data_url.empty()) {
            std::cerr << "encode failed at sample " << i << "\n";
            return 1;
        }
        substituted = substituted || img.substituted;
        render_ns.push_back(t1 - t0);
        encode_ns.push_back(t2 - t1);
        bytes.push_back(static_cast<int64_t>(img.data_url.size()));
    }

    const int64_t budget_ns = 12500000;
    const int64_t over = std::count_if(encode_ns.begin(), encode_ns.end(), [&](int64_t v) { return v > budget_ns; });

    std::cout << "benchmark frame_encoder\n";
    std::cout << "samples " << count << "\n";
    std::cout << "format " << (opts.format == rover::ImageFormat::Webp ? "webp" : "jpeg")
              << (substituted ? " (substituted jpeg)" : "") << "\n";
    std::cout << "render_ns_p50 " << pct(render_ns, 0.50) << "\n";
    std::cout << "render_ns_p95 " << pct(render_ns, 0.95) << "\n";
    std::cout << "encode_ns_p50 " << pct(encode_ns, 0.50) << "\n";
    std::cout << "encode_ns_p95 " << pct(encode_ns, 0.95) << "\n";
    std::cout << "encode_ns_p99 " << pct(encode_ns, 0.99) << "\n";
    std::cout << "data_url_bytes_p50 " << pct(bytes, 0.50) << "\n";
    std::cout << "over_frame_budget " << over << "\n";
    return 0;
}
