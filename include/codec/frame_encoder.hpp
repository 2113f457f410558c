#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace rover {

enum class ImageFormat {
    Jpeg = 0,
    Webp = 1,
};

bool parseImageFormat(const std::string& name, ImageFormat& out);

struct EncodeOptions {
    ImageFormat format{ImageFormat::Jpeg};
    int quality{82};
    int max_width{960};
};

struct EncodedImage {
    std::string data_url;   // "data:<mime>;base64,<body>", empty only on unusable input
    std::string mime_type;
    int width{0};           // dimensions of the encoded image
    int height{0};
    bool substituted{false};  // preferred format unavailable, JPEG used instead
};

// Encodes an 8-bit 3-channel RGB image. Images wider than max_width are
// downscaled with Lanczos resampling preserving aspect ratio; narrower images
// are never upscaled. JPEG output is progressive with 4:4:4 chroma. If the
// preferred format cannot be written, JPEG at quality+5 (capped at 100) is
// used and reported through mime_type. Never throws.
EncodedImage encodeFrame(const cv::Mat& rgb, const EncodeOptions& options);

// Width/height the encoder will produce for an input of the given size.
cv::Size targetEncodeSize(const cv::Size& input, int max_width);

}  // namespace rover
