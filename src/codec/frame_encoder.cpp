#include "codec/frame_encoder.hpp"

#include <algorithm>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "core/base64.hpp"

namespace rover {

namespace {

bool encodeJpeg(const cv::Mat& bgr, int quality, std::vector<unsigned char>& out) {
    const std::vector<int> params{
        cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100),
        cv::IMWRITE_JPEG_PROGRESSIVE, 1,
        cv::IMWRITE_JPEG_SAMPLING_FACTOR, cv::IMWRITE_JPEG_SAMPLING_FACTOR_444,
    };
    return cv::imencode(".jpg", bgr, out, params) && !out.empty();
}

bool encodeWebp(const cv::Mat& bgr, int quality, std::vector<unsigned char>& out) {
    if (!cv::haveImageWriter(".webp")) {
        return false;
    }
    const std::vector<int> params{cv::IMWRITE_WEBP_QUALITY, std::clamp(quality, 1, 100)};
    return cv::imencode(".webp", bgr, out, params) && !out.empty();
}

std::string makeDataUrl(const std::string& mime, const std::vector<unsigned char>& bytes) {
    return "data:" + mime + ";base64," + base64Encode(bytes);
}

}  // namespace

bool parseImageFormat(const std::string& name, ImageFormat& out) {
    if (name == "jpeg" || name == "jpg") {
        out = ImageFormat::Jpeg;
        return true;
    }
    if (name == "webp") {
        out = ImageFormat::Webp;
        return true;
    }
    return false;
}

cv::Size targetEncodeSize(const cv::Size& input, int max_width) {
    if (max_width <= 0 || input.width <= max_width) {
        return input;
    }
    const double ratio = static_cast<double>(max_width) / static_cast<double>(input.width);
    const int h = std::max(1, static_cast<int>(static_cast<double>(input.height) * ratio));
    return cv::Size(max_width, h);
}

EncodedImage encodeFrame(const cv::Mat& rgb, const EncodeOptions& options) {
    EncodedImage result;
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        return result;
    }

    try {
        cv::Mat scaled = rgb;
        const cv::Size target = targetEncodeSize(rgb.size(), options.max_width);
        if (target != rgb.size()) {
            cv::resize(rgb, scaled, target, 0.0, 0.0, cv::INTER_LANCZOS4);
        }

        cv::Mat bgr;
        cv::cvtColor(scaled, bgr, cv::COLOR_RGB2BGR);
        result.width = bgr.cols;
        result.height = bgr.rows;

        std::vector<unsigned char> bytes;
        if (options.format == ImageFormat::Webp) {
            bool ok = false;
            try {
                ok = encodeWebp(bgr, options.quality, bytes);
            } catch (const cv::Exception&) {
                ok = false;
            }
            if (ok) {
                result.mime_type = "image/webp";
                result.data_url = makeDataUrl(result.mime_type, bytes);
                return result;
            }
            result.substituted = true;
            bytes.clear();
            if (encodeJpeg(bgr, std::min(options.quality + 5, 100), bytes)) {
                result.mime_type = "image/jpeg";
                result.data_url = makeDataUrl(result.mime_type, bytes);
            }
            return result;
        }

        if (encodeJpeg(bgr, options.quality, bytes)) {
            result.mime_type = "image/jpeg";
            result.data_url = makeDataUrl(result.mime_type, bytes);
        }
    } catch (const cv::Exception&) {
        result.data_url.clear();
        result.mime_type.clear();
    }
    return result;
}

}  // namespace rover
