#include "app/capabilities.hpp"

#include <iostream>

#include <opencv2/videoio.hpp>
#include <opencv2/videoio/registry.hpp>

namespace rover {

Capabilities detectCapabilities(const AppConfig& config) {
    Capabilities caps;
    const cv::VideoCaptureAPIs api =
        (config.camera.source_mode == "gstreamer") ? cv::CAP_GSTREAMER : cv::CAP_V4L2;
    try {
        caps.camera_backend = cv::videoio_registry::hasBackend(api);
        caps.camera_backend_name = cv::videoio_registry::getBackendName(api);
    } catch (const cv::Exception& e) {
        std::cerr << "capabilities: videoio registry query failed: " << e.what() << "\n";
        caps.camera_backend = false;
    }
    caps.motion_bridge = !config.teleop.bridge_socket.empty();

    std::cerr << "capabilities: camera_backend=" << (caps.camera_backend ? "yes" : "no")
              << " (" << (caps.camera_backend_name.empty() ? config.camera.source_mode : caps.camera_backend_name)
              << ") motion_bridge=" << (caps.motion_bridge ? "yes" : "no") << "\n";
    return caps;
}

}  // namespace rover
