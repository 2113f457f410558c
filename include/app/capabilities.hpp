#pragma once

#include <string>

#include "core/config.hpp"

namespace rover {

// Evaluated once at startup. The rest of the service branches on these
// flags instead of probing optional backends again.
struct Capabilities {
    bool camera_backend{false};  // capture backend for camera.source_mode is built in
    bool motion_bridge{false};   // teleop.bridge_socket is configured
    std::string camera_backend_name;
};

Capabilities detectCapabilities(const AppConfig& config);

}  // namespace rover
