#pragma once

#include <string>
#include <vector>

namespace rover {

struct CameraProfile {
    int width{1280};
    int height{720};
    int fps{60};
};

struct CameraConfig {
    std::string source_mode{"v4l2"};  // v4l2 | gstreamer
    int device_index{0};
    std::string gstreamer_pipeline{
        "v4l2src device=/dev/video0 ! videoconvert ! appsink drop=true max-buffers=1"};
    // Tried in order until one opens at the requested size.
    std::string profiles{"1280x720@60,1920x1080@60,1280x720@30,1920x1080@30"};
    bool left_view_only{true};  // device delivers side-by-side stereo
};

struct StreamConfig {
    double frame_interval_ms{12.5};
    int max_width{960};
    int quality{82};
    std::string format{"jpeg"};  // jpeg | webp
};

struct TelemetryConfig {
    int interval_ms{1000};
    bool jitter_enabled{true};
    int jitter_seed{0};  // 0 = seed from std::random_device
    std::string thermal_root{"/sys/devices/virtual/thermal"};
    std::string cpu_zone{"cpu-thermal"};
    std::string gpu_zone{"gpu-thermal"};
};

struct TeleopConfig {
    double linear_speed{0.3};   // m/s
    double angular_speed{0.8};  // rad/s
    std::string bridge_socket{};  // empty = no motion bridge
};

struct SlamConfig {
    std::string command{
        "source /opt/ros/humble/setup.bash && "
        "source $HOME/helios_ws/install/setup.bash && "
        "ros2 launch helios_bringup helios_slam.launch.py use_rviz:=false"};
    std::string shell{"/bin/bash"};
    int stop_timeout_ms{5000};
};

struct ServerConfig {
    int port{8000};
    std::string control_socket{"/tmp/rover_relay.sock"};
};

struct AppConfig {
    CameraConfig camera;
    StreamConfig stream;
    TelemetryConfig telemetry;
    TeleopConfig teleop;
    SlamConfig slam;
    ServerConfig server;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

// Parses "1280x720@60,1920x1080@30" into profiles, preserving order.
bool parseCameraProfiles(const std::string& text, std::vector<CameraProfile>& out, std::string& error);

}  // namespace rover
