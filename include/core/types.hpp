#pragma once

#include <string>

namespace rover {

enum class FrameSourceKind {
    Hardware = 0,
    Synthetic = 1,
};

const char* frameSourceName(FrameSourceKind kind);

// One encoded camera image plus source metadata. Replaced wholesale, never
// edited in place once published.
struct Frame {
    std::string timestamp;       // UTC ISO-8601 with trailing 'Z'
    std::string image_data_url;  // "data:<mime>;base64,<body>"
    FrameSourceKind source{FrameSourceKind::Synthetic};
    std::string status;
    std::string profile;         // "1280x720@60fps", or empty
};

struct WheelEncoders {
    int front_left{0};
    int front_right{0};
    int rear_left{0};
    int rear_right{0};
};

struct ThermalState {
    double cpu_temp_c{0.0};
    double gpu_temp_c{0.0};
};

struct PowerState {
    double voltage_v{0.0};
    double soc_pct{0.0};
};

struct MotorState {
    double torque_oz_in{0.0};
    double speed_rpm{0.0};
    double current_ma{0.0};
    double output_power_w{0.0};
    double input_power_w{0.0};
    double efficiency{0.0};  // [0,1]
};

struct TelemetrySample {
    std::string timestamp;
    WheelEncoders encoders;
    ThermalState thermal;
    PowerState power;
    MotorState motor;
};

struct VelocityCommand {
    double linear_x{0.0};   // m/s
    double angular_z{0.0};  // rad/s
};

}  // namespace rover
