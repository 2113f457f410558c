#include "teleop/motion_sink.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

#include "ipc/control_plane.hpp"

namespace rover {

UnixSocketMotionSink::UnixSocketMotionSink(std::string socket_path) : socket_path_(std::move(socket_path)) {}

std::string UnixSocketMotionSink::formatCommand(const VelocityCommand& cmd) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << "cmd_vel " << cmd.linear_x << " " << cmd.angular_z << "\n";
    return oss.str();
}

bool UnixSocketMotionSink::publish(const VelocityCommand& cmd, std::string& error) {
    std::string response;
    if (!ipc::unixControlRequest(socket_path_, formatCommand(cmd), response, error)) {
        error = "motion bridge unavailable: " + error;
        return false;
    }
    if (response.rfind("OK", 0) != 0) {
        error = "motion bridge rejected command: " + response;
        return false;
    }
    error.clear();
    return true;
}

}  // namespace rover
