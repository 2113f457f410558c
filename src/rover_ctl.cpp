#include "core/config.hpp"
#include "ipc/control_plane.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string config_path = "config/config.yaml";
    std::string command;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a path\n";
                return 1;
            }
            config_path = argv[++i];
            continue;
        }
        if (!command.empty()) {
            command += ' ';
        }
        command += arg;
    }
    if (command.empty()) {
        std::cerr << "usage: rover_ctl <health | slam start|stop|status | teleop <direction> | shutdown> "
                     "[--config path]\n";
        return 1;
    }

    rover::AppConfig cfg;
    std::string err;
    if (!rover::loadConfig(config_path, cfg, err)) {
        std::cerr << "config load failed: " << err << "\n";
        return 1;
    }

    // slam stop may wait out the full graceful timeout plus the kill grace.
    const int timeout_ms = cfg.slam.stop_timeout_ms + 5000;
    std::string response;
    if (!rover::ipc::unixControlRequest(cfg.server.control_socket, command + "\n", response, err, timeout_ms)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }

    std::cout << response;
    if (!response.empty() && response.back() != '\n') {
        std::cout << '\n';
    }
    return response.compare(0, 2, "OK") == 0 ? 0 : 1;
}
