#include "app/capabilities.hpp"
#include "app/relay_runtime.hpp"
#include "core/config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onStopSignal(int) {
    g_running.store(false);
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    std::signal(SIGPIPE, SIG_IGN);

    const std::string config_path = (argc > 1) ? argv[1] : "config/config.yaml";

    rover::AppConfig config;
    std::string error;
    if (!rover::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    const rover::Capabilities caps = rover::detectCapabilities(config);
    rover::RelayRuntime runtime(config, caps);
    if (!runtime.start(error)) {
        std::cerr << "Startup failed: " << error << '\n';
        runtime.shutdown();
        return 1;
    }

    std::cout << "Video stream on     ws://localhost:" << runtime.httpPort() << "/ws/zed\n";
    std::cout << "Telemetry stream on ws://localhost:" << runtime.httpPort() << "/ws/telemetry\n";
    std::cout << "Control socket:     " << config.server.control_socket << '\n';
    std::cout << "Press Ctrl+C to stop.\n";

    while (g_running.load() && !runtime.shutdownRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    runtime.shutdown();
    return 0;
}
