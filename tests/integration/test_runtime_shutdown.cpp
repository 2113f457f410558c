#include "app/capabilities.hpp"
#include "app/relay_runtime.hpp"
#include "core/time_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

int connectLocal(uint16_t port) {
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    timeval tv{};
    tv.tv_sec = 3;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

}  // namespace

int main() {
    const std::string control_sock =
        "/tmp/rover_it_shutdown_" + std::to_string(static_cast<long long>(::getpid())) + ".sock";

    rover::AppConfig cfg;
    cfg.server.port = 0;
    cfg.server.control_socket = control_sock;
    cfg.stream.max_width = 320;
    cfg.telemetry.thermal_root = "/nonexistent";
    cfg.slam.shell = "/bin/sh";
    cfg.slam.command = "sleep 30";
    cfg.slam.stop_timeout_ms = 1000;

    rover::Capabilities caps;
    rover::RelayRuntime runtime(cfg, caps);
    std::string err;
    if (!runtime.start(err)) {
        std::cerr << "runtime start failed: " << err << "\n";
        return 1;
    }
    const uint16_t port = runtime.httpPort();

    if (runtime.slam().start() != rover::ProcessState::Running) {
        std::cerr << "slam start failed\n";
        return 1;
    }
    const pid_t slam_pid = runtime.slam().pid();

    // An open video stream must not hold up shutdown.
    const int ws = connectLocal(port);
    if (ws < 0) {
        std::cerr << "connect failed\n";
        return 1;
    }
    const std::string upgrade = "GET /ws/zed HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\n"
                                "Connection: Upgrade\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n\r\n";
    if (send(ws, upgrade.data(), upgrade.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(upgrade.size())) {
        std::cerr << "upgrade send failed\n";
        return 1;
    }
    char buf[4096];
    if (recv(ws, buf, sizeof(buf), 0) <= 0) {
        std::cerr << "no data on the video stream\n";
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    const uint64_t frames_before = runtime.capture().framesProduced();
    if (frames_before == 0U || !runtime.capture().isRunning()) {
        std::cerr << "capture loop should be running\n";
        return 1;
    }

    const int64_t t0 = rover::nowSteadyNs();
    runtime.shutdown();
    const int64_t elapsed_ms = (rover::nowSteadyNs() - t0) / 1000000LL;

    int rc = 0;
    if (elapsed_ms > 4000) {
        std::cerr << "shutdown took " << elapsed_ms << " ms\n";
        rc = 1;
    }
    if (runtime.capture().isRunning()) {
        std::cerr << "capture loop still running after shutdown\n";
        rc = 1;
    }
    const uint64_t frames_after = runtime.capture().framesProduced();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (runtime.capture().framesProduced() != frames_after) {
        std::cerr << "frames produced after shutdown\n";
        rc = 1;
    }
    if (runtime.slam().pid() != -1 || ::kill(slam_pid, 0) == 0) {
        std::cerr << "mapping process survived shutdown\n";
        rc = 1;
    }
    if (runtime.teleop().bridgeAvailable()) {
        std::cerr << "motion bridge should be released\n";
        rc = 1;
    }
    struct stat st{};
    if (::stat(control_sock.c_str(), &st) == 0) {
        std::cerr << "control socket file should be removed\n";
        rc = 1;
    }
    const int late = connectLocal(port);
    if (late >= 0) {
        std::cerr << "HTTP listener still accepting after shutdown\n";
        close(late);
        rc = 1;
    }

    // The open stream sees the server go away: drain until EOF or error.
    ssize_t n = 0;
    int reads = 0;
    while ((n = recv(ws, buf, sizeof(buf), 0)) > 0 && reads < 10000) {
        reads++;
    }
    if (n > 0) {
        std::cerr << "video stream kept flowing after shutdown\n";
        rc = 1;
    }
    close(ws);

    runtime.shutdown();
    if (runtime.start(err)) {
        std::cerr << "start after shutdown should be refused\n";
        rc = 1;
    }
    return rc;
}
