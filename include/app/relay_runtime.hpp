#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "app/capabilities.hpp"
#include "camera/frame_producer.hpp"
#include "capture/capture_loop.hpp"
#include "core/config.hpp"
#include "ipc/control_plane.hpp"
#include "process/process_supervisor.hpp"
#include "telemetry/telemetry_synth.hpp"
#include "teleop/teleop_controller.hpp"
#include "web/http_server.hpp"
#include "web/relay_endpoints.hpp"

namespace rover {

// Owns every long-lived component of the relay and sequences startup and
// shutdown.
class RelayRuntime {
public:
    RelayRuntime(const AppConfig& config, const Capabilities& caps);
    ~RelayRuntime();

    RelayRuntime(const RelayRuntime&) = delete;
    RelayRuntime& operator=(const RelayRuntime&) = delete;

    // Starts the capture loop, HTTP listener and control socket. Calling it
    // again while running is a no-op.
    bool start(std::string& error);

    // HTTP listener, capture loop, camera, mapping process, motion bridge,
    // control socket. Every step runs even if an earlier one failed.
    void shutdown();

    // Set by the `shutdown` control command; the owner polls it.
    bool shutdownRequested() const { return shutdown_requested_.load(); }

    uint16_t httpPort() const { return http_.boundPort(); }
    CaptureLoop& capture() { return *capture_; }
    ProcessSupervisor& slam() { return slam_; }
    TeleopController& teleop() { return *teleop_; }
    RelayEndpoints& endpoints() { return *endpoints_; }

private:
    AppConfig config_;
    Capabilities caps_;

    std::unique_ptr<FrameProducer> producer_;
    std::unique_ptr<CaptureLoop> capture_;
    ProcessSupervisor slam_;
    TelemetrySynthesizer telemetry_;
    std::unique_ptr<TeleopController> teleop_;
    std::unique_ptr<RelayEndpoints> endpoints_;
    HttpServer http_;
    ipc::UnixControlServer control_;

    std::mutex lifecycle_mutex_;
    bool started_{false};
    bool shut_down_{false};
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace rover
