#pragma once

#include <atomic>
#include <functional>
#include <string>

#include "capture/capture_loop.hpp"
#include "core/config.hpp"
#include "process/process_supervisor.hpp"
#include "telemetry/telemetry_synth.hpp"
#include "teleop/teleop_controller.hpp"
#include "web/http_server.hpp"

namespace rover {

// Binds the relay's components to the HTTP/WebSocket routes and to the local
// control socket. Holds references only; the runtime owns every component.
class RelayEndpoints {
public:
    RelayEndpoints(
        const AppConfig& config,
        CaptureLoop& capture,
        TelemetrySynthesizer& telemetry,
        ProcessSupervisor& slam,
        TeleopController& teleop);

    void registerRoutes(HttpServer& server);

    // Called for the `shutdown` control command.
    void setShutdownCallback(std::function<void()> callback) { on_shutdown_ = std::move(callback); }

    // Makes open streams return after their current cycle.
    void stopStreams() { streams_stopped_.store(true); }

    HttpResponse handleHealth(const HttpRequest& request);
    HttpResponse handleTeleop(const HttpRequest& request);
    HttpResponse handleSlam(const HttpRequest& request);

    void streamVideo(WebSocketConnection& conn);
    void streamTelemetry(WebSocketConnection& conn);

    // `action` is matched case-insensitively. False for unknown actions.
    bool runSlamAction(const std::string& action, ProcessState& state);

    // One-line control protocol: replies start with "OK" or "ERR".
    std::string handleControlCommand(const std::string& line);

private:
    AppConfig config_;
    CaptureLoop& capture_;
    TelemetrySynthesizer& telemetry_;
    ProcessSupervisor& slam_;
    TeleopController& teleop_;
    std::function<void()> on_shutdown_;
    std::atomic<bool> streams_stopped_{false};
};

}  // namespace rover
