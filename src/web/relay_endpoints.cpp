#include "web/relay_endpoints.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

#include "core/periodic_schedule.hpp"
#include "core/time_utils.hpp"
#include "web/messages.hpp"

namespace rover {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HttpResponse jsonResponse(const std::string& body, int status = 200) {
    HttpResponse r;
    r.status = status;
    r.body = body;
    return r;
}

}  // namespace

RelayEndpoints::RelayEndpoints(
    const AppConfig& config,
    CaptureLoop& capture,
    TelemetrySynthesizer& telemetry,
    ProcessSupervisor& slam,
    TeleopController& teleop)
    : config_(config), capture_(capture), telemetry_(telemetry), slam_(slam), teleop_(teleop) {}

void RelayEndpoints::registerRoutes(HttpServer& server) {
    server.addRoute("GET", "/health", [this](const HttpRequest& r) { return handleHealth(r); });
    server.addRoute("POST", "/teleop", [this](const HttpRequest& r) { return handleTeleop(r); });
    server.addRoute("POST", "/slam", [this](const HttpRequest& r) { return handleSlam(r); });
    server.addWebSocketRoute("/ws/zed", [this](WebSocketConnection& c) { streamVideo(c); });
    server.addWebSocketRoute("/ws/telemetry", [this](WebSocketConnection& c) { streamTelemetry(c); });
}

HttpResponse RelayEndpoints::handleHealth(const HttpRequest&) {
    return jsonResponse(okReplyJson());
}

HttpResponse RelayEndpoints::handleTeleop(const HttpRequest& request) {
    std::string direction;
    if (!extractJsonStringField(request.body, "direction", direction)) {
        return jsonResponse(errorReplyJson("Request body must be a JSON object with a string 'direction'"), 400);
    }
    const TeleopResult result = teleop_.handle(direction);
    if (!result.ok) {
        return jsonResponse(errorReplyJson(result.detail));
    }
    return jsonResponse(okReplyJson());
}

bool RelayEndpoints::runSlamAction(const std::string& action, ProcessState& state) {
    const std::string a = toLower(action);
    if (a == "start") {
        state = slam_.start();
    } else if (a == "stop") {
        state = slam_.stop();
    } else if (a == "status") {
        state = slam_.status();
    } else {
        return false;
    }
    return true;
}

HttpResponse RelayEndpoints::handleSlam(const HttpRequest& request) {
    std::string action;
    if (!extractJsonStringField(request.body, "action", action)) {
        return jsonResponse(errorReplyJson("Request body must be a JSON object with a string 'action'"), 400);
    }
    ProcessState state = ProcessState::Stopped;
    if (!runSlamAction(action, state)) {
        return jsonResponse(errorReplyJson("Invalid action"));
    }
    return jsonResponse(stateReplyJson(processStateName(state)));
}

void RelayEndpoints::streamVideo(WebSocketConnection& conn) {
    PeriodicSchedule schedule(capture_.periodNs(), nowSteadyNs());
    uint64_t sent = 0;
    while (conn.isOpen() && !streams_stopped_.load()) {
        if (!conn.sendText(frameToJson(capture_.latest()))) {
            break;
        }
        sent++;
        if (!conn.serviceUntil(schedule.advance(nowSteadyNs()))) {
            break;
        }
    }
    std::cerr << "web: video client left after " << sent << " frames\n";
}

void RelayEndpoints::streamTelemetry(WebSocketConnection& conn) {
    const int64_t period_ns = static_cast<int64_t>(config_.telemetry.interval_ms) * 1000000LL;
    PeriodicSchedule schedule(period_ns, nowSteadyNs());
    uint64_t tick = 0;
    while (conn.isOpen() && !streams_stopped_.load()) {
        if (!conn.sendText(telemetryToJson(telemetry_.sample(tick)))) {
            break;
        }
        tick++;
        if (!conn.serviceUntil(schedule.advance(nowSteadyNs()))) {
            break;
        }
    }
    std::cerr << "web: telemetry client left after " << tick << " samples\n";
}

std::string RelayEndpoints::handleControlCommand(const std::string& line) {
    std::istringstream is(line);
    std::string cmd;
    std::string arg;
    is >> cmd >> arg;
    std::string extra;
    if (is >> extra) {
        return "ERR too many arguments";
    }
    cmd = toLower(cmd);

    if (cmd == "health") {
        const Frame frame = capture_.latest();
        std::ostringstream oss;
        oss << "OK camera=" << frameSourceName(frame.source)
            << " slam=" << processStateName(slam_.status())
            << " bridge=" << (teleop_.bridgeAvailable() ? "yes" : "no")
            << " frames=" << capture_.framesProduced();
        return oss.str();
    }
    if (cmd == "slam") {
        ProcessState state = ProcessState::Stopped;
        if (!runSlamAction(arg, state)) {
            return "ERR invalid action";
        }
        return std::string("OK ") + processStateName(state);
    }
    if (cmd == "teleop") {
        const TeleopResult result = teleop_.handle(arg);
        return result.ok ? "OK" : "ERR " + result.detail;
    }
    if (cmd == "shutdown") {
        if (on_shutdown_) {
            on_shutdown_();
        }
        return "OK shutting down";
    }
    return "ERR unknown command";
}

}  // namespace rover
