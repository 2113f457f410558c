#include "app/relay_runtime.hpp"

#include <exception>
#include <functional>
#include <iostream>

#include "camera/camera_ingest.hpp"
#include "camera/synthetic_source.hpp"
#include "codec/frame_encoder.hpp"
#include "teleop/motion_sink.hpp"

namespace rover {

namespace {

EncodeOptions encodeOptionsFor(const StreamConfig& stream) {
    EncodeOptions opts;
    if (!parseImageFormat(stream.format, opts.format)) {
        std::cerr << "runtime: unknown stream.format '" << stream.format << "', using jpeg\n";
        opts.format = ImageFormat::Jpeg;
    }
    opts.quality = stream.quality;
    opts.max_width = stream.max_width;
    return opts;
}

void runShutdownStep(const char* name, const std::function<void()>& step) {
    try {
        step();
    } catch (const std::exception& e) {
        std::cerr << "runtime: shutdown step '" << name << "' failed: " << e.what() << "\n";
    }
}

}  // namespace

RelayRuntime::RelayRuntime(const AppConfig& config, const Capabilities& caps)
    : config_(config), caps_(caps), slam_(config.slam), telemetry_(config.telemetry) {
    const EncodeOptions encode = encodeOptionsFor(config_.stream);
    const double nominal_fps = 1000.0 / config_.stream.frame_interval_ms;

    std::unique_ptr<FrameSource> hardware;
    if (caps_.camera_backend) {
        hardware = std::make_unique<CameraIngest>(config_.camera, encode);
    }
    producer_ = std::make_unique<FrameProducer>(
        std::move(hardware), std::make_unique<SyntheticFrameSource>(encode, nominal_fps));

    const auto period_ns = static_cast<int64_t>(config_.stream.frame_interval_ms * 1e6);
    FrameProducer* producer = producer_.get();
    capture_ = std::make_unique<CaptureLoop>([producer]() { return producer->produce(); }, period_ns);

    std::unique_ptr<MotionSink> sink;
    if (caps_.motion_bridge) {
        sink = std::make_unique<UnixSocketMotionSink>(config_.teleop.bridge_socket);
    }
    teleop_ = std::make_unique<TeleopController>(config_.teleop, std::move(sink));

    endpoints_ = std::make_unique<RelayEndpoints>(config_, *capture_, telemetry_, slam_, *teleop_);
    endpoints_->setShutdownCallback([this]() { shutdown_requested_.store(true); });
    endpoints_->registerRoutes(http_);
}

RelayRuntime::~RelayRuntime() {
    shutdown();
}

bool RelayRuntime::start(std::string& error) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        return true;
    }
    if (shut_down_) {
        error = "runtime already shut down";
        return false;
    }

    capture_->start();

    if (!http_.start(static_cast<uint16_t>(config_.server.port), error)) {
        error = "HTTP listener: " + error;
        return false;
    }

    if (!config_.server.control_socket.empty()) {
        std::string control_error;
        RelayEndpoints* endpoints = endpoints_.get();
        if (!control_.start(
                config_.server.control_socket,
                [endpoints](const std::string& line) { return endpoints->handleControlCommand(line); },
                control_error)) {
            // The HTTP surface still works without the local socket.
            std::cerr << "runtime: control socket disabled: " << control_error << "\n";
        }
    }

    started_ = true;
    std::cerr << "runtime: listening on port " << http_.boundPort()
              << " (frame interval " << config_.stream.frame_interval_ms << " ms, camera backend "
              << (caps_.camera_backend ? "present" : "absent") << ")\n";
    return true;
}

void RelayRuntime::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    std::cerr << "runtime: shutting down\n";

    runShutdownStep("http", [this]() {
        endpoints_->stopStreams();
        http_.stop();
    });
    runShutdownStep("capture", [this]() { capture_->stop(); });
    runShutdownStep("camera", [this]() { producer_->close(); });
    runShutdownStep("slam", [this]() { slam_.stop(); });
    runShutdownStep("motion-bridge", [this]() { teleop_->releaseSink(); });
    runShutdownStep("control", [this]() { control_.stop(); });

    started_ = false;
    std::cerr << "runtime: shutdown complete\n";
}

}  // namespace rover
