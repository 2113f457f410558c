#include "capture/capture_loop.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "core/periodic_schedule.hpp"
#include "core/time_utils.hpp"

namespace rover {

namespace {

std::chrono::steady_clock::time_point steadyTimePoint(int64_t ns) {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::nanoseconds(ns)));
}

}  // namespace

CaptureLoop::CaptureLoop(Producer producer, int64_t period_ns)
    : producer_(std::move(producer)), period_ns_(std::max<int64_t>(1, period_ns)) {}

CaptureLoop::~CaptureLoop() {
    stop();
}

void CaptureLoop::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    worker_ = std::thread(&CaptureLoop::run, this);
}

void CaptureLoop::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    // Bounded by one producer call: the wait between ticks wakes immediately.
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
}

void CaptureLoop::produceAndPublish() {
    Frame frame;
    {
        std::lock_guard<std::mutex> lock(produce_mutex_);
        frame = producer_();
    }
    std::lock_guard<std::mutex> lock(slot_mutex_);
    latest_ = std::move(frame);
    has_latest_ = true;
}

void CaptureLoop::run() {
    PeriodicSchedule schedule(period_ns_, nowSteadyNs());
    int64_t last_log_ns = nowSteadyNs();
    uint64_t loop_count = 0;

    while (true) {
        {
            std::lock_guard<std::mutex> wake_lock(wake_mutex_);
            if (stop_requested_) {
                break;
            }
        }

        try {
            produceAndPublish();
            frames_produced_.fetch_add(1);
        } catch (const std::exception& e) {
            // A failed cycle degrades output; it never ends the loop.
            std::cerr << "capture: frame production failed: " << e.what() << "\n";
        }
        loop_count++;

        const int64_t now_ns = nowSteadyNs();
        const int64_t deadline_ns = schedule.advance(now_ns);
        resync_count_.store(schedule.resyncCount());

        if (now_ns - last_log_ns >= 1000000000LL) {
            std::cerr << "[capture] loops=" << loop_count
                      << " frames_total=" << frames_produced_.load()
                      << " resyncs=" << schedule.resyncCount()
                      << "\n";
            loop_count = 0;
            last_log_ns = now_ns;
        }

        std::unique_lock<std::mutex> wake_lock(wake_mutex_);
        wake_cv_.wait_until(wake_lock, steadyTimePoint(deadline_ns), [this] { return stop_requested_; });
        if (stop_requested_) {
            break;
        }
    }
}

Frame CaptureLoop::latest() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (has_latest_) {
            return latest_;
        }
    }

    // Cold read: seed the slot from the caller's thread.
    std::lock_guard<std::mutex> produce_lock(produce_mutex_);
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (has_latest_) {
            return latest_;
        }
    }
    Frame frame;
    try {
        frame = producer_();
    } catch (const std::exception& e) {
        std::cerr << "capture: cold-read frame production failed: " << e.what() << "\n";
        frame.timestamp = utcIsoTimestamp();
        frame.image_data_url = "data:image/jpeg;base64,";
        frame.source = FrameSourceKind::Synthetic;
        frame.status = std::string("frame production failed: ") + e.what();
        return frame;
    }
    std::lock_guard<std::mutex> lock(slot_mutex_);
    latest_ = frame;
    has_latest_ = true;
    return frame;
}

}  // namespace rover
