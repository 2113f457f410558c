#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "core/types.hpp"

namespace rover {

// Background task that produces one frame per period and publishes it to a
// single latest-frame slot. The producer is only ever invoked under
// produce_mutex_, so the device behind it never sees concurrent calls.
class CaptureLoop {
public:
    using Producer = std::function<Frame()>;

    CaptureLoop(Producer producer, int64_t period_ns);
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    // No-op when already running.
    void start();
    // Returns once the worker has exited; no frame is produced afterwards.
    void stop();
    bool isRunning() const { return running_.load(); }

    // Copy of the latest frame. Produces one synchronously when the loop has
    // not published anything yet.
    Frame latest();

    int64_t periodNs() const { return period_ns_; }
    uint64_t framesProduced() const { return frames_produced_.load(); }
    uint64_t resyncCount() const { return resync_count_.load(); }

private:
    void run();
    void produceAndPublish();

    Producer producer_;
    int64_t period_ns_{1};

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex lifecycle_mutex_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_{false};

    std::mutex produce_mutex_;
    std::mutex slot_mutex_;
    Frame latest_;
    bool has_latest_{false};

    std::atomic<uint64_t> frames_produced_{0};
    std::atomic<uint64_t> resync_count_{0};
};

}  // namespace rover
