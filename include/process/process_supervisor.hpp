#pragma once

#include <mutex>
#include <string>

#include <sys/types.h>

#include "core/config.hpp"

namespace rover {

enum class ProcessState {
    Running = 0,
    Stopped = 1,
};

const char* processStateName(ProcessState state);

// Owns at most one long-running external process tree. The child runs
// `<shell> -lc <command>` in its own session/process group with stdio bound
// to /dev/null, so stop() can signal the whole tree at once. All three
// operations serialize on one mutex.
//
// When the leader exits on its own, the handle is dropped and nothing is
// signalled: status() and start() never kill, so descendants the leader left
// behind keep running until something else stops them.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const SlamConfig& config);
    virtual ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    ProcessState start();
    // SIGTERM to the group, bounded wait, then SIGKILL; retried once. The
    // tracked handle is always cleared.
    ProcessState stop();
    ProcessState status();

    // -1 when nothing is tracked.
    pid_t pid() const;
    pid_t processGroup() const;

protected:
    // getpgid(2). If this fails with anything but ESRCH, or names our own
    // group, stop() signals the tracked pid alone.
    virtual pid_t lookupProcessGroup(pid_t pid) const;

private:
    bool aliveLocked();
    bool terminateOnceLocked();
    bool waitForExitLocked(int timeout_ms);
    bool waitForGroupExitLocked(pid_t pgid, int timeout_ms);
    void clearLocked();

    static constexpr int kKillGraceMs = 1000;
    static constexpr int kPollIntervalMs = 20;

    SlamConfig config_;
    mutable std::mutex mutex_;
    pid_t pid_{-1};
    pid_t pgid_{-1};
};

}  // namespace rover
