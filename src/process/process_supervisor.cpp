#include "process/process_supervisor.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/time_utils.hpp"

namespace rover {

const char* processStateName(ProcessState state) {
    switch (state) {
        case ProcessState::Running:
            return "running";
        case ProcessState::Stopped:
            return "stopped";
    }
    return "stopped";
}

ProcessSupervisor::ProcessSupervisor(const SlamConfig& config) : config_(config) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

pid_t ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

pid_t ProcessSupervisor::processGroup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pgid_;
}

void ProcessSupervisor::clearLocked() {
    pid_ = -1;
    pgid_ = -1;
}

bool ProcessSupervisor::aliveLocked() {
    if (pid_ <= 0) {
        return false;
    }
    int wstatus = 0;
    const pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pid_) {
        std::cerr << "slam: process " << pid_ << " exited on its own (status " << wstatus << ")\n";
    }
    // Reaped now, or not our child any more.
    clearLocked();
    return false;
}

ProcessState ProcessSupervisor::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliveLocked() ? ProcessState::Running : ProcessState::Stopped;
}

ProcessState ProcessSupervisor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aliveLocked()) {
        return ProcessState::Running;
    }

    // The CLOEXEC pipe closes on a successful exec; on failure the child
    // writes errno into it. Either way the child has left our process group
    // by the time the parent's read returns.
    int sync_pipe[2] = {-1, -1};
    if (::pipe2(sync_pipe, O_CLOEXEC) != 0) {
        std::cerr << "slam: pipe2 failed: " << std::strerror(errno) << "\n";
        return ProcessState::Stopped;
    }

    const pid_t child = ::fork();
    if (child < 0) {
        std::cerr << "slam: fork failed: " << std::strerror(errno) << "\n";
        ::close(sync_pipe[0]);
        ::close(sync_pipe[1]);
        return ProcessState::Stopped;
    }

    if (child == 0) {
        ::close(sync_pipe[0]);
        ::setsid();
        const int null_fd = ::open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
            ::dup2(null_fd, STDERR_FILENO);
            if (null_fd > STDERR_FILENO) {
                ::close(null_fd);
            }
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execl(config_.shell.c_str(), config_.shell.c_str(), "-lc", config_.command.c_str(), static_cast<char*>(nullptr));
        const int err = errno;
        ssize_t ignored = ::write(sync_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(sync_pipe[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(sync_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(sync_pipe[0]);

    if (n > 0) {
        std::cerr << "slam: failed to exec " << config_.shell << ": " << std::strerror(child_errno) << "\n";
        int wstatus = 0;
        ::waitpid(child, &wstatus, 0);
        return ProcessState::Stopped;
    }

    pid_ = child;
    pgid_ = child;
    std::cerr << "slam: started pid=" << pid_ << " pgid=" << pgid_ << "\n";
    return ProcessState::Running;
}

bool ProcessSupervisor::waitForExitLocked(int timeout_ms) {
    const int64_t deadline_ns = nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    while (true) {
        int wstatus = 0;
        const pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
        if (r == pid_ || (r < 0 && errno == ECHILD)) {
            return true;
        }
        if (nowSteadyNs() >= deadline_ns) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
}

bool ProcessSupervisor::waitForGroupExitLocked(pid_t pgid, int timeout_ms) {
    const int64_t deadline_ns = nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    bool leader_reaped = false;
    while (true) {
        if (!leader_reaped) {
            int wstatus = 0;
            const pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
            leader_reaped = (r == pid_) || (r < 0 && errno == ECHILD);
        }
        if (leader_reaped && ::killpg(pgid, 0) != 0) {
            return true;
        }
        if (nowSteadyNs() >= deadline_ns) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
}

pid_t ProcessSupervisor::lookupProcessGroup(pid_t pid) const {
    return ::getpgid(pid);
}

bool ProcessSupervisor::terminateOnceLocked() {
    const pid_t pgid = lookupProcessGroup(pid_);
    if (pgid < 0 && errno == ESRCH) {
        // Already gone; reap it if it is still our zombie.
        (void)waitForExitLocked(0);
        return true;
    }
    if (pgid < 0 || pgid == ::getpgrp()) {
        std::cerr << "slam: process group of " << pid_ << " unavailable, signalling the process only\n";
        ::kill(pid_, SIGTERM);
        if (waitForExitLocked(config_.stop_timeout_ms)) {
            return true;
        }
        ::kill(pid_, SIGKILL);
        return waitForExitLocked(kKillGraceMs);
    }

    ::killpg(pgid, SIGTERM);
    if (waitForGroupExitLocked(pgid, config_.stop_timeout_ms)) {
        return true;
    }
    std::cerr << "slam: group " << pgid << " still alive " << config_.stop_timeout_ms
              << " ms after SIGTERM, sending SIGKILL\n";
    ::killpg(pgid, SIGKILL);
    return waitForExitLocked(kKillGraceMs);
}

ProcessState ProcessSupervisor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aliveLocked()) {
        clearLocked();
        return ProcessState::Stopped;
    }

    const pid_t tracked = pid_;
    if (!terminateOnceLocked()) {
        std::cerr << "slam: process " << tracked << " still alive after SIGKILL, retrying\n";
        if (!terminateOnceLocked()) {
            std::cerr << "slam: giving up on process " << tracked << ", dropping handle\n";
        }
    }
    std::cerr << "slam: stopped pid=" << tracked << "\n";
    clearLocked();
    return ProcessState::Stopped;
}

}  // namespace rover
