#include "process/process_supervisor.hpp"
#include "core/time_utils.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

// Live (non-zombie) processes in the given process group.
int liveMembers(pid_t pgid) {
    int count = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        std::ifstream ifs(entry.path() / "stat");
        std::string stat;
        if (!std::getline(ifs, stat)) {
            continue;
        }
        const auto close_paren = stat.rfind(')');
        if (close_paren == std::string::npos) {
            continue;
        }
        std::istringstream rest(stat.substr(close_paren + 1));
        char state = '\0';
        long ppid = 0;
        long pgrp = 0;
        if (!(rest >> state >> ppid >> pgrp)) {
            continue;
        }
        if (pgrp == pgid && state != 'Z' && state != 'X') {
            count++;
        }
    }
    return count;
}

bool waitForMembers(pid_t pgid, int expected_at_least, int timeout_ms) {
    const int64_t deadline = rover::nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    while (rover::nowSteadyNs() < deadline) {
        if (liveMembers(pgid) >= expected_at_least) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

bool waitForNoMembers(pid_t pgid, int timeout_ms) {
    const int64_t deadline = rover::nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    while (liveMembers(pgid) != 0) {
        if (rover::nowSteadyNs() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// Reports the process group as unresolvable, as getpgid does on EPERM.
class NoGroupSupervisor : public rover::ProcessSupervisor {
public:
    using rover::ProcessSupervisor::ProcessSupervisor;

protected:
    pid_t lookupProcessGroup(pid_t) const override {
        errno = EPERM;
        return -1;
    }
};

}  // namespace

int main() {
    rover::SlamConfig cfg;
    cfg.shell = "/bin/sh";
    cfg.command = "sleep 30 & sleep 30 & wait";
    cfg.stop_timeout_ms = 2000;

    rover::ProcessSupervisor sup(cfg);
    if (sup.status() != rover::ProcessState::Stopped || sup.pid() != -1) {
        std::cerr << "fresh supervisor should be stopped\n";
        return 1;
    }
    if (sup.stop() != rover::ProcessState::Stopped) {
        std::cerr << "stop with nothing running should report stopped\n";
        return 1;
    }

    if (sup.start() != rover::ProcessState::Running) {
        std::cerr << "start should report running\n";
        return 1;
    }
    const pid_t first_pid = sup.pid();
    const pid_t pgid = sup.processGroup();
    if (first_pid <= 0 || pgid != first_pid) {
        std::cerr << "child should lead its own process group\n";
        return 1;
    }
    if (sup.start() != rover::ProcessState::Running || sup.pid() != first_pid) {
        std::cerr << "second start must not spawn another process\n";
        return 1;
    }
    if (!waitForMembers(pgid, 3, 2000)) {
        std::cerr << "expected the shell and both sleeps in the group\n";
        return 1;
    }

    if (sup.stop() != rover::ProcessState::Stopped || sup.pid() != -1) {
        std::cerr << "stop should report stopped and clear the handle\n";
        return 1;
    }
    if (!waitForNoMembers(pgid, 1000)) {
        std::cerr << "stop must take down the whole process tree\n";
        return 1;
    }
    if (sup.status() != rover::ProcessState::Stopped) {
        std::cerr << "status after stop should be stopped\n";
        return 1;
    }

    // A tree that ignores SIGTERM is force-killed after the grace period.
    rover::SlamConfig stubborn_cfg;
    stubborn_cfg.shell = "/bin/sh";
    stubborn_cfg.command = "trap '' TERM; sleep 30 & sleep 30 & wait; wait";
    stubborn_cfg.stop_timeout_ms = 300;
    rover::ProcessSupervisor stubborn(stubborn_cfg);
    if (stubborn.start() != rover::ProcessState::Running) {
        std::cerr << "stubborn start failed\n";
        return 1;
    }
    const pid_t stubborn_pgid = stubborn.processGroup();
    if (!waitForMembers(stubborn_pgid, 3, 2000)) {
        std::cerr << "stubborn tree did not come up\n";
        return 1;
    }
    const int64_t t1 = rover::nowSteadyNs();
    if (stubborn.stop() != rover::ProcessState::Stopped) {
        std::cerr << "stubborn stop should still report stopped\n";
        return 1;
    }
    const int64_t elapsed_ms = (rover::nowSteadyNs() - t1) / 1000000LL;
    if (elapsed_ms < 250 || elapsed_ms > 5000) {
        std::cerr << "escalation should follow the graceful timeout, took " << elapsed_ms << " ms\n";
        return 1;
    }
    if (!waitForNoMembers(stubborn_pgid, 1000)) {
        std::cerr << "SIGKILL escalation must reach every group member\n";
        return 1;
    }

    // A process that exits on its own is noticed by status().
    rover::SlamConfig quick_cfg;
    quick_cfg.shell = "/bin/sh";
    quick_cfg.command = "exit 0";
    rover::ProcessSupervisor quick(quick_cfg);
    if (quick.start() != rover::ProcessState::Running) {
        std::cerr << "quick start failed\n";
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (quick.status() != rover::ProcessState::Stopped || quick.pid() != -1) {
        std::cerr << "self-exited process should read as stopped\n";
        return 1;
    }
    if (quick.start() != rover::ProcessState::Running) {
        std::cerr << "restart after self-exit should spawn again\n";
        return 1;
    }
    quick.stop();

    // Without a usable process group only the tracked pid is signalled; the
    // shell goes away and its background child is left in the group.
    rover::SlamConfig lone_cfg;
    lone_cfg.shell = "/bin/sh";
    lone_cfg.command = "sleep 30 & wait";
    lone_cfg.stop_timeout_ms = 1000;
    NoGroupSupervisor lone(lone_cfg);
    if (lone.start() != rover::ProcessState::Running) {
        std::cerr << "lone start failed\n";
        return 1;
    }
    const pid_t lone_pgid = lone.processGroup();
    if (!waitForMembers(lone_pgid, 2, 2000)) {
        std::cerr << "lone tree did not come up\n";
        return 1;
    }
    if (lone.stop() != rover::ProcessState::Stopped || lone.pid() != -1) {
        std::cerr << "stop without a process group should still clear the handle\n";
        return 1;
    }
    if (liveMembers(lone_pgid) != 1) {
        std::cerr << "only the tracked pid should be signalled, live members: " << liveMembers(lone_pgid) << "\n";
        return 1;
    }
    ::killpg(lone_pgid, SIGKILL);
    if (!waitForNoMembers(lone_pgid, 1000)) {
        std::cerr << "leftover child did not die\n";
        return 1;
    }

    // A leader that exits by itself is dropped without touching the group.
    rover::SlamConfig orphan_cfg;
    orphan_cfg.shell = "/bin/sh";
    orphan_cfg.command = "sleep 30 & exit 0";
    rover::ProcessSupervisor orphan(orphan_cfg);
    if (orphan.start() != rover::ProcessState::Running) {
        std::cerr << "orphan start failed\n";
        return 1;
    }
    const pid_t orphan_pgid = orphan.processGroup();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (orphan.status() != rover::ProcessState::Stopped || orphan.stop() != rover::ProcessState::Stopped) {
        std::cerr << "self-exited leader should read as stopped\n";
        return 1;
    }
    if (liveMembers(orphan_pgid) != 1) {
        std::cerr << "status and stop must not signal a self-exited leader's group\n";
        return 1;
    }
    ::killpg(orphan_pgid, SIGKILL);
    if (!waitForNoMembers(orphan_pgid, 1000)) {
        std::cerr << "orphaned child did not die\n";
        return 1;
    }

    rover::SlamConfig broken_cfg;
    broken_cfg.shell = "/nonexistent/shell";
    broken_cfg.command = "true";
    rover::ProcessSupervisor broken(broken_cfg);
    if (broken.start() != rover::ProcessState::Stopped || broken.pid() != -1) {
        std::cerr << "exec failure should leave the supervisor stopped\n";
        return 1;
    }
    return 0;
}
