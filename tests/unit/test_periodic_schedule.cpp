#include "core/periodic_schedule.hpp"
#include "core/time_utils.hpp"

#include <iostream>

int main() {
    rover::PeriodicSchedule s(10, 0);

    if (s.advance(5) != 10 || s.advance(12) != 20) {
        std::cerr << "on-time ticks should advance by exactly one period\n";
        return 1;
    }
    if (s.resyncCount() != 0U) {
        std::cerr << "no resync expected yet\n";
        return 1;
    }

    // 35 ns behind the next deadline: realign to now instead of bursting.
    if (s.advance(55) != 55 || s.resyncCount() != 1U) {
        std::cerr << "lag beyond one period should resync to now\n";
        return 1;
    }
    if (s.advance(56) != 65) {
        std::cerr << "cadence should continue from the resynced deadline\n";
        return 1;
    }

    // Exactly one period late: catch up without resync (no sleep, no burst).
    if (s.advance(85) != 75 || s.resyncCount() != 1U) {
        std::cerr << "lag of one period should not resync\n";
        return 1;
    }

    s.reset(1000);
    if (s.deadlineNs() != 1000 || s.resyncCount() != 0U || s.advance(1000) != 1010) {
        std::cerr << "reset should restart the schedule\n";
        return 1;
    }

    rover::PeriodicSchedule degenerate(0, 0);
    if (degenerate.periodNs() != 1) {
        std::cerr << "non-positive period should clamp to 1 ns\n";
        return 1;
    }

    const int64_t t0 = rover::nowSteadyNs();
    rover::sleepUntilSteadyNs(t0 + 5000000);
    if (rover::nowSteadyNs() - t0 < 5000000) {
        std::cerr << "sleepUntilSteadyNs returned early\n";
        return 1;
    }
    const std::string ts = rover::utcIsoTimestamp();
    if (ts.size() != 27U || ts[10] != 'T' || ts[19] != '.' || ts.back() != 'Z') {
        std::cerr << "unexpected timestamp format: " << ts << "\n";
        return 1;
    }
    return 0;
}
