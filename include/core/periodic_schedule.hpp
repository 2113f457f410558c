#pragma once

#include <cstdint>

namespace rover {

// Fixed-period tick scheduler on the steady clock. Deadlines advance by one
// period per tick; a loop that falls more than one full period behind is
// realigned to "now" instead of bursting through the missed ticks.
class PeriodicSchedule {
public:
    PeriodicSchedule(int64_t period_ns, int64_t start_ns);

    void reset(int64_t start_ns);
    int64_t periodNs() const { return period_ns_; }
    int64_t deadlineNs() const { return deadline_ns_; }
    uint64_t resyncCount() const { return resync_count_; }

    // Called once the current tick's work is done. Returns the deadline the
    // caller should sleep until before starting the next tick.
    int64_t advance(int64_t now_ns);

private:
    int64_t period_ns_{1};
    int64_t deadline_ns_{0};
    uint64_t resync_count_{0};
};

}  // namespace rover
