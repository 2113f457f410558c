#include "core/periodic_schedule.hpp"

#include <algorithm>

namespace rover {

PeriodicSchedule::PeriodicSchedule(int64_t period_ns, int64_t start_ns)
    : period_ns_(std::max<int64_t>(1, period_ns)) {
    reset(start_ns);
}

void PeriodicSchedule::reset(int64_t start_ns) {
    deadline_ns_ = start_ns;
    resync_count_ = 0;
}

int64_t PeriodicSchedule::advance(int64_t now_ns) {
    deadline_ns_ += period_ns_;
    if (now_ns - deadline_ns_ > period_ns_) {
        deadline_ns_ = now_ns;
        resync_count_ += 1;
    }
    return deadline_ns_;
}

}  // namespace rover
