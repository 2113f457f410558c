#include "core/time_utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <thread>

namespace rover {

int64_t nowSteadyNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

std::string utcIsoTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto us_total = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    const std::time_t secs = static_cast<std::time_t>(us_total / 1000000LL);
    const long long micros = us_total % 1000000LL;

    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    char buf[40];
    std::snprintf(
        buf,
        sizeof(buf),
        "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
        tm_utc.tm_year + 1900,
        tm_utc.tm_mon + 1,
        tm_utc.tm_mday,
        tm_utc.tm_hour,
        tm_utc.tm_min,
        tm_utc.tm_sec,
        micros);
    return std::string(buf);
}

void sleepUntilSteadyNs(int64_t deadline_ns) {
    const int64_t remaining = deadline_ns - nowSteadyNs();
    if (remaining > 0) {
        std::this_thread::sleep_for(std::chrono::nanoseconds(remaining));
    }
}

}  // namespace rover
