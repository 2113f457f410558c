#pragma once

#include <cstdint>
#include <string>

namespace rover {

int64_t nowSteadyNs();

// UTC wall-clock time as ISO-8601 with microseconds and a trailing 'Z',
// e.g. "2024-05-01T12:34:56.123456Z".
std::string utcIsoTimestamp();

// Sleeps until the steady-clock deadline; returns immediately if it already passed.
void sleepUntilSteadyNs(int64_t deadline_ns);

}  // namespace rover
