#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/types.hpp"
#include "telemetry/thermal_reader.hpp"

namespace rover {

struct TelemetryJitter {
    bool enabled{true};
    uint64_t seed{0};
};

// Jitter-free curves at tick `t`; continuous in t.
struct TelemetryCurves {
    double front_left{0.0};
    double front_right{0.0};
    double rear_left{0.0};
    double rear_right{0.0};
    double cpu_temp_c{0.0};
    double gpu_temp_c{0.0};
    double voltage_v{0.0};
    double soc_pct{0.0};
    double torque_oz_in{0.0};
    double speed_rpm{0.0};
    double current_ma{0.0};
};

TelemetryCurves telemetryCurves(double t);

// clamp(output / input, 0, 1); zero (or negative) input power yields 0.
double motorEfficiency(double output_power_w, double input_power_w);

// Pure function of its arguments. Measured temperatures replace the
// sinusoidal fallback when present. Jitter is drawn from a generator seeded
// with (seed, tick), so equal inputs give equal samples.
TelemetrySample synthesizeTelemetry(
    uint64_t tick,
    const std::optional<double>& cpu_temp_measured,
    const std::optional<double>& gpu_temp_measured,
    const TelemetryJitter& jitter,
    const std::string& timestamp);

// Binds the pure synthesizer to the configured thermal zones and jitter.
class TelemetrySynthesizer {
public:
    explicit TelemetrySynthesizer(const TelemetryConfig& config);

    TelemetrySample sample(uint64_t tick) const;

    const TelemetryJitter& jitter() const { return jitter_; }

private:
    TelemetryConfig config_;
    ThermalReader thermal_;
    TelemetryJitter jitter_;
};

}  // namespace rover
