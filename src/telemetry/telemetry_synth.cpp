#include "telemetry/telemetry_synth.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include "core/time_utils.hpp"

namespace rover {

namespace {

constexpr int kEncoderJitter = 2;
constexpr double kVoltageJitter = 0.05;
constexpr double kSocJitter = 0.2;

// Pack-level motor model: 24 V bus, output power from torque (oz·in) and rpm.
constexpr double kBusVoltage = 24.0;
constexpr double kOzInRpmToWatts = 0.00074;

}  // namespace

TelemetryCurves telemetryCurves(double t) {
    TelemetryCurves c;
    c.front_left = 120.0 + 5.0 * std::sin(t / 5.0);
    c.front_right = 118.0 + 4.0 * std::cos(t / 4.0);
    c.rear_left = 115.0 + 3.0 * std::sin(t / 6.0);
    c.rear_right = 117.0 + 4.0 * std::cos(t / 7.0);
    c.cpu_temp_c = 60.0 + 3.0 * std::sin(t / 12.0);
    c.gpu_temp_c = 58.0 + 2.5 * std::cos(t / 10.0);
    c.voltage_v = 24.5 - 0.002 * t;
    c.soc_pct = std::max(0.0, 85.0 - 0.02 * t);
    c.torque_oz_in = 10.0 + 3.0 * std::sin(t / 9.0);
    c.speed_rpm = 260.0 + 20.0 * std::cos(t / 8.0);
    c.current_ma = 250.0 + 40.0 * std::sin(t / 6.0);
    return c;
}

double motorEfficiency(double output_power_w, double input_power_w) {
    if (!(input_power_w > 0.0)) {
        return 0.0;
    }
    return std::clamp(output_power_w / input_power_w, 0.0, 1.0);
}

TelemetrySample synthesizeTelemetry(
    uint64_t tick,
    const std::optional<double>& cpu_temp_measured,
    const std::optional<double>& gpu_temp_measured,
    const TelemetryJitter& jitter,
    const std::string& timestamp) {
    const TelemetryCurves c = telemetryCurves(static_cast<double>(tick));

    int j_fl = 0;
    int j_fr = 0;
    int j_rl = 0;
    int j_rr = 0;
    double j_voltage = 0.0;
    double j_soc = 0.0;
    if (jitter.enabled) {
        std::mt19937_64 rng(jitter.seed ^ (tick * 0x9E3779B97F4A7C15ULL));
        std::uniform_int_distribution<int> enc(-kEncoderJitter, kEncoderJitter);
        std::uniform_real_distribution<double> volt(-kVoltageJitter, kVoltageJitter);
        std::uniform_real_distribution<double> soc(-kSocJitter, kSocJitter);
        j_fl = enc(rng);
        j_fr = enc(rng);
        j_rl = enc(rng);
        j_rr = enc(rng);
        j_voltage = volt(rng);
        j_soc = soc(rng);
    }

    TelemetrySample s;
    s.timestamp = timestamp;
    s.encoders.front_left = static_cast<int>(std::lround(c.front_left)) + j_fl;
    s.encoders.front_right = static_cast<int>(std::lround(c.front_right)) + j_fr;
    s.encoders.rear_left = static_cast<int>(std::lround(c.rear_left)) + j_rl;
    s.encoders.rear_right = static_cast<int>(std::lround(c.rear_right)) + j_rr;

    s.thermal.cpu_temp_c = cpu_temp_measured ? *cpu_temp_measured : c.cpu_temp_c;
    s.thermal.gpu_temp_c = gpu_temp_measured ? *gpu_temp_measured : c.gpu_temp_c;

    s.power.voltage_v = c.voltage_v + j_voltage;
    s.power.soc_pct = std::max(0.0, 85.0 - 0.02 * static_cast<double>(tick) + j_soc);

    s.motor.torque_oz_in = c.torque_oz_in;
    s.motor.speed_rpm = c.speed_rpm;
    s.motor.current_ma = c.current_ma;
    s.motor.output_power_w = kOzInRpmToWatts * c.torque_oz_in * c.speed_rpm;
    s.motor.input_power_w = (c.current_ma / 1000.0) * kBusVoltage;
    s.motor.efficiency = motorEfficiency(s.motor.output_power_w, s.motor.input_power_w);
    return s;
}

TelemetrySynthesizer::TelemetrySynthesizer(const TelemetryConfig& config)
    : config_(config), thermal_(config.thermal_root) {
    jitter_.enabled = config_.jitter_enabled;
    if (config_.jitter_seed != 0) {
        jitter_.seed = static_cast<uint64_t>(config_.jitter_seed);
    } else {
        std::random_device rd;
        jitter_.seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }
}

TelemetrySample TelemetrySynthesizer::sample(uint64_t tick) const {
    return synthesizeTelemetry(
        tick,
        thermal_.readZone(config_.cpu_zone),
        thermal_.readZone(config_.gpu_zone),
        jitter_,
        utcIsoTimestamp());
}

}  // namespace rover
