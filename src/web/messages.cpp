#include "web/messages.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace rover {

namespace {

// Fixed decimals with trailing zeros stripped, e.g. 24.50 -> 24.5.
std::string roundedNumber(double v, int decimals) {
    if (!std::isfinite(v)) {
        return "0";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << v;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

}  // namespace

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8U);
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20U) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

std::string frameToJson(const Frame& frame) {
    std::string out;
    out.reserve(frame.image_data_url.size() + 256U);
    out += "{\"timestamp\":\"" + jsonEscape(frame.timestamp) + "\"";
    out += ",\"rgb\":\"" + jsonEscape(frame.image_data_url) + "\"";
    out += ",\"depth\":\"\"";
    out += ",\"source\":\"";
    out += frameSourceName(frame.source);
    out += "\",\"status\":\"" + jsonEscape(frame.status) + "\"";
    out += ",\"profile\":\"" + jsonEscape(frame.profile) + "\"}";
    return out;
}

std::string telemetryToJson(const TelemetrySample& sample) {
    std::ostringstream oss;
    oss << "{\"timestamp\":\"" << jsonEscape(sample.timestamp) << "\""
        << ",\"encoders\":{\"frontLeft\":" << sample.encoders.front_left
        << ",\"frontRight\":" << sample.encoders.front_right
        << ",\"rearLeft\":" << sample.encoders.rear_left
        << ",\"rearRight\":" << sample.encoders.rear_right << "}"
        << ",\"jetson\":{\"cpuTemp\":" << roundedNumber(sample.thermal.cpu_temp_c, 1)
        << ",\"gpuTemp\":" << roundedNumber(sample.thermal.gpu_temp_c, 1) << "}"
        << ",\"power\":{\"voltage\":" << roundedNumber(sample.power.voltage_v, 2)
        << ",\"soc\":" << roundedNumber(sample.power.soc_pct, 1) << "}"
        << ",\"motor\":{\"torqueOzIn\":" << roundedNumber(sample.motor.torque_oz_in, 2)
        << ",\"speedRpm\":" << roundedNumber(sample.motor.speed_rpm, 1)
        << ",\"currentMa\":" << roundedNumber(sample.motor.current_ma, 1)
        << ",\"outputPowerW\":" << roundedNumber(sample.motor.output_power_w, 3)
        << ",\"inputPowerW\":" << roundedNumber(sample.motor.input_power_w, 3)
        << ",\"efficiency\":" << roundedNumber(sample.motor.efficiency * 100.0, 2) << "}}";
    return oss.str();
}

bool extractJsonStringField(const std::string& body, const std::string& key, std::string& out) {
    const nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

std::string okReplyJson() {
    return "{\"status\":\"ok\"}";
}

std::string errorReplyJson(const std::string& detail) {
    return "{\"status\":\"error\",\"detail\":\"" + jsonEscape(detail) + "\"}";
}

std::string stateReplyJson(const std::string& state) {
    return "{\"status\":\"ok\",\"state\":\"" + jsonEscape(state) + "\"}";
}

}  // namespace rover
