#include "telemetry/thermal_reader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace rover {

namespace fs = std::filesystem;

namespace {

bool readFirstLine(const fs::path& path, std::string& out) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return false;
    }
    if (!std::getline(ifs, out)) {
        return false;
    }
    const auto e = out.find_last_not_of(" \t\r\n");
    out = (e == std::string::npos) ? std::string() : out.substr(0, e + 1);
    return true;
}

}  // namespace

ThermalReader::ThermalReader(std::string root) : root_(std::move(root)) {}

std::optional<double> ThermalReader::readZone(const std::string& zone_type) const {
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return std::nullopt;
    }

    std::vector<fs::path> zones;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (name.rfind("thermal_zone", 0) == 0) {
            zones.push_back(it->path());
        }
    }
    std::sort(zones.begin(), zones.end());

    for (const auto& zone : zones) {
        std::string type;
        if (!readFirstLine(zone / "type", type) || type != zone_type) {
            continue;
        }
        std::string raw;
        if (!readFirstLine(zone / "temp", raw)) {
            continue;
        }
        try {
            std::size_t used = 0;
            const double milli_c = std::stod(raw, &used);
            if (used == 0) {
                continue;
            }
            return milli_c / 1000.0;
        } catch (const std::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

}  // namespace rover
