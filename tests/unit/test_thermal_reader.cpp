#include "telemetry/thermal_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

void writeZone(const fs::path& root, const std::string& name, const std::string& type, const std::string& temp) {
    fs::create_directories(root / name);
    std::ofstream(root / name / "type") << type << "\n";
    if (!temp.empty()) {
        std::ofstream(root / name / "temp") << temp << "\n";
    }
}

}  // namespace

int main() {
    const fs::path root = fs::temp_directory_path() / ("rover_thermal_" + std::to_string(static_cast<long long>(::getpid())));
    fs::remove_all(root);
    writeZone(root, "thermal_zone0", "cpu-thermal", "48500");
    writeZone(root, "thermal_zone1", "gpu-thermal", "garbage");
    writeZone(root, "thermal_zone2", "gpu-thermal", "45250");
    writeZone(root, "thermal_zone3", "soc-thermal", "");
    writeZone(root, "cooling_device0", "cpu-thermal", "99000");

    int rc = 0;
    const rover::ThermalReader reader(root.string());
    const auto cpu = reader.readZone("cpu-thermal");
    if (!cpu || *cpu != 48.5) {
        std::cerr << "cpu zone should read 48.5 C\n";
        rc = 1;
    }
    const auto gpu = reader.readZone("gpu-thermal");
    if (!gpu || *gpu != 45.25) {
        std::cerr << "unparsable zone should be skipped in favour of the next match\n";
        rc = 1;
    }
    if (reader.readZone("soc-thermal") || reader.readZone("board-thermal")) {
        std::cerr << "zones without a reading or without a match should be absent\n";
        rc = 1;
    }
    const rover::ThermalReader missing((root / "nope").string());
    if (missing.readZone("cpu-thermal")) {
        std::cerr << "missing root should yield no reading\n";
        rc = 1;
    }

    fs::remove_all(root);
    return rc;
}
