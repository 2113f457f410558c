#pragma once

#include <optional>
#include <string>

namespace rover {

// Reads Linux thermal zones laid out as <root>/thermal_zone*/{type,temp},
// with temp in millidegrees Celsius.
class ThermalReader {
public:
    explicit ThermalReader(std::string root);

    // Temperature in °C of the first zone whose type matches, or nullopt when
    // no such zone exists or it cannot be read.
    std::optional<double> readZone(const std::string& zone_type) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

}  // namespace rover
