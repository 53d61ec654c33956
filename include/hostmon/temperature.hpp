#pragma once

#include "hostmon/config_manager.hpp"
#include <string>
#include <vector>
#include <variant>
#include <optional>

namespace hostmon {

// Millidegree file such as /sys/class/thermal/thermal_zone0/temp
struct ThermalZoneSource {
    std::string path;
};

// lm-sensors style utility printing "Label: +45.0°C" lines
struct SensorsSource {
    std::string command = "sensors";
};

using TemperatureSource = std::variant<ThermalZoneSource, SensorsSource>;

std::optional<int> read_temperature(const ThermalZoneSource& source);
std::optional<int> read_temperature(const SensorsSource& source);

// First source yielding a reading wins; never throws
std::optional<int> resolve_temperature(const std::vector<TemperatureSource>& chain);

std::vector<TemperatureSource> default_temperature_chain(const SourceConfig& sources);

std::optional<int> parse_thermal_zone(const std::string& text);
std::optional<int> parse_sensors_output(const std::string& output);

// "52°C", or "N/A°C" when unavailable
std::string format_temperature(const std::optional<int>& celsius);

} // namespace hostmon
