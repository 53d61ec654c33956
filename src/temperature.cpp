#include "hostmon/temperature.hpp"
#include "hostmon/command_runner.hpp"
#include "hostmon/metrics_collector.hpp"
#include <fstream>
#include <sstream>

namespace hostmon {

std::optional<int> parse_thermal_zone(const std::string& text) {
    std::string value = trim(text);
    if (!is_numeric(value) || value.size() > 12) {
        return std::nullopt;
    }
    return static_cast<int>(std::stoll(value) / 1000);
}

static void erase_all(std::string& text, const std::string& token) {
    size_t pos;
    while ((pos = text.find(token)) != std::string::npos) {
        text.erase(pos, token.size());
    }
}

std::optional<int> parse_sensors_output(const std::string& output) {
    std::istringstream in(output);
    std::string line;

    while (std::getline(in, line)) {
        bool labelled = line.rfind("Core", 0) == 0 ||
                        line.find("CPU Temp") != std::string::npos ||
                        line.find("Package") != std::string::npos;
        if (!labelled) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::istringstream fields(line.substr(colon + 1));
        std::string reading;
        fields >> reading;

        for (const char* decoration : {"+", "°C", "(", ")"}) {
            erase_all(reading, decoration);
        }
        if (!is_decimal(reading)) continue;

        int celsius = static_cast<int>(std::stod(reading));
        if (celsius > 0) {
            return celsius;
        }
    }
    return std::nullopt;
}

std::optional<int> read_temperature(const ThermalZoneSource& source) {
    std::ifstream file(source.path);
    if (!file) {
        return std::nullopt;
    }
    std::string content;
    std::getline(file, content);
    auto celsius = parse_thermal_zone(content);
    if (!celsius) {
        DebugLogger::log("thermal zone ", source.path, " is not numeric: '", content, "'");
    }
    return celsius;
}

std::optional<int> read_temperature(const SensorsSource& source) {
    auto executable = find_executable(source.command);
    if (!executable) {
        return std::nullopt;
    }
    auto output = run_command(*executable + " 2>/dev/null");
    if (!output) {
        return std::nullopt;
    }
    return parse_sensors_output(*output);
}

std::optional<int> resolve_temperature(const std::vector<TemperatureSource>& chain) {
    for (const auto& source : chain) {
        auto celsius = std::visit([](const auto& s) { return read_temperature(s); }, source);
        if (celsius) {
            return celsius;
        }
    }
    return std::nullopt;
}

std::vector<TemperatureSource> default_temperature_chain(const SourceConfig& sources) {
    return {
        ThermalZoneSource{sources.thermal_zone},
        SensorsSource{sources.sensors_command},
    };
}

std::string format_temperature(const std::optional<int>& celsius) {
    return (celsius ? std::to_string(*celsius) : std::string("N/A")) + "°C";
}

} // namespace hostmon
