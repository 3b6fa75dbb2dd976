#pragma once

#include "simulation_config.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace config {

    using json = nlohmann::json;

    // --- ConfigLoader ---
    // JSON <-> SimulationConfig. Keys absent from the document keep their
    // defaults. Position sizes are given in percent, either as a list
    // ("position_sizes_pct") or as an inclusive range
    // ("position_size_range_pct": {"start", "stop", "step"}).
    // Every failure surfaces as core::ConfigException naming the parameter.
    class ConfigLoader {
    public:
        static SimulationConfig fromJson(const json& document);
        static SimulationConfig fromFile(const std::string& path);

        // Percent-based document that fromJson() reads back unchanged
        static json toJson(const SimulationConfig& config);

    private:
        static double readNumber(const json& document, const std::string& key);
        static std::size_t readCount(const json& document, const std::string& key);
        static std::vector<double> readPositionSizes(const json& document);
    };

} // namespace config
