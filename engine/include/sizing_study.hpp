#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>

#include "datatypes.hpp"
#include "simulation_config.hpp"
#include "optimal_selector.hpp"

namespace engine {

    // --- StudyResult ---
    // Everything a run produces. Read-only input for reporting.
    struct StudyResult {
        config::SimulationConfig config;     // As run, with the seed resolved
        std::uint64_t seed = 0;

        core::TrialResultsBySize trial_results;   // Curves attached only if config.keep_equity_curves
        core::MetricsBySize metrics;
        analysis::OptimalitySelection selection;

        // Median-outcome trial per size and its replayed equity curve
        std::map<double, std::size_t> representative_trials;
        std::map<double, core::EquityCurve> representative_curves;

        std::chrono::system_clock::time_point started_at;
        double elapsed_seconds = 0.0;

        // Throws std::out_of_range for a size that wasn't simulated
        const core::SizeMetrics& metricsFor(double position_size) const;
    };

    // --- SizingStudy ---
    // Engine entry point: validate -> simulate -> metrics -> select.
    class SizingStudy {
    public:
        explicit SizingStudy(config::SimulationConfig config);

        // Throws core::ConfigException before any simulation work if the
        // configuration is invalid
        StudyResult run() const;

        const config::SimulationConfig& getConfig() const { return config_; }

        // Index of the trial whose final capital ranks at position M/2
        // (ascending, ties by trial index)
        static std::size_t medianOutcomeTrial(const std::vector<core::TrialResult>& trials);

    private:
        config::SimulationConfig config_;
    };

} // namespace engine
