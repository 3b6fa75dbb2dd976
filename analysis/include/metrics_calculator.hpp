#pragma once

#include "datatypes.hpp" // Provides core::TrialResult, core::SizeMetrics
#include <vector>

namespace analysis {

    // Floor applied to final/initial capital ratios before taking logs, so a
    // trial that ended at zero contributes a large finite penalty
    constexpr double kDefaultLogReturnFloor = 1e-4;

    // A trial counts as bankrupt once final capital is at or below this
    // fraction of initial capital (0 = strictly "capital <= 0")
    constexpr double kDefaultRuinThresholdRatio = 1e-6;

    // --- MetricsCalculator ---
    // Reduces all trial results of one position size to summary statistics.
    class MetricsCalculator {
    public:
        explicit MetricsCalculator(double initial_capital,
                                   double log_return_floor = kDefaultLogReturnFloor,
                                   double ruin_threshold_ratio = kDefaultRuinThresholdRatio);

        core::SizeMetrics calculate(double position_size,
                                    const std::vector<core::TrialResult>& trials) const;

        core::MetricsBySize calculateAll(const core::TrialResultsBySize& results) const;

        // exp(mean(log(max(r, floor)))) - 1, as a fraction
        static double geometricMeanReturn(const std::vector<double>& return_ratios, double floor);

        // Average of the two middle values for an even count
        static double median(std::vector<double> values);

        // Population standard deviation (divides by N)
        static double populationStdDev(const std::vector<double>& values, double mean);

    private:
        double initial_capital_;
        double log_return_floor_;
        double ruin_threshold_ratio_;
    };

} // namespace analysis
