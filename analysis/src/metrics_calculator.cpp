#include "metrics_calculator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <numeric>   // For std::accumulate

namespace analysis {

MetricsCalculator::MetricsCalculator(double initial_capital, double log_return_floor, double ruin_threshold_ratio)
    : initial_capital_(initial_capital),
      log_return_floor_(log_return_floor),
      ruin_threshold_ratio_(ruin_threshold_ratio)
{
    if (!(initial_capital_ > 0.0)) {
        throw core::SimulationException(fmt::format("Initial capital must be positive (got {}).", initial_capital_));
    }
    if (!(log_return_floor_ > 0.0)) {
        throw core::SimulationException(fmt::format("Log return floor must be positive (got {}).", log_return_floor_));
    }
    if (!(ruin_threshold_ratio_ >= 0.0 && ruin_threshold_ratio_ < 1.0)) {
        throw core::SimulationException(fmt::format("Ruin threshold ratio must be in [0, 1) (got {}).", ruin_threshold_ratio_));
    }
}

double MetricsCalculator::geometricMeanReturn(const std::vector<double>& return_ratios, double floor) {
    if (return_ratios.empty()) {
        throw core::SimulationException("Geometric mean of an empty sample is undefined.");
    }
    double log_sum = 0.0;
    for (double ratio : return_ratios) {
        log_sum += std::log(std::max(ratio, floor));
    }
    return std::exp(log_sum / static_cast<double>(return_ratios.size())) - 1.0;
}

double MetricsCalculator::median(std::vector<double> values) {
    if (values.empty()) {
        throw core::SimulationException("Median of an empty sample is undefined.");
    }
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

double MetricsCalculator::populationStdDev(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

core::SizeMetrics MetricsCalculator::calculate(double position_size,
                                               const std::vector<core::TrialResult>& trials) const
{
    if (trials.empty()) {
        throw core::SimulationException(fmt::format("No trial results for position size {}.",
                                                    core::utils::formatSizeLabel(position_size)));
    }

    const auto n = static_cast<double>(trials.size());
    std::vector<double> final_values;
    std::vector<double> return_ratios;
    final_values.reserve(trials.size());
    return_ratios.reserve(trials.size());

    double drawdown_sum = 0.0;
    double worst_drawdown = 0.0;
    std::size_t profitable = 0;
    std::size_t bankrupt = 0;
    const double ruin_level = initial_capital_ * ruin_threshold_ratio_;

    for (const auto& trial : trials) {
        final_values.push_back(trial.final_capital);
        return_ratios.push_back(trial.final_capital / initial_capital_);
        drawdown_sum += trial.max_drawdown;
        worst_drawdown = std::max(worst_drawdown, trial.max_drawdown);
        if (trial.final_capital > initial_capital_) ++profitable;
        if (trial.final_capital <= ruin_level) ++bankrupt;
    }

    core::SizeMetrics metrics;
    metrics.position_size = position_size;
    metrics.trial_count = trials.size();

    // --- Final Capital Distribution ---
    metrics.mean_final = std::accumulate(final_values.begin(), final_values.end(), 0.0) / n;
    metrics.median_final = median(final_values);
    metrics.std_final = populationStdDev(final_values, metrics.mean_final);
    auto [min_it, max_it] = std::minmax_element(final_values.begin(), final_values.end());
    metrics.min_final = *min_it;
    metrics.max_final = *max_it;

    // --- Returns ---
    metrics.geometric_mean_return_pct = geometricMeanReturn(return_ratios, log_return_floor_) * 100.0;
    metrics.mean_return_pct = (metrics.mean_final / initial_capital_ - 1.0) * 100.0;
    metrics.median_return_pct = (metrics.median_final / initial_capital_ - 1.0) * 100.0;

    // --- Risk ---
    metrics.avg_max_drawdown_pct = drawdown_sum / n * 100.0;
    metrics.worst_drawdown_pct = worst_drawdown * 100.0;
    metrics.profitable_pct = static_cast<double>(profitable) / n * 100.0;
    metrics.bankrupt_pct = static_cast<double>(bankrupt) / n * 100.0;
    metrics.risk_adjusted_score = (metrics.std_final > 0.0)
        ? (metrics.mean_final - initial_capital_) / metrics.std_final
        : 0.0;

    core::logging::getLogger()->trace("Metrics for {}: geo {:.2f}%, median {:.2f}, avg DD {:.2f}%, bankrupt {:.1f}%",
                                      core::utils::formatSizeLabel(position_size),
                                      metrics.geometric_mean_return_pct, metrics.median_final,
                                      metrics.avg_max_drawdown_pct, metrics.bankrupt_pct);
    return metrics;
}

core::MetricsBySize MetricsCalculator::calculateAll(const core::TrialResultsBySize& results) const {
    auto logger = core::logging::getLogger();
    logger->info("Calculating performance metrics for {} position sizes...", results.size());
    core::MetricsBySize metrics;
    for (const auto& [size, trials] : results) {
        metrics.emplace(size, calculate(size, trials));
    }
    return metrics;
}

} // namespace analysis
