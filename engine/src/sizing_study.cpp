#include "sizing_study.hpp"
#include "monte_carlo_runner.hpp"
#include "metrics_calculator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <numeric>     // For std::iota
#include <random>
#include <stdexcept>
#include <utility>

namespace engine {

    const core::SizeMetrics& StudyResult::metricsFor(double position_size) const {
        auto it = metrics.find(position_size);
        if (it == metrics.end()) {
            throw std::out_of_range("No metrics for position size " + core::utils::formatSizeLabel(position_size));
        }
        return it->second;
    }

    SizingStudy::SizingStudy(config::SimulationConfig config)
        : config_(std::move(config))
    {
        core::logging::getLogger()->debug("SizingStudy created with {} candidate sizes.", config_.position_sizes.size());
    }

    std::size_t SizingStudy::medianOutcomeTrial(const std::vector<core::TrialResult>& trials) {
        if (trials.empty()) {
            throw core::SimulationException("Cannot pick a median trial from an empty result set.");
        }
        std::vector<std::size_t> order(trials.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&trials](std::size_t a, std::size_t b) {
            return trials[a].final_capital < trials[b].final_capital;
        });
        return order[trials.size() / 2];
    }

    StudyResult SizingStudy::run() const {
        auto logger = core::logging::getLogger();

        // Fail fast: nothing below runs on an invalid configuration
        config_.validate();

        StudyResult result;
        result.config = config_;
        result.started_at = std::chrono::system_clock::now();
        auto start_time = std::chrono::steady_clock::now();

        if (config_.seed) {
            result.seed = *config_.seed;
        } else {
            std::random_device device;
            result.seed = (static_cast<std::uint64_t>(device()) << 32) | device();
            logger->info("No seed configured; drew seed {} (set \"seed\" to repeat this run)", result.seed);
        }
        result.config.seed = result.seed;

        logger->info("========================================================");
        logger->info("Starting Position Sizing Study");
        logger->info("========================================================");
        logger->info("Win probability {:.2f}%, R:R 1:{}, {} trades x {} trials, capital {:.2f}, seed {}",
                     config_.win_probability * 100.0, config_.risk_reward_ratio, config_.num_trades,
                     config_.num_trials, config_.initial_capital, result.seed);

        // 1. Simulate
        simulation::MonteCarloSettings settings;
        settings.position_sizes = config_.position_sizes;
        settings.num_trials = config_.num_trials;
        settings.num_trades = config_.num_trades;
        settings.win_probability = config_.win_probability;
        settings.initial_capital = config_.initial_capital;
        settings.risk_reward_ratio = config_.risk_reward_ratio;
        settings.seed = result.seed;
        settings.workers = config_.workers;
        settings.keep_equity_curves = config_.keep_equity_curves;

        simulation::MonteCarloRunner runner(std::move(settings));
        result.trial_results = runner.run();

        // 2. Metrics
        analysis::MetricsCalculator calculator(config_.initial_capital, config_.log_return_floor,
                                               config_.ruin_threshold_ratio);
        result.metrics = calculator.calculateAll(result.trial_results);

        // 3. Selection
        auto selector = analysis::OptimalSelector::withDefaultCriteria(config_.selection.safe_drawdown_pct,
                                                                       config_.selection.very_safe_drawdown_pct);
        result.selection = selector.select(result.metrics);

        // 4. Representative curves, replayed from the trial's seed rather than kept in memory
        for (const auto& [size, trials] : result.trial_results) {
            std::size_t trial_index = medianOutcomeTrial(trials);
            result.representative_trials[size] = trial_index;
            const auto& kept = trials[trial_index].equity_curve;
            if (kept) {
                result.representative_curves[size] = *kept;
            } else {
                result.representative_curves[size] =
                    runner.getSimulator().equityCurve(size, runner.replayTradeSequence(trial_index));
            }
        }

        result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        if (auto best = result.selection.sizeFor(analysis::criteria::kBestGeometric)) {
            logger->info("Study finished in {:.2f}s. Optimal size (best geometric growth): {}",
                         result.elapsed_seconds, core::utils::formatSizeLabel(*best));
        }
        return result;
    }

} // namespace engine
