#pragma once

#include "datatypes.hpp"
#include "portfolio_simulator.hpp"
#include "trade_sequence_generator.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace simulation {

    struct MonteCarloSettings {
        std::vector<double> position_sizes; // Fractions in (0, 1], distinct
        std::size_t num_trials = 0;
        std::size_t num_trades = 0;
        double win_probability = 0.0;
        double initial_capital = 0.0;
        double risk_reward_ratio = 1.0;
        std::uint64_t seed = 0;
        std::size_t workers = 1;            // 0 = one per hardware thread
        bool keep_equity_curves = false;
    };

    // --- MonteCarloRunner ---
    // Runs M trials. Each trial draws ONE trade sequence and replays that
    // same instance at every candidate size, so sizes are compared on
    // identical outcomes. Trial i draws from its own engine seeded from
    // (seed, i): results don't depend on the worker count or on the order
    // in which trials finish, and any trial can be replayed later.
    class MonteCarloRunner {
    public:
        explicit MonteCarloRunner(MonteCarloSettings settings);

        // M results per size, in trial-index order
        core::TrialResultsBySize run() const;

        // Regenerates the exact sequence trial `trial_index` consumed
        core::TradeSequence replayTradeSequence(std::size_t trial_index) const;

        const MonteCarloSettings& getSettings() const { return settings_; }
        const PortfolioSimulator& getSimulator() const { return simulator_; }

        // Independent per-trial stream derived from the run seed
        static core::RandomEngine makeTrialEngine(std::uint64_t seed, std::size_t trial_index);

        // Effective worker count for a run of num_trials (never 0, never above num_trials)
        static std::size_t resolveWorkerCount(std::size_t requested, std::size_t num_trials);

    private:
        // One worker's share: results[size_index][trial - begin]
        using TrialBlock = std::vector<std::vector<core::TrialResult>>;

        TrialBlock runTrialBlock(std::size_t begin, std::size_t end) const;

        MonteCarloSettings settings_;
        TradeSequenceGenerator generator_;
        PortfolioSimulator simulator_;
    };

} // namespace simulation
