#include "monte_carlo_runner.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iterator>
#include <random>
#include <set>
#include <thread>
#include <utility>

namespace simulation {

    namespace {

        constexpr std::size_t kProgressInterval = 100;

    } // end anonymous namespace

    MonteCarloRunner::MonteCarloRunner(MonteCarloSettings settings)
        : settings_(std::move(settings)),
          generator_(settings_.num_trades, settings_.win_probability),
          simulator_(settings_.initial_capital, settings_.risk_reward_ratio)
    {
        if (settings_.num_trials == 0) {
            throw core::SimulationException("Monte Carlo run needs at least one trial.");
        }
        if (settings_.position_sizes.empty()) {
            throw core::SimulationException("Monte Carlo run needs at least one position size.");
        }
        std::set<double> unique_sizes;
        for (double size : settings_.position_sizes) {
            if (!(size > 0.0 && size <= 1.0)) {
                throw core::SimulationException(fmt::format("Position size must be in (0, 1] (got {}).", size));
            }
            if (!unique_sizes.insert(size).second) {
                throw core::SimulationException(fmt::format("Duplicate position size {}.", core::utils::formatSizeLabel(size)));
            }
        }
        core::logging::getLogger()->debug("MonteCarloRunner created: {} sizes, {} trials x {} trades, seed {}",
                                          settings_.position_sizes.size(), settings_.num_trials,
                                          settings_.num_trades, settings_.seed);
    }

    core::RandomEngine MonteCarloRunner::makeTrialEngine(std::uint64_t seed, std::size_t trial_index) {
        const auto index = static_cast<std::uint64_t>(trial_index);
        std::seed_seq seq{
            static_cast<std::uint32_t>(seed & 0xFFFFFFFFu),
            static_cast<std::uint32_t>(seed >> 32),
            static_cast<std::uint32_t>(index & 0xFFFFFFFFu),
            static_cast<std::uint32_t>(index >> 32)
        };
        return core::RandomEngine(seq);
    }

    std::size_t MonteCarloRunner::resolveWorkerCount(std::size_t requested, std::size_t num_trials) {
        std::size_t workers = requested;
        if (workers == 0) {
            workers = std::thread::hardware_concurrency();
            if (workers == 0) workers = 1; // hardware_concurrency may be unknown
        }
        return std::max<std::size_t>(1, std::min(workers, num_trials));
    }

    core::TradeSequence MonteCarloRunner::replayTradeSequence(std::size_t trial_index) const {
        if (trial_index >= settings_.num_trials) {
            throw core::SimulationException(fmt::format("Trial index {} out of range (run has {} trials).",
                                                        trial_index, settings_.num_trials));
        }
        auto engine = makeTrialEngine(settings_.seed, trial_index);
        return generator_.generate(engine);
    }

    MonteCarloRunner::TrialBlock MonteCarloRunner::runTrialBlock(std::size_t begin, std::size_t end) const {
        const auto& sizes = settings_.position_sizes;
        TrialBlock block(sizes.size());
        for (auto& per_size : block) {
            per_size.reserve(end - begin);
        }

        for (std::size_t trial = begin; trial < end; ++trial) {
            auto engine = makeTrialEngine(settings_.seed, trial);
            // Generated once, read by every size below
            const core::TradeSequence trade_outcomes = generator_.generate(engine);

            for (std::size_t s = 0; s < sizes.size(); ++s) {
                block[s].push_back(simulator_.simulate(sizes[s], trade_outcomes, settings_.keep_equity_curves));
            }
        }
        return block;
    }

    core::TrialResultsBySize MonteCarloRunner::run() const {
        auto logger = core::logging::getLogger();
        const std::size_t num_trials = settings_.num_trials;
        const std::size_t workers = resolveWorkerCount(settings_.workers, num_trials);
        logger->info("Running {} simulations across {} position sizes ({} worker(s))...",
                     num_trials, settings_.position_sizes.size(), workers);
        auto start_time = std::chrono::steady_clock::now();

        // --- Partition trials into contiguous blocks, one per worker ---
        std::atomic<std::size_t> completed_trials{0};
        std::vector<std::future<TrialBlock>> futures;
        futures.reserve(workers);
        const std::size_t base = num_trials / workers;
        const std::size_t remainder = num_trials % workers;
        std::size_t begin = 0;
        for (std::size_t w = 0; w < workers; ++w) {
            std::size_t end = begin + base + (w < remainder ? 1 : 0);
            futures.push_back(std::async(std::launch::async, [this, begin, end, num_trials, &completed_trials]() {
                TrialBlock block;
                // Run in chunks so progress can be reported while the block is running
                for (std::size_t chunk_begin = begin; chunk_begin < end; chunk_begin += kProgressInterval) {
                    std::size_t chunk_end = std::min(end, chunk_begin + kProgressInterval);
                    TrialBlock chunk = runTrialBlock(chunk_begin, chunk_end);
                    if (block.empty()) {
                        block = std::move(chunk);
                    } else {
                        for (std::size_t s = 0; s < block.size(); ++s) {
                            std::move(chunk[s].begin(), chunk[s].end(), std::back_inserter(block[s]));
                        }
                    }
                    std::size_t before = completed_trials.fetch_add(chunk_end - chunk_begin);
                    std::size_t after = before + (chunk_end - chunk_begin);
                    if (after / kProgressInterval != before / kProgressInterval) {
                        core::logging::getLogger()->debug("  Simulation {}/{}", after, num_trials);
                    }
                }
                return block;
            }));
            begin = end;
        }

        // --- Merge worker blocks in trial order ---
        core::TrialResultsBySize results;
        for (double size : settings_.position_sizes) {
            results[size].reserve(num_trials);
        }
        for (auto& future : futures) {
            TrialBlock block = future.get(); // Rethrows worker exceptions
            for (std::size_t s = 0; s < block.size(); ++s) {
                auto& target = results[settings_.position_sizes[s]];
                std::move(block[s].begin(), block[s].end(), std::back_inserter(target));
            }
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        logger->info("Completed {} simulations in {:.2f}s", num_trials, elapsed);
        return results;
    }

} // namespace simulation
