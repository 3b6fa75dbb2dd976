#pragma once

#include "datatypes.hpp" // Provides core::TradeSequence, core::RandomEngine
#include <cstddef>

namespace simulation {

    // --- TradeSequenceGenerator ---
    // Draws N independent win/loss outcomes, each a win with probability p.
    // The engine is passed in explicitly; identical engine state yields an
    // identical sequence, and advancing the engine is the only side effect.
    class TradeSequenceGenerator {
    public:
        // p may be 0 or 1 here; run configuration is stricter (0 < p < 1)
        TradeSequenceGenerator(std::size_t num_trades, double win_probability);

        core::TradeSequence generate(core::RandomEngine& engine) const;

        std::size_t getNumTrades() const { return num_trades_; }
        double getWinProbability() const { return win_probability_; }

    private:
        std::size_t num_trades_;
        double win_probability_;
    };

} // namespace simulation
